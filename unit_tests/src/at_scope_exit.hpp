#ifndef UNIT_TESTS_AT_SCOPE_EXIT_HPP
#define UNIT_TESTS_AT_SCOPE_EXIT_HPP

#include <utility>

namespace unit_test_utils
{
    /// Invokes a callable when the enclosing scope is exited.
    ///
    /// \code{.cpp}
    /// unit_test_utils::at_scope_exit restore{[] { mbean::connector_factory::instance().remove_provider("rmi"); }};
    /// \endcode
    template <typename Function>
    class at_scope_exit
    {
    public:
        explicit at_scope_exit(Function&& _func)
            : func_{std::forward<Function>(_func)}
        {
        }

        at_scope_exit(const at_scope_exit&) = delete;
        auto operator=(const at_scope_exit&) -> at_scope_exit& = delete;

        ~at_scope_exit() { func_(); }

    private:
        Function func_;
    }; // class at_scope_exit

    template <typename Function>
    at_scope_exit(Function&&) -> at_scope_exit<Function>;
} // namespace unit_test_utils

#endif // UNIT_TESTS_AT_SCOPE_EXIT_HPP
