#ifndef MBEAN_MANAGED_CALLER_HPP
#define MBEAN_MANAGED_CALLER_HPP

/// \file

#include "mbean/interface_descriptor.hpp"
#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"
#include "mbean/object_name.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>

namespace mbean
{
    /// The client side of a managed object.
    ///
    /// Every operation of the managed interface is reached through \ref call.
    ///
    /// \since 0.1.0
    class managed_caller
    {
    public:
        virtual ~managed_caller() = default;

        /// Invokes \p _operation on the managed object.
        ///
        /// \param[in] _operation The name of an operation declared by the managed interface.
        /// \param[in] _arguments A JSON array holding one element per argument. Null is
        ///                       treated as an empty array.
        ///
        /// \throws mbean::exception INVALID_ARGUMENT if the interface does not declare
        ///                          \p _operation or the argument count does not match.
        ///
        /// \return The result of the operation.
        virtual auto call(const std::string_view _operation, const nlohmann::json& _arguments) const
            -> nlohmann::json = 0;

        virtual auto managed_interface() const noexcept -> const interface_descriptor& = 0;

        virtual auto name() const noexcept -> const object_name& = 0;
    }; // class managed_caller

    /// Checks \p _operation and \p _arguments against the operations declared by \p _interface.
    ///
    /// \throws mbean::exception INVALID_ARGUMENT
    auto check_call_arguments(const interface_descriptor& _interface,
                              const std::string_view _operation,
                              const nlohmann::json& _arguments) -> void;

    /// The base class of typed wrappers around a managed caller.
    ///
    /// \code{.cpp}
    /// class counter_proxy : public mbean::managed_proxy_base
    /// {
    /// public:
    ///     using managed_proxy_base::managed_proxy_base;
    ///
    ///     auto add(int _n) const -> int { return forward<int>("add", _n); }
    /// };
    /// \endcode
    ///
    /// \since 0.1.0
    class managed_proxy_base
    {
    public:
        /// \throws mbean::exception INVALID_ARGUMENT if \p _caller is null.
        explicit managed_proxy_base(std::shared_ptr<const managed_caller> _caller);

        auto caller() const noexcept -> const managed_caller& { return *caller_; }

    protected:
        /// Calls \p _operation with \p _args converted to JSON and converts the result to \p R.
        ///
        /// \throws mbean::exception INVALID_ANY_CAST if the result cannot be converted to \p R.
        template <typename R = void, typename... Args>
        auto forward(const std::string_view _operation, Args&&... _args) const -> R
        {
            auto arguments = nlohmann::json::array({nlohmann::json(std::forward<Args>(_args))...});

            if constexpr (std::is_void_v<R>) {
                caller_->call(_operation, arguments);
            }
            else {
                const auto result = caller_->call(_operation, arguments);

                try {
                    return result.template get<R>();
                }
                catch (const nlohmann::json::exception&) {
                    MBEAN_THROW_NESTED(INVALID_ANY_CAST,
                                       fmt::format("Unexpected result type for operation [{}] of [{}].",
                                                   _operation,
                                                   caller_->name().str()));
                }
            }
        }

    private:
        std::shared_ptr<const managed_caller> caller_;
    }; // class managed_proxy_base
} // namespace mbean

#endif // MBEAN_MANAGED_CALLER_HPP
