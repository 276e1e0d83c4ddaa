#include "mbean/managed_caller.hpp"

#include <utility>

namespace mbean
{
    auto check_call_arguments(const interface_descriptor& _interface,
                              const std::string_view _operation,
                              const nlohmann::json& _arguments) -> void
    {
        const auto* op = _interface.find_operation(_operation);

        if (!op) {
            MBEAN_THROW(INVALID_ARGUMENT,
                        fmt::format("The interface {} does not declare the operation {}.",
                                    _interface.qualified_name(),
                                    _operation));
        }

        if (!_arguments.is_null() && !_arguments.is_array()) {
            MBEAN_THROW(INVALID_ARGUMENT,
                        fmt::format("The arguments of the operation {} must be passed as an array.", _operation));
        }

        if (const auto n = _arguments.size(); n != op->arity) {
            MBEAN_THROW(INVALID_ARGUMENT,
                        fmt::format("The operation {} of the interface {} takes {} argument(s) but {} were given.",
                                    _operation,
                                    _interface.qualified_name(),
                                    op->arity,
                                    n));
        }
    } // check_call_arguments

    managed_proxy_base::managed_proxy_base(std::shared_ptr<const managed_caller> _caller)
        : caller_{std::move(_caller)}
    {
        if (!caller_) {
            MBEAN_THROW(INVALID_ARGUMENT, "A managed proxy requires a managed caller.");
        }
    } // ctor
} // namespace mbean
