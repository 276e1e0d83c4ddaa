#include "mbean/call_target.hpp"

#include "mbean/mbean_logger.hpp"

#include <utility>

namespace mbean
{
    call_target::call_target(registry_connection& _conn, object_name _name, const interface_descriptor& _interface)
        : conn_{&_conn}
        , name_{std::move(_name)}
        , interface_{&_interface}
    {
    } // ctor

    auto call_target::call(const std::string_view _operation, const nlohmann::json& _arguments) const
        -> nlohmann::json
    {
        check_call_arguments(*interface_, _operation, _arguments);

        log::proxy::trace({{"log_message", "Invoking operation."},
                           {"operation", std::string{_operation}},
                           {"object_name", name_.str()}});

        return conn_->invoke(name_, _operation, _arguments.is_null() ? nlohmann::json::array() : _arguments);
    } // call
} // namespace mbean
