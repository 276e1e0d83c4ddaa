#include "mbean/remote_proxy.hpp"

#include "mbean/call_target.hpp"
#include "mbean/mbean_configuration_keywords.hpp"
#include "mbean/mbean_environment_properties.hpp"
#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"
#include "mbean/mbean_logger.hpp"
#include "mbean/validation.hpp"

#include <boost/lexical_cast.hpp>

#include <fmt/format.h>

#include <utility>

namespace
{
    constexpr int min_port = 1;
    constexpr int max_port = 65535;

    auto get_required_string(const mbean::configuration_parser& _config, const char* _key) -> std::string
    {
        if (_config.is_null(_key)) {
            MBEAN_THROW(INVALID_ARGUMENT, fmt::format("Missing required configuration value [{}].", _key));
        }

        try {
            return _config.get_string(_key);
        }
        catch (const mbean::exception&) {
            MBEAN_THROW_NESTED(INVALID_ARGUMENT, fmt::format("Invalid configuration value for [{}].", _key));
        }
    } // get_required_string

    auto verify_endpoint(const mbean::endpoint& _endpoint) -> void
    {
        if (_endpoint.port < min_port || _endpoint.port > max_port) {
            MBEAN_THROW(INVALID_ARGUMENT, fmt::format("Port [{}] is out of range.", _endpoint.port));
        }

        try {
            static_cast<void>(mbean::make_service_url(_endpoint));
        }
        catch (const mbean::exception&) {
            MBEAN_THROW_NESTED(INVALID_ARGUMENT, fmt::format("Invalid registry host [{}].", _endpoint.host));
        }
    } // verify_endpoint
} // anonymous namespace

namespace mbean
{
    remote_proxy::remote_proxy(const interface_descriptor& _interface, object_name _name, endpoint _endpoint)
        : interface_{&_interface}
        , name_{std::move(_name)}
        , endpoint_{std::move(_endpoint)}
    {
    } // ctor

    auto remote_proxy::call(const std::string_view _operation, const nlohmann::json& _arguments) const
        -> nlohmann::json
    {
        check_call_arguments(*interface_, _operation, _arguments);

        log::proxy::debug({{"log_message", "Forwarding call."},
                           {"operation", std::string{_operation}},
                           {"object_name", name_.str()},
                           {"host", endpoint_.host}});

        client_connection conn{endpoint_};

        return call_target{conn, name_, *interface_}.call(_operation, _arguments);
    } // call

    auto make_remote_proxy(const interface_descriptor* _interface, const object_name& _name, const endpoint& _endpoint)
        -> std::shared_ptr<remote_proxy>
    {
        validate_managed_interface(_interface);
        verify_endpoint(_endpoint);

        try {
            client_connection conn{_endpoint};
            validate_managed_object(_interface, _name, conn);
        }
        catch (const mbean::exception& e) {
            if (e.code() != CONNECT_FAILED) {
                throw;
            }

            MBEAN_THROW_NESTED(OPERATION_FAILED,
                               fmt::format("Unable to reach the managed object represented by the interface {} and "
                                           "object name {} at [{}:{}].",
                                           _interface->qualified_name(),
                                           _name.canonical_name(),
                                           _endpoint.host,
                                           _endpoint.port));
        }

        log::proxy::debug({{"log_message", "Created remote proxy."},
                           {"interface", _interface->qualified_name()},
                           {"object_name", _name.str()},
                           {"host", _endpoint.host},
                           {"port", std::to_string(_endpoint.port)}});

        return std::shared_ptr<remote_proxy>(new remote_proxy{*_interface, _name, _endpoint});
    } // make_remote_proxy

    auto make_remote_proxy(const interface_descriptor* _interface,
                           const object_name& _name,
                           const configuration_parser& _config) -> std::shared_ptr<remote_proxy>
    {
        return make_remote_proxy(_interface, _name, read_endpoint(_config));
    } // make_remote_proxy

    auto make_remote_proxy(const interface_descriptor* _interface, const object_name& _name)
        -> std::shared_ptr<remote_proxy>
    {
        return make_remote_proxy(_interface, _name, environment_properties::instance().snapshot());
    } // make_remote_proxy

    auto read_endpoint(const configuration_parser& _config) -> endpoint
    {
        endpoint ep;

        ep.host = get_required_string(_config, KW_CFG_MBEAN_HOST);
        const auto port = get_required_string(_config, KW_CFG_MBEAN_PORT);
        ep.login = get_required_string(_config, KW_CFG_MBEAN_LOGIN);
        ep.password = get_required_string(_config, KW_CFG_MBEAN_PASSWORD);

        try {
            ep.port = boost::lexical_cast<int>(port);
        }
        catch (const boost::bad_lexical_cast&) {
            MBEAN_THROW(INVALID_ARGUMENT, fmt::format("Invalid configuration value for [{}]: [{}].", KW_CFG_MBEAN_PORT, port));
        }

        if (ep.port < min_port || ep.port > max_port) {
            MBEAN_THROW(INVALID_ARGUMENT,
                        fmt::format("Invalid configuration value for [{}]: [{}] is out of range.", KW_CFG_MBEAN_PORT, port));
        }

        return ep;
    } // read_endpoint
} // namespace mbean
