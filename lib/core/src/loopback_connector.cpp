#include "mbean/loopback_connector.hpp"

#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"
#include "mbean/mbean_logger.hpp"

#include <fmt/format.h>

#include <iterator>
#include <utility>

namespace
{
    // Forwards to the served registry until the session is closed.
    class loopback_session : public mbean::registry_connection
    {
    public:
        explicit loopback_session(mbean::registry_connection& _registry)
            : registry_{&_registry}
        {
        }

        auto close() noexcept -> void { registry_ = nullptr; }

        auto is_open() const noexcept -> bool { return registry_ != nullptr; }

        auto is_registered(const mbean::object_name& _name) -> bool override
        {
            return registry().is_registered(_name);
        }

        auto is_instance_of(const mbean::object_name& _name, const std::string_view _interface_name) -> bool override
        {
            return registry().is_instance_of(_name, _interface_name);
        }

        auto register_object(std::shared_ptr<mbean::managed_object> _object, const mbean::object_name& _name)
            -> mbean::object_instance override
        {
            return registry().register_object(std::move(_object), _name);
        }

        auto unregister_object(const mbean::object_name& _name) -> void override
        {
            registry().unregister_object(_name);
        }

        auto query_all() -> std::set<mbean::object_instance> override
        {
            return registry().query_all();
        }

        auto invoke(const mbean::object_name& _name, const std::string_view _operation, const nlohmann::json& _arguments)
            -> nlohmann::json override
        {
            return registry().invoke(_name, _operation, _arguments);
        }

    private:
        auto registry() const -> mbean::registry_connection&
        {
            if (!registry_) {
                MBEAN_THROW(TRANSPORT_ERROR, "The loopback session is closed.");
            }

            return *registry_;
        }

        mbean::registry_connection* registry_;
    }; // class loopback_session

    class loopback_connector : public mbean::connector
    {
    public:
        explicit loopback_connector(mbean::registry_connection& _registry)
            : session_{_registry}
        {
        }

        auto connection() -> mbean::registry_connection& override
        {
            if (!session_.is_open()) {
                MBEAN_THROW(TRANSPORT_ERROR, "The loopback session is closed.");
            }

            return session_;
        }

        auto close() -> void override
        {
            if (!session_.is_open()) {
                MBEAN_THROW(TRANSPORT_ERROR, "The loopback session is already closed.");
            }

            session_.close();
        }

    private:
        loopback_session session_;
    }; // class loopback_connector
} // anonymous namespace

namespace mbean
{
    loopback_connector_provider::loopback_connector_provider(registry_connection& _registry,
                                                             std::unordered_map<std::string, std::string> _users)
        : registry_{_registry}
        , users_{std::move(_users)}
    {
    } // ctor

    auto loopback_connector_provider::connect(const service_url& _url, const credentials& _credentials)
        -> std::unique_ptr<connector>
    {
        const auto iter = users_.find(_credentials.login);

        if (iter == std::end(users_) || iter->second != _credentials.password) {
            log::connection::warn({{"log_message", "Authentication failed."},
                                   {"url", _url.str()},
                                   {"login", _credentials.login}});

            MBEAN_THROW(AUTHENTICATION_FAILED,
                        fmt::format("Authentication failed for [{}] at [{}].", _credentials.login, _url.str()));
        }

        log::connection::trace({{"log_message", "Opened loopback session."},
                                {"url", _url.str()},
                                {"login", _credentials.login}});

        return std::make_unique<loopback_connector>(registry_);
    } // connect
} // namespace mbean
