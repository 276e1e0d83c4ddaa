#include "mbean/client_connection.hpp"

#include "mbean/connector_factory.hpp"
#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"
#include "mbean/mbean_logger.hpp"

#include <fmt/format.h>

#include <utility>

namespace mbean
{
    auto make_service_url(const endpoint& _endpoint) -> service_url
    {
        return make_registry_service_url(_endpoint.host, _endpoint.port);
    } // make_service_url

    auto connect(const endpoint& _endpoint) -> std::unique_ptr<connector>
    {
        auto address = fmt::format("{}:{}", _endpoint.host, _endpoint.port);

        try {
            const auto url = make_service_url(_endpoint);
            address = url.str();

            auto conn = connector_factory::instance().connect(url, {_endpoint.login, _endpoint.password});

            if (!conn) {
                MBEAN_THROW(TRANSPORT_ERROR, "Connector provider returned a null connection.");
            }

            log::connection::debug({{"log_message", "Connected."}, {"url", address}, {"login", _endpoint.login}});

            return conn;
        }
        catch (const std::exception& e) {
            log::connection::error({{"log_message", "Could not connect."},
                                    {"url", address},
                                    {"login", _endpoint.login},
                                    {"error", e.what()}});

            MBEAN_THROW_NESTED(CONNECT_FAILED, fmt::format("Could not connect to [{}] as [{}].", address, _endpoint.login));
        }
    } // connect

    auto close(connector* _conn) noexcept -> void
    {
        if (!_conn) {
            return;
        }

        try {
            _conn->close();
            log::connection::debug("Connection closed.");
        }
        catch (const mbean::exception& e) {
            log::connection::warn({{"log_message", "Error while closing connection."},
                                   {"error", e.client_display_what()}});
        }
        catch (const std::exception& e) {
            log::connection::warn({{"log_message", "Error while closing connection."}, {"error", e.what()}});
        }
        catch (...) {
            log::connection::warn("Unknown error while closing connection.");
        }

        delete _conn; // NOLINT(cppcoreguidelines-owning-memory)
    } // close

    client_connection::client_connection(const endpoint& _endpoint)
        : conn_{nullptr, mbean::close}
    {
        connect(_endpoint);
    } // constructor

    client_connection::client_connection(struct defer_connection) // NOLINT(readability-named-parameter)
        : conn_{nullptr, mbean::close}
    {
    } // constructor

    client_connection::client_connection(std::unique_ptr<connector> _conn)
        : conn_{_conn.release(), mbean::close}
    {
    } // constructor

    auto client_connection::connect(const endpoint& _endpoint) -> void
    {
        conn_.reset();
        conn_.reset(mbean::connect(_endpoint).release());
    } // connect

    auto client_connection::disconnect() noexcept -> void
    {
        conn_.reset();
    } // disconnect

    client_connection::operator bool() const noexcept
    {
        return static_cast<bool>(conn_);
    } // operator bool

    client_connection::operator registry_connection&() const
    {
        if (!conn_) {
            MBEAN_THROW(TRANSPORT_ERROR, "Invalid client_connection object");
        }

        return conn_->connection();
    } // operator registry_connection&

    client_connection::operator connector*() const noexcept
    {
        return conn_.get();
    } // operator connector*
} // namespace mbean
