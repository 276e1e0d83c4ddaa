#ifndef MBEAN_CONNECTOR_HPP
#define MBEAN_CONNECTOR_HPP

/// \file

#include "mbean/registry_connection.hpp"
#include "mbean/service_url.hpp"

#include <memory>
#include <string>

namespace mbean
{
    struct credentials
    {
        std::string login;
        std::string password;
    }; // struct credentials

    /// An open, authenticated session with a registry.
    ///
    /// \since 0.1.0
    class connector
    {
    public:
        virtual ~connector() = default;

        /// Returns the registry reached through this session.
        ///
        /// \throws mbean::exception TRANSPORT_ERROR if the session is closed.
        virtual auto connection() -> registry_connection& = 0;

        /// Ends the session.
        ///
        /// \throws mbean::exception TRANSPORT_ERROR
        virtual auto close() -> void = 0;
    }; // class connector

    /// Opens sessions for one transport (e.g. "rmi").
    ///
    /// \since 0.1.0
    class connector_provider
    {
    public:
        virtual ~connector_provider() = default;

        /// \throws mbean::exception CONNECT_FAILED, AUTHENTICATION_FAILED or TRANSPORT_ERROR.
        virtual auto connect(const service_url& _url, const credentials& _credentials)
            -> std::unique_ptr<connector> = 0;
    }; // class connector_provider
} // namespace mbean

#endif // MBEAN_CONNECTOR_HPP
