#ifndef MBEAN_LOOPBACK_CONNECTOR_HPP
#define MBEAN_LOOPBACK_CONNECTOR_HPP

/// \file

#include "mbean/connector.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace mbean
{
    /// A connector provider that serves a registry living in this process.
    ///
    /// Every session authenticates against a table of logins and passwords and then
    /// forwards to the bound registry. A session refuses all use once closed.
    ///
    /// \code{.cpp}
    /// mbean::connector_factory::instance().add_provider(
    ///     "rmi", std::make_shared<mbean::loopback_connector_provider>(mbean::platform_registry(), users));
    /// \endcode
    ///
    /// \since 0.1.0
    class loopback_connector_provider : public connector_provider
    {
    public:
        /// \param[in] _registry The registry served. Must outlive the provider and its sessions.
        /// \param[in] _users    Maps each accepted login onto its password.
        loopback_connector_provider(registry_connection& _registry,
                                    std::unordered_map<std::string, std::string> _users);

        /// \throws mbean::exception AUTHENTICATION_FAILED
        auto connect(const service_url& _url, const credentials& _credentials) -> std::unique_ptr<connector> override;

    private:
        registry_connection& registry_;
        const std::unordered_map<std::string, std::string> users_;
    }; // class loopback_connector_provider
} // namespace mbean

#endif // MBEAN_LOOPBACK_CONNECTOR_HPP
