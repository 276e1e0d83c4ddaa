#ifndef MBEAN_REMOTE_PROXY_HPP
#define MBEAN_REMOTE_PROXY_HPP

/// \file

#include "mbean/client_connection.hpp"
#include "mbean/managed_caller.hpp"
#include "mbean/mbean_configuration_parser.hpp"

#include <memory>

namespace mbean
{
    /// Represents a managed object registered with a remote registry.
    ///
    /// The proxy holds no connection. Every call connects to the registry, invokes
    /// the operation and closes the connection again before returning. The object
    /// is validated once, when the proxy is created, and not on each call.
    ///
    /// Instances are immutable. Concurrent calls are independent of each other.
    ///
    /// \since 0.1.0
    class remote_proxy : public managed_caller
    {
    public:
        /// \throws mbean::exception INVALID_ARGUMENT if the operation is not declared or
        ///                          the argument count does not match. No connection is made.
        /// \throws mbean::exception CONNECT_FAILED if the registry cannot be reached.
        ///
        /// Errors raised by the remote operation propagate unchanged.
        auto call(const std::string_view _operation, const nlohmann::json& _arguments) const
            -> nlohmann::json override;

        auto managed_interface() const noexcept -> const interface_descriptor& override { return *interface_; }

        auto name() const noexcept -> const object_name& override { return name_; }

        auto host() const noexcept -> const std::string& { return endpoint_.host; }

        auto port() const noexcept -> int { return endpoint_.port; }

    private:
        remote_proxy(const interface_descriptor& _interface, object_name _name, endpoint _endpoint);

        friend auto make_remote_proxy(const interface_descriptor*, const object_name&, const endpoint&)
            -> std::shared_ptr<remote_proxy>;

        const interface_descriptor* interface_;
        const object_name name_;
        const endpoint endpoint_;
    }; // class remote_proxy

    /// Creates a proxy for the object registered under \p _name at \p _endpoint.
    ///
    /// The interface is checked first. A connection is then opened, the object is
    /// validated and the connection is closed.
    ///
    /// \throws mbean::exception INVALID_ARGUMENT if the interface is null or not a managed
    ///                          interface, the endpoint is invalid, or validation rejects
    ///                          the object.
    /// \throws mbean::exception OPERATION_FAILED if the registry cannot be reached or
    ///                          cannot answer.
    ///
    /// \since 0.1.0
    auto make_remote_proxy(const interface_descriptor* _interface, const object_name& _name, const endpoint& _endpoint)
        -> std::shared_ptr<remote_proxy>;

    /// Creates a proxy using the endpoint held by \p _config.
    ///
    /// The keys mbean_host, mbean_port, mbean_login and mbean_password are required.
    ///
    /// \throws mbean::exception INVALID_ARGUMENT naming the key if a value is missing or
    ///                          invalid. No connection is made.
    ///
    /// \since 0.1.0
    auto make_remote_proxy(const interface_descriptor* _interface,
                           const object_name& _name,
                           const configuration_parser& _config) -> std::shared_ptr<remote_proxy>;

    /// Creates a proxy using the endpoint held by the environment properties.
    ///
    /// \since 0.1.0
    auto make_remote_proxy(const interface_descriptor* _interface, const object_name& _name)
        -> std::shared_ptr<remote_proxy>;

    /// Reads the endpoint held by \p _config.
    ///
    /// \throws mbean::exception INVALID_ARGUMENT naming the key if a value is missing or invalid.
    ///
    /// \since 0.1.0
    auto read_endpoint(const configuration_parser& _config) -> endpoint;
} // namespace mbean

#endif // MBEAN_REMOTE_PROXY_HPP
