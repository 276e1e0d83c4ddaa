#ifndef MBEAN_SERVICE_URL_HPP
#define MBEAN_SERVICE_URL_HPP

/// \file

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace mbean
{
    /// The address of a remote registry.
    ///
    /// \verbatim service:<protocol>:<transport>://<host>[:<port>][<url-path>] \endverbatim
    ///
    /// IPv6 hosts are enclosed in brackets (e.g. "[::1]").
    ///
    /// \since 0.1.0
    class service_url
    {
    public:
        /// \throws mbean::exception MALFORMED_SERVICE_URL
        explicit service_url(const std::string_view _url);

        auto protocol() const noexcept -> const std::string& { return protocol_; }

        /// Names the connector provider used to reach the registry.
        auto transport() const noexcept -> const std::string& { return transport_; }

        auto host() const noexcept -> const std::string& { return host_; }

        auto port() const noexcept -> std::optional<int> { return port_; }

        auto url_path() const noexcept -> const std::string& { return url_path_; }

        auto str() const -> std::string;

    private:
        std::string protocol_;
        std::string transport_;
        std::string host_;
        std::optional<int> port_;
        std::string url_path_;
    }; // class service_url

    auto operator<<(std::ostream& _out, const service_url& _url) -> std::ostream&;

    /// Returns the URL of the registry served at \p _host and \p _port.
    ///
    /// \verbatim service:jmx:rmi://<host>:<port>/jndi/rmi://<host>:<port>/jmxrmi \endverbatim
    ///
    /// \throws mbean::exception MALFORMED_SERVICE_URL if the host or port is invalid.
    ///
    /// \since 0.1.0
    auto make_registry_service_url(const std::string_view _host, const int _port) -> service_url;
} // namespace mbean

#endif // MBEAN_SERVICE_URL_HPP
