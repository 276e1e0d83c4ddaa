#include "mbean/service_url.hpp"

#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"

#include <boost/lexical_cast.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace
{
    constexpr std::string_view scheme = "service:";
    constexpr std::string_view authority_prefix = "//";

    constexpr int max_port = 65535;

    constexpr std::string_view illegal_host_chars = "/[]@?# \t\r\n";

    auto is_token(const std::string_view _s) noexcept -> bool
    {
        return !_s.empty() && std::all_of(std::begin(_s), std::end(_s), [](unsigned char _c) {
            return std::isalnum(_c) || _c == '+' || _c == '-' || _c == '.';
        });
    } // is_token

    auto format_host(const std::string& _host) -> std::string
    {
        if (_host.find(':') != std::string::npos) {
            return fmt::format("[{}]", _host);
        }

        return _host;
    } // format_host
} // anonymous namespace

namespace mbean
{
    service_url::service_url(const std::string_view _url)
    {
        const auto malformed = [_url](const std::string_view _reason) {
            MBEAN_THROW(MALFORMED_SERVICE_URL, fmt::format("Malformed service URL [{}]: {}", _url, _reason));
        };

        if (_url.substr(0, scheme.size()) != scheme) {
            malformed("missing 'service:' scheme");
        }

        auto rest = _url.substr(scheme.size());

        auto pos = rest.find(':');
        if (pos == std::string_view::npos) {
            malformed("missing protocol");
        }

        protocol_ = rest.substr(0, pos);
        rest.remove_prefix(pos + 1);

        pos = rest.find(':');
        if (pos == std::string_view::npos) {
            malformed("missing transport");
        }

        transport_ = rest.substr(0, pos);
        rest.remove_prefix(pos + 1);

        if (!is_token(protocol_) || !is_token(transport_)) {
            malformed("invalid protocol or transport");
        }

        if (rest.substr(0, authority_prefix.size()) != authority_prefix) {
            malformed("missing '//'");
        }

        rest.remove_prefix(authority_prefix.size());

        if (!rest.empty() && rest.front() == '[') {
            const auto close = rest.find(']');

            if (close == std::string_view::npos) {
                malformed("unterminated IPv6 address");
            }

            host_ = rest.substr(1, close - 1);
            rest.remove_prefix(close + 1);
        }
        else {
            pos = rest.find_first_of(":/");
            host_ = rest.substr(0, pos);
            rest.remove_prefix(pos == std::string_view::npos ? rest.size() : pos);
        }

        if (host_.empty()) {
            malformed("missing host");
        }

        if (!rest.empty() && rest.front() == ':') {
            rest.remove_prefix(1);

            pos = rest.find('/');
            const auto port_string = rest.substr(0, pos);

            try {
                const auto port = boost::lexical_cast<int>(port_string);

                if (port < 0 || port > max_port) {
                    malformed("port out of range");
                }

                port_ = port;
            }
            catch (const boost::bad_lexical_cast&) {
                malformed("invalid port");
            }

            rest.remove_prefix(pos == std::string_view::npos ? rest.size() : pos);
        }

        if (!rest.empty() && rest.front() != '/') {
            malformed("invalid URL path");
        }

        url_path_ = rest;
    } // ctor

    auto service_url::str() const -> std::string
    {
        if (port_) {
            return fmt::format("service:{}:{}://{}:{}{}", protocol_, transport_, format_host(host_), *port_, url_path_);
        }

        return fmt::format("service:{}:{}://{}{}", protocol_, transport_, format_host(host_), url_path_);
    } // str

    auto operator<<(std::ostream& _out, const service_url& _url) -> std::ostream&
    {
        return _out << _url.str();
    } // operator<<

    auto make_registry_service_url(const std::string_view _host, const int _port) -> service_url
    {
        if (_host.find_first_of(illegal_host_chars) != std::string_view::npos) {
            MBEAN_THROW(MALFORMED_SERVICE_URL, fmt::format("Host [{}] contains an illegal character.", _host));
        }

        const auto authority = fmt::format("{}:{}", format_host(std::string{_host}), _port);
        service_url url{fmt::format("service:jmx:rmi://{}/jndi/rmi://{}/jmxrmi", authority, authority)};

        // The host and port must parse back unchanged.
        if (url.host() != _host || url.port() != _port) {
            MBEAN_THROW(MALFORMED_SERVICE_URL,
                        fmt::format("Host [{}] and port [{}] do not form a valid service URL.", _host, _port));
        }

        return url;
    } // make_registry_service_url
} // namespace mbean
