#ifndef MBEAN_CLIENT_CONNECTION_HPP
#define MBEAN_CLIENT_CONNECTION_HPP

/// \file

#include "mbean/connector.hpp"
#include "mbean/registry_connection.hpp"
#include "mbean/service_url.hpp"

#include <memory>
#include <string>

namespace mbean
{
    /// Describes how to reach and authenticate with a remote registry.
    struct endpoint
    {
        std::string host;
        int port = 0;
        std::string login;
        std::string password;
    }; // struct endpoint

    /// Returns the service URL of the registry described by \p _endpoint.
    ///
    /// \throws mbean::exception MALFORMED_SERVICE_URL
    ///
    /// \since 0.1.0
    auto make_service_url(const endpoint& _endpoint) -> service_url;

    /// Opens an authenticated session with the registry described by \p _endpoint.
    ///
    /// \throws mbean::exception CONNECT_FAILED if the registry is unreachable or the
    ///                          credentials are rejected. The transport's error is kept
    ///                          as the cause.
    ///
    /// \since 0.1.0
    auto connect(const endpoint& _endpoint) -> std::unique_ptr<connector>;

    /// Closes and destroys \p _conn.
    ///
    /// Does nothing if \p _conn is null. Errors raised while closing are logged and
    /// discarded.
    ///
    /// \since 0.1.0
    auto close(connector* _conn) noexcept -> void;

    /// A tag type that indicates whether or not a client connection
    /// should allow the user to control when the connection and
    /// authentication occurs.
    ///
    /// \since 0.1.0
    inline constexpr struct defer_connection {} defer_connection{};

    /// This move-only class provides a convenient way to connect to and
    /// disconnect from a remote registry in a safe manner.
    ///
    /// The session is closed exactly once, when the object is destroyed or
    /// \ref disconnect is called.
    ///
    /// \since 0.1.0
    class client_connection
    {
    public:
        /// Connects and authenticates using \p _endpoint.
        ///
        /// \throws mbean::exception CONNECT_FAILED
        ///
        /// \since 0.1.0
        explicit client_connection(const endpoint& _endpoint);

        /// Constructs a client connection, but does not connect to a registry.
        /// Instantiations of this class via this constructor must call \ref connect
        /// to establish a connection and authenticate the user.
        ///
        /// \since 0.1.0
        explicit client_connection(struct defer_connection);

        /// Takes ownership of an open session and provides all of the safety
        /// guarantees found in other instantiations.
        ///
        /// \since 0.1.0
        explicit client_connection(std::unique_ptr<connector> _conn);

        client_connection(client_connection&& _other) = default;
        auto operator=(client_connection&& _other) -> client_connection& = default;

        /// Closes the underlying connection if active.
        ///
        /// \since 0.1.0
        ~client_connection() = default;

        /// Connects and authenticates using \p _endpoint. Any active connection is
        /// closed first.
        ///
        /// \throws mbean::exception CONNECT_FAILED
        ///
        /// \since 0.1.0
        auto connect(const endpoint& _endpoint) -> void;

        /// Closes the underlying connection if active.
        ///
        /// \since 0.1.0
        auto disconnect() noexcept -> void;

        /// Checks whether \p *this is holding an active connection.
        ///
        /// \returns A boolean.
        /// \retval true  If the \p *this contains an active connection.
        /// \retval false Otherwise.
        ///
        /// \since 0.1.0
        operator bool() const noexcept;

        /// Returns a reference to the registry reached through the connection.
        ///
        /// \throws mbean::exception If the underlying connection is null.
        ///
        /// \since 0.1.0
        operator registry_connection&() const;

        /// Returns a pointer to the underlying connection.
        ///
        /// \since 0.1.0
        explicit operator connector*() const noexcept;

    private:
        std::unique_ptr<connector, void (*)(connector*)> conn_;
    }; // class client_connection
} // namespace mbean

#endif // MBEAN_CLIENT_CONNECTION_HPP
