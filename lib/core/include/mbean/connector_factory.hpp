#ifndef MBEAN_CONNECTOR_FACTORY_HPP
#define MBEAN_CONNECTOR_FACTORY_HPP

/// \file

#include "mbean/connector.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mbean
{
    /// The process-wide table of connector providers, keyed by transport name.
    ///
    /// \since 0.1.0
    class connector_factory
    {
    public:
        static auto instance() -> connector_factory&;

        connector_factory(const connector_factory&) = delete;
        auto operator=(const connector_factory&) -> connector_factory& = delete;

        /// Installs \p _provider for \p _transport, replacing any existing provider.
        ///
        /// \throws mbean::exception INVALID_ARGUMENT if \p _provider is null.
        auto add_provider(const std::string& _transport, std::shared_ptr<connector_provider> _provider) -> void;

        auto remove_provider(const std::string& _transport) -> void;

        auto has_provider(const std::string& _transport) const -> bool;

        /// Opens a session with the registry at \p _url.
        ///
        /// \throws mbean::exception CONNECTOR_PROVIDER_NOT_FOUND if no provider serves the
        ///                          transport of \p _url. Errors raised by the provider
        ///                          propagate unchanged.
        auto connect(const service_url& _url, const credentials& _credentials) const -> std::unique_ptr<connector>;

    private:
        connector_factory() = default;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<connector_provider>> providers_;
    }; // class connector_factory
} // namespace mbean

#endif // MBEAN_CONNECTOR_FACTORY_HPP
