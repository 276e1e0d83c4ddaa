#include "mbean/connector_factory.hpp"

#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"
#include "mbean/mbean_logger.hpp"

#include <fmt/format.h>

#include <iterator>
#include <utility>

namespace mbean
{
    auto connector_factory::instance() -> connector_factory&
    {
        static connector_factory instance;
        return instance;
    } // instance

    auto connector_factory::add_provider(const std::string& _transport, std::shared_ptr<connector_provider> _provider)
        -> void
    {
        if (!_provider) {
            MBEAN_THROW(INVALID_ARGUMENT, fmt::format("Null connector provider for transport [{}].", _transport));
        }

        {
            std::lock_guard lock{mutex_};
            providers_.insert_or_assign(_transport, std::move(_provider));
        }

        log::connection::debug("Installed connector provider for transport [{}].", _transport);
    } // add_provider

    auto connector_factory::remove_provider(const std::string& _transport) -> void
    {
        std::lock_guard lock{mutex_};
        providers_.erase(_transport);
    } // remove_provider

    auto connector_factory::has_provider(const std::string& _transport) const -> bool
    {
        std::lock_guard lock{mutex_};
        return providers_.find(_transport) != std::end(providers_);
    } // has_provider

    auto connector_factory::connect(const service_url& _url, const credentials& _credentials) const
        -> std::unique_ptr<connector>
    {
        std::shared_ptr<connector_provider> provider;

        {
            std::lock_guard lock{mutex_};

            if (const auto iter = providers_.find(_url.transport()); iter != std::end(providers_)) {
                provider = iter->second;
            }
        }

        if (!provider) {
            MBEAN_THROW(CONNECTOR_PROVIDER_NOT_FOUND,
                        fmt::format("No connector provider for transport [{}] of [{}].", _url.transport(), _url.str()));
        }

        // Providers block while connecting. The table stays unlocked so that other threads can connect.
        return provider->connect(_url, _credentials);
    } // connect
} // namespace mbean
