#include "mbean/implementation_registry.hpp"

#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"
#include "mbean/mbean_logger.hpp"

#include <fmt/format.h>

#include <iterator>
#include <utility>

namespace mbean
{
    auto implementation_registry::instance() -> implementation_registry&
    {
        static implementation_registry instance;
        return instance;
    } // instance

    auto implementation_registry::add(const interface_descriptor& _interface, factory_type _factory) -> void
    {
        if (!_factory) {
            MBEAN_THROW(INVALID_ARGUMENT,
                        fmt::format("Empty factory for managed interface [{}].", _interface.qualified_name()));
        }

        std::lock_guard lock{mutex_};
        factories_[_interface.qualified_name()].push_back(std::move(_factory));
    } // add

    auto implementation_registry::remove_all(const interface_descriptor& _interface) -> void
    {
        std::lock_guard lock{mutex_};
        factories_.erase(_interface.qualified_name());
    } // remove_all

    auto implementation_registry::count(const interface_descriptor& _interface) const -> std::size_t
    {
        std::lock_guard lock{mutex_};

        if (const auto iter = factories_.find(_interface.qualified_name()); iter != std::end(factories_)) {
            return iter->second.size();
        }

        return 0;
    } // count

    auto implementation_registry::create(const interface_descriptor& _interface) const
        -> std::shared_ptr<managed_object>
    {
        factory_type factory;

        {
            std::lock_guard lock{mutex_};

            const auto iter = factories_.find(_interface.qualified_name());
            const auto n = (iter != std::end(factories_)) ? iter->second.size() : 0;

            if (n == 0) {
                MBEAN_THROW(INVALID_ARGUMENT,
                            fmt::format("No managed object implementation found for {}.", _interface.qualified_name()));
            }

            if (n > 1) {
                MBEAN_THROW(INVALID_ARGUMENT,
                            fmt::format("More than one managed object implementation found for {}.",
                                        _interface.qualified_name()));
            }

            factory = iter->second.front();
        }

        // The factory runs outside of the lock so that it may register other implementations.
        auto object = factory();

        if (!object) {
            MBEAN_THROW(INVALID_ARGUMENT,
                        fmt::format("The factory for {} returned a null managed object.", _interface.qualified_name()));
        }

        log::registry::trace("Created managed object implementing [{}].", _interface.qualified_name());

        return object;
    } // create
} // namespace mbean
