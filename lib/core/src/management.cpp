#include "mbean/management.hpp"

#include "mbean/call_target.hpp"
#include "mbean/implementation_registry.hpp"
#include "mbean/local_registry.hpp"
#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"
#include "mbean/mbean_logger.hpp"
#include "mbean/naming.hpp"
#include "mbean/remote_proxy.hpp"
#include "mbean/validation.hpp"

#include <fmt/format.h>

#include <memory>
#include <utility>

namespace mbean
{
    auto register_managed_object(registry_connection& _registry,
                                 const interface_descriptor* _interface,
                                 const std::optional<object_name>& _name) -> object_name
    {
        if (!_interface) {
            MBEAN_THROW(INVALID_ARGUMENT, "The managed interface must not be null.");
        }

        auto name = _name ? *_name : get_object_name(_interface);

        const auto failure_message = [_interface, &name] {
            return fmt::format("Unable to register the managed object represented by the interface {} and object name {}.",
                               _interface->qualified_name(),
                               name.canonical_name());
        };

        try {
            if (_registry.is_registered(name)) {
                log::registry::debug("Managed object [{}] is already registered.", name.canonical_name());
                return name;
            }
        }
        catch (const std::exception&) {
            MBEAN_THROW_NESTED(OPERATION_FAILED, failure_message());
        }

        std::shared_ptr<managed_object> object;

        try {
            object = implementation_registry::instance().create(*_interface);
        }
        catch (const mbean::exception& e) {
            if (e.code() == INVALID_ARGUMENT) {
                throw;
            }

            MBEAN_THROW_NESTED(OPERATION_FAILED, failure_message());
        }
        catch (const std::exception&) {
            MBEAN_THROW_NESTED(OPERATION_FAILED, failure_message());
        }

        try {
            _registry.register_object(std::move(object), name);
        }
        catch (const mbean::exception& e) {
            // Registered by another thread after the check.
            if (e.code() == INSTANCE_ALREADY_EXISTS) {
                log::registry::debug("Managed object [{}] is already registered.", name.canonical_name());
                return name;
            }

            MBEAN_THROW_NESTED(OPERATION_FAILED, failure_message());
        }
        catch (const std::exception&) {
            MBEAN_THROW_NESTED(OPERATION_FAILED, failure_message());
        }

        log::registry::info({{"log_message", "Registered managed object."},
                             {"interface", _interface->qualified_name()},
                             {"object_name", name.str()}});

        return name;
    } // register_managed_object

    auto register_managed_object(const interface_descriptor* _interface, const std::optional<object_name>& _name)
        -> object_name
    {
        return register_managed_object(platform_registry(), _interface, _name);
    } // register_managed_object

    auto register_managed_object(const interface_descriptor* _interface,
                                 const std::string_view _key,
                                 const std::string_view _value) -> object_name
    {
        return register_managed_object(platform_registry(), _interface, get_object_name(_interface, _key, _value));
    } // register_managed_object

    auto register_managed_object(const interface_descriptor* _interface, const key_property_list& _properties)
        -> object_name
    {
        return register_managed_object(platform_registry(), _interface, get_object_name(_interface, _properties));
    } // register_managed_object

    auto unregister_managed_object(registry_connection& _registry, const object_name& _name) -> void
    {
        try {
            if (!_registry.is_registered(_name)) {
                log::registry::debug("Managed object [{}] is not registered.", _name.canonical_name());
                return;
            }

            _registry.unregister_object(_name);

            log::registry::info({{"log_message", "Unregistered managed object."}, {"object_name", _name.str()}});
        }
        catch (const mbean::exception& e) {
            // Unregistered by another thread after the check.
            if (e.code() == INSTANCE_NOT_FOUND) {
                log::registry::debug("Managed object [{}] is not registered.", _name.canonical_name());
                return;
            }

            MBEAN_THROW_NESTED(
                OPERATION_FAILED,
                fmt::format("Unable to unregister the managed object with the object name {}.", _name.canonical_name()));
        }
        catch (const std::exception&) {
            MBEAN_THROW_NESTED(
                OPERATION_FAILED,
                fmt::format("Unable to unregister the managed object with the object name {}.", _name.canonical_name()));
        }
    } // unregister_managed_object

    auto unregister_managed_object(const object_name& _name) -> void
    {
        unregister_managed_object(platform_registry(), _name);
    } // unregister_managed_object

    auto get_managed_object(const interface_descriptor* _interface, const std::optional<object_name>& _name)
        -> std::shared_ptr<const managed_caller>
    {
        validate_managed_interface(_interface);

        auto name = _name ? *_name : get_object_name(_interface);
        auto& registry = platform_registry();

        validate_managed_object(_interface, name, registry);

        return std::make_shared<call_target>(registry, std::move(name), *_interface);
    } // get_managed_object

    auto get_managed_object(const interface_descriptor* _interface,
                            const object_name& _name,
                            const configuration_parser& _config) -> std::shared_ptr<const managed_caller>
    {
        return make_remote_proxy(_interface, _name, _config);
    } // get_managed_object

    auto get_managed_object(const interface_descriptor* _interface, const configuration_parser& _config)
        -> std::shared_ptr<const managed_caller>
    {
        return make_remote_proxy(_interface, get_object_name(_interface), _config);
    } // get_managed_object
} // namespace mbean
