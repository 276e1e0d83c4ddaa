#include "mbean/validation.hpp"

#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"
#include "mbean/mbean_logger.hpp"

#include <fmt/format.h>

#include <string>

namespace mbean
{
    auto validate_managed_interface(const interface_descriptor* _interface) -> void
    {
        if (!_interface) {
            MBEAN_THROW(INVALID_ARGUMENT, "The managed interface must not be null.");
        }

        if (!is_managed_interface(*_interface)) {
            MBEAN_THROW(INVALID_ARGUMENT,
                        fmt::format("The interface {} is not a managed interface.", _interface->qualified_name()));
        }
    } // validate_managed_interface

    auto validate_managed_object(const interface_descriptor* _interface,
                                 const object_name& _name,
                                 registry_connection& _conn) -> void
    {
        validate_managed_interface(_interface);

        const auto& interface_name = _interface->qualified_name();
        const auto name = _name.canonical_name();

        log::validation::trace({{"log_message", "Validating managed object."},
                                {"interface", interface_name},
                                {"object_name", name}});

        const auto registry_failure = [&interface_name, &name](const std::string& _error) {
            log::validation::error({{"log_message", "Registry failed during validation."},
                                    {"interface", interface_name},
                                    {"object_name", name},
                                    {"error", _error}});

            return fmt::format("Unable to validate the managed object represented by the interface {} and object name {}.",
                               interface_name,
                               name);
        };

        bool registered = false;

        try {
            registered = _conn.is_registered(_name);
        }
        catch (const mbean::exception& e) {
            MBEAN_THROW_NESTED(OPERATION_FAILED, registry_failure(e.client_display_what()));
        }
        catch (const std::exception& e) {
            MBEAN_THROW_NESTED(OPERATION_FAILED, registry_failure(e.what()));
        }

        if (!registered) {
            log::validation::debug({{"log_message", "Object name is not registered."}, {"object_name", name}});
            MBEAN_THROW(INVALID_ARGUMENT, fmt::format("The object name {} is not registered.", name));
        }

        bool instance_of = false;

        try {
            instance_of = _conn.is_instance_of(_name, interface_name);
        }
        catch (const mbean::exception& e) {
            // Unregistered after the previous check.
            if (e.code() == INSTANCE_NOT_FOUND) {
                MBEAN_THROW_NESTED(INVALID_ARGUMENT, fmt::format("The object name {} is not found.", name));
            }

            MBEAN_THROW_NESTED(OPERATION_FAILED, registry_failure(e.client_display_what()));
        }
        catch (const std::exception& e) {
            MBEAN_THROW_NESTED(OPERATION_FAILED, registry_failure(e.what()));
        }

        if (!instance_of) {
            log::validation::debug({{"log_message", "Object is not an instance of the interface."},
                                    {"interface", interface_name},
                                    {"object_name", name}});

            MBEAN_THROW(INVALID_ARGUMENT,
                        fmt::format("The object name {} is not an instance of the interface {}.", name, interface_name));
        }
    } // validate_managed_object
} // namespace mbean
