#ifndef MBEAN_MANAGEMENT_HPP
#define MBEAN_MANAGEMENT_HPP

/// \file

#include "mbean/interface_descriptor.hpp"
#include "mbean/managed_caller.hpp"
#include "mbean/mbean_configuration_parser.hpp"
#include "mbean/object_name.hpp"
#include "mbean/registry_connection.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace mbean
{
    /// Registers the implementation of \p _interface with \p _registry.
    ///
    /// When \p _name is not provided, it is derived from \p _interface (see
    /// \ref get_object_name). Does nothing if an object is already registered under
    /// the name. Otherwise, the single implementation found in the
    /// \ref implementation_registry is instantiated and registered.
    ///
    /// \throws mbean::exception INVALID_ARGUMENT if \p _interface is null or zero or
    ///                          several implementations exist.
    /// \throws mbean::exception OPERATION_FAILED if the registry reports an error.
    ///
    /// \return The name under which the object is registered.
    ///
    /// \since 0.1.0
    auto register_managed_object(registry_connection& _registry,
                                 const interface_descriptor* _interface,
                                 const std::optional<object_name>& _name = std::nullopt) -> object_name;

    /// Registers the implementation of \p _interface with the platform registry.
    ///
    /// \since 0.1.0
    auto register_managed_object(const interface_descriptor* _interface,
                                 const std::optional<object_name>& _name = std::nullopt) -> object_name;

    /// Registers the implementation of \p _interface under a name carrying one
    /// key property in addition to "type".
    ///
    /// \since 0.1.0
    auto register_managed_object(const interface_descriptor* _interface,
                                 const std::string_view _key,
                                 const std::string_view _value) -> object_name;

    /// Registers the implementation of \p _interface under a name carrying
    /// \p _properties in addition to "type".
    ///
    /// \since 0.1.0
    auto register_managed_object(const interface_descriptor* _interface, const key_property_list& _properties)
        -> object_name;

    /// Removes the object registered under \p _name from \p _registry.
    ///
    /// Does nothing if no object is registered under \p _name.
    ///
    /// \throws mbean::exception OPERATION_FAILED if the registry reports an error.
    ///
    /// \since 0.1.0
    auto unregister_managed_object(registry_connection& _registry, const object_name& _name) -> void;

    /// Removes the object registered under \p _name from the platform registry.
    ///
    /// \since 0.1.0
    auto unregister_managed_object(const object_name& _name) -> void;

    /// Returns a caller for the object registered with the platform registry.
    ///
    /// The object is validated before this function returns.
    ///
    /// \throws mbean::exception INVALID_ARGUMENT or OPERATION_FAILED (see \ref validate_managed_object).
    ///
    /// \since 0.1.0
    auto get_managed_object(const interface_descriptor* _interface,
                            const std::optional<object_name>& _name = std::nullopt)
        -> std::shared_ptr<const managed_caller>;

    /// Returns a caller for the object registered with the remote registry described
    /// by \p _config (see \ref make_remote_proxy).
    ///
    /// \since 0.1.0
    auto get_managed_object(const interface_descriptor* _interface,
                            const object_name& _name,
                            const configuration_parser& _config) -> std::shared_ptr<const managed_caller>;

    /// Returns a caller for the object registered with the remote registry described
    /// by \p _config under the name derived from \p _interface.
    ///
    /// \since 0.1.0
    auto get_managed_object(const interface_descriptor* _interface, const configuration_parser& _config)
        -> std::shared_ptr<const managed_caller>;
} // namespace mbean

#endif // MBEAN_MANAGEMENT_HPP
