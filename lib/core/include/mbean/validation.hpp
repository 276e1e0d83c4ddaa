#ifndef MBEAN_VALIDATION_HPP
#define MBEAN_VALIDATION_HPP

/// \file

#include "mbean/interface_descriptor.hpp"
#include "mbean/object_name.hpp"
#include "mbean/registry_connection.hpp"

namespace mbean
{
    /// Checks that \p _interface is present and follows the managed interface convention.
    ///
    /// Never touches a registry.
    ///
    /// \throws mbean::exception INVALID_ARGUMENT
    ///
    /// \since 0.1.0
    auto validate_managed_interface(const interface_descriptor* _interface) -> void;

    /// Checks that the object registered under \p _name on \p _conn implements \p _interface.
    ///
    /// The interface is checked before \p _conn is used.
    ///
    /// \throws mbean::exception INVALID_ARGUMENT if the interface is null or not a managed
    ///                          interface, or the name is not registered or not an instance
    ///                          of the interface.
    /// \throws mbean::exception OPERATION_FAILED if the registry could not answer. The
    ///                          registry's error is kept as the cause.
    ///
    /// \since 0.1.0
    auto validate_managed_object(const interface_descriptor* _interface,
                                 const object_name& _name,
                                 registry_connection& _conn) -> void;
} // namespace mbean

#endif // MBEAN_VALIDATION_HPP
