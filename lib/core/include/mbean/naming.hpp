#ifndef MBEAN_NAMING_HPP
#define MBEAN_NAMING_HPP

/// \file

#include "mbean/interface_descriptor.hpp"
#include "mbean/object_name.hpp"

#include <optional>
#include <string_view>

namespace mbean
{
    /// The key property injected into every object name built by \ref get_object_name.
    inline constexpr std::string_view type_key = "type";

    /// Builds the object name of the managed object implementing \p _interface.
    ///
    /// The domain is the package of \p _interface. The "type" key property is always
    /// present, holds the simple name of \p _interface and comes first.
    ///
    /// \param[in] _interface  The managed interface.
    /// \param[in] _properties Additional key properties. When a key appears more than
    ///                        once, the last value wins.
    ///
    /// \throws mbean::exception INVALID_ARGUMENT if \p _interface is null or the
    ///                          resulting name is malformed.
    ///
    /// \since 0.1.0
    auto get_object_name(const interface_descriptor* _interface,
                         const std::optional<key_property_list>& _properties = std::nullopt) -> object_name;

    /// Builds an object name carrying one key property in addition to "type".
    ///
    /// \throws mbean::exception INVALID_ARGUMENT
    ///
    /// \since 0.1.0
    auto get_object_name(const interface_descriptor* _interface,
                         const std::string_view _key,
                         const std::string_view _value) -> object_name;
} // namespace mbean

#endif // MBEAN_NAMING_HPP
