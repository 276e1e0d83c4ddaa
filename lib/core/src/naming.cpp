#include "mbean/naming.hpp"

#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <string>

namespace
{
    auto upsert(mbean::key_property_list& _properties, const std::string& _key, const std::string& _value) -> void
    {
        const auto iter = std::find_if(std::begin(_properties), std::end(_properties), [&_key](const auto& _p) {
            return _p.first == _key;
        });

        if (iter != std::end(_properties)) {
            iter->second = _value;
            return;
        }

        _properties.emplace_back(_key, _value);
    } // upsert
} // anonymous namespace

namespace mbean
{
    auto get_object_name(const interface_descriptor* _interface,
                         const std::optional<key_property_list>& _properties) -> object_name
    {
        if (!_interface) {
            MBEAN_THROW(INVALID_ARGUMENT, "The managed interface must not be null.");
        }

        key_property_list properties{{std::string{type_key}, _interface->simple_name()}};

        if (_properties) {
            for (auto&& [k, v] : *_properties) {
                if (k != type_key) {
                    upsert(properties, k, v);
                }
            }
        }

        try {
            return object_name{_interface->package_name(), std::move(properties)};
        }
        catch (const mbean::exception&) {
            MBEAN_THROW_NESTED(
                INVALID_ARGUMENT,
                fmt::format("Unable to create the object name for the interface {}.", _interface->qualified_name()));
        }
    } // get_object_name

    auto get_object_name(const interface_descriptor* _interface,
                         const std::string_view _key,
                         const std::string_view _value) -> object_name
    {
        return get_object_name(_interface, key_property_list{{std::string{_key}, std::string{_value}}});
    } // get_object_name
} // namespace mbean
