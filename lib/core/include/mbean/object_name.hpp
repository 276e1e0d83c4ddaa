#ifndef MBEAN_OBJECT_NAME_HPP
#define MBEAN_OBJECT_NAME_HPP

/// \file

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mbean
{
    using key_property = std::pair<std::string, std::string>;
    using key_property_list = std::vector<key_property>;

    /// The name of a managed object.
    ///
    /// An object name consists of a domain and an ordered, non-empty list of key
    /// properties with unique keys. Its string form is:
    ///
    /// \verbatim <domain>:<key1>=<value1>,<key2>=<value2>,... \endverbatim
    ///
    /// Two object names are equal if their domains match and they carry the same
    /// set of key properties. The order of the key properties is irrelevant.
    ///
    /// \since 0.1.0
    class object_name
    {
    public:
        /// Parses an object name from its string form.
        ///
        /// \throws mbean::exception MALFORMED_OBJECT_NAME
        explicit object_name(const std::string_view _name);

        /// \throws mbean::exception MALFORMED_OBJECT_NAME
        object_name(const std::string_view _domain, const std::string_view _key, const std::string_view _value);

        /// \throws mbean::exception MALFORMED_OBJECT_NAME
        object_name(const std::string_view _domain, key_property_list _properties);

        auto domain() const noexcept -> const std::string& { return domain_; }

        /// Returns the key properties in insertion order.
        auto key_properties() const noexcept -> const key_property_list& { return properties_; }

        auto key_property(const std::string_view _key) const -> std::optional<std::string>;

        /// Returns the key properties in insertion order (e.g. "type=Thing,name=a").
        auto key_property_list_string() const -> std::string;

        /// Returns the key properties sorted lexicographically by key.
        auto canonical_key_property_list_string() const -> std::string;

        /// Returns "<domain>:" followed by the canonical key property list.
        auto canonical_name() const -> std::string;

        /// Returns "<domain>:" followed by the key properties in insertion order.
        auto str() const -> std::string;

    private:
        auto verify() const -> void;

        std::string domain_;
        key_property_list properties_;
    }; // class object_name

    auto operator==(const object_name& _lhs, const object_name& _rhs) -> bool;

    auto operator!=(const object_name& _lhs, const object_name& _rhs) -> bool;

    auto operator<<(std::ostream& _out, const object_name& _name) -> std::ostream&;
} // namespace mbean

namespace std
{
    template <>
    struct hash<mbean::object_name>
    {
        auto operator()(const mbean::object_name& _name) const noexcept -> std::size_t;
    };
} // namespace std

#endif // MBEAN_OBJECT_NAME_HPP
