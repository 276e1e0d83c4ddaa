#include "mbean/object_name.hpp"

#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <new>
#include <iterator>

namespace
{
    // clang-format off
    constexpr std::string_view illegal_domain_chars = ":*?\n";
    constexpr std::string_view illegal_key_chars    = ":,=*?\"\n";
    constexpr std::string_view illegal_value_chars  = ":,=*?\"\n";
    // clang-format on

    auto contains_any_of(const std::string_view _s, const std::string_view _chars) noexcept -> bool
    {
        return _s.find_first_of(_chars) != std::string_view::npos;
    } // contains_any_of

    auto join(const mbean::key_property_list& _properties) -> std::string
    {
        std::string s;

        for (auto&& [k, v] : _properties) {
            if (!s.empty()) {
                s += ',';
            }

            s += k;
            s += '=';
            s += v;
        }

        return s;
    } // join

    auto sorted(mbean::key_property_list _properties) -> mbean::key_property_list
    {
        std::sort(std::begin(_properties), std::end(_properties), [](const auto& _lhs, const auto& _rhs) {
            return _lhs.first < _rhs.first;
        });

        return _properties;
    } // sorted

    auto parse_key_property(const std::string_view _name, const std::string_view _kvp) -> mbean::key_property
    {
        const auto eq = _kvp.find('=');

        if (eq == std::string_view::npos) {
            MBEAN_THROW(MALFORMED_OBJECT_NAME,
                        fmt::format("Key property [{}] of object name [{}] is missing '='.", _kvp, _name));
        }

        return {std::string{_kvp.substr(0, eq)}, std::string{_kvp.substr(eq + 1)}};
    } // parse_key_property
} // anonymous namespace

namespace mbean
{
    object_name::object_name(const std::string_view _name)
    {
        const auto colon = _name.find(':');

        if (colon == std::string_view::npos) {
            MBEAN_THROW(MALFORMED_OBJECT_NAME, fmt::format("Object name [{}] has no domain separator.", _name));
        }

        domain_ = _name.substr(0, colon);

        auto rest = _name.substr(colon + 1);

        while (!rest.empty()) {
            const auto comma = rest.find(',');
            properties_.push_back(parse_key_property(_name, rest.substr(0, comma)));

            if (comma == std::string_view::npos) {
                break;
            }

            rest.remove_prefix(comma + 1);

            if (rest.empty()) {
                MBEAN_THROW(MALFORMED_OBJECT_NAME, fmt::format("Object name [{}] ends with ','.", _name));
            }
        }

        verify();
    } // ctor

    object_name::object_name(const std::string_view _domain,
                             const std::string_view _key,
                             const std::string_view _value)
        : domain_{_domain}
        , properties_{{std::string{_key}, std::string{_value}}}
    {
        verify();
    } // ctor

    object_name::object_name(const std::string_view _domain, key_property_list _properties)
        : domain_{_domain}
        , properties_{std::move(_properties)}
    {
        verify();
    } // ctor

    auto object_name::key_property(const std::string_view _key) const -> std::optional<std::string>
    {
        const auto iter = std::find_if(std::begin(properties_), std::end(properties_), [_key](const auto& _p) {
            return _p.first == _key;
        });

        if (iter == std::end(properties_)) {
            return std::nullopt;
        }

        return iter->second;
    } // key_property

    auto object_name::key_property_list_string() const -> std::string
    {
        return join(properties_);
    } // key_property_list_string

    auto object_name::canonical_key_property_list_string() const -> std::string
    {
        return join(sorted(properties_));
    } // canonical_key_property_list_string

    auto object_name::canonical_name() const -> std::string
    {
        return fmt::format("{}:{}", domain_, canonical_key_property_list_string());
    } // canonical_name

    auto object_name::str() const -> std::string
    {
        return fmt::format("{}:{}", domain_, key_property_list_string());
    } // str

    auto object_name::verify() const -> void
    {
        if (contains_any_of(domain_, illegal_domain_chars)) {
            MBEAN_THROW(MALFORMED_OBJECT_NAME, fmt::format("Domain [{}] contains an illegal character.", domain_));
        }

        if (properties_.empty()) {
            MBEAN_THROW(MALFORMED_OBJECT_NAME,
                        fmt::format("Object name with domain [{}] has no key properties.", domain_));
        }

        for (auto iter = std::begin(properties_); iter != std::end(properties_); ++iter) {
            const auto& [key, value] = *iter;

            if (key.empty()) {
                MBEAN_THROW(MALFORMED_OBJECT_NAME, fmt::format("Empty key in object name [{}].", str()));
            }

            if (contains_any_of(key, illegal_key_chars)) {
                MBEAN_THROW(MALFORMED_OBJECT_NAME, fmt::format("Key [{}] contains an illegal character.", key));
            }

            if (contains_any_of(value, illegal_value_chars)) {
                MBEAN_THROW(MALFORMED_OBJECT_NAME,
                            fmt::format("Value [{}] of key [{}] contains an illegal character.", value, key));
            }

            const auto duplicate = std::find_if(std::next(iter), std::end(properties_), [&key](const auto& _p) {
                return _p.first == key;
            });

            if (duplicate != std::end(properties_)) {
                MBEAN_THROW(MALFORMED_OBJECT_NAME, fmt::format("Key [{}] appears more than once.", key));
            }
        }
    } // verify

    auto operator==(const object_name& _lhs, const object_name& _rhs) -> bool
    {
        return _lhs.domain() == _rhs.domain() &&
               _lhs.canonical_key_property_list_string() == _rhs.canonical_key_property_list_string();
    } // operator==

    auto operator!=(const object_name& _lhs, const object_name& _rhs) -> bool
    {
        return !(_lhs == _rhs);
    } // operator!=

    auto operator<<(std::ostream& _out, const object_name& _name) -> std::ostream&
    {
        return _out << _name.str();
    } // operator<<
} // namespace mbean

namespace std
{
    auto hash<mbean::object_name>::operator()(const mbean::object_name& _name) const noexcept -> std::size_t
    {
        // Equal names always share a domain, so the fallback remains consistent with operator==.
        try {
            return hash<string>{}(_name.canonical_name());
        }
        catch (const std::bad_alloc&) {
            return hash<string>{}(_name.domain());
        }
    } // operator()
} // namespace std
