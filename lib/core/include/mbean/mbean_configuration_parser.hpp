#ifndef MBEAN_CONFIGURATION_PARSER_HPP
#define MBEAN_CONFIGURATION_PARSER_HPP

#include "mbean/mbean_error_table.h"
#include "mbean/mbean_exception.hpp"

#include <boost/any.hpp>
#include <boost/optional.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace mbean
{
    /// A string-keyed tree of configuration values.
    ///
    /// JSON objects become nested maps, arrays become vectors of boost::any, integral
    /// numbers become int (or std::int64_t / std::uint64_t when they do not fit), null
    /// becomes an empty boost::any, and the remaining scalars map onto double, bool and
    /// std::string.
    class configuration_parser
    {
    public:
        using key_path_t = std::vector<std::string>;
        using object_type = std::unordered_map<std::string, boost::any>;

        configuration_parser() = default;

        /// \throws mbean::exception CONFIGURATION_FILE_ERROR if the file cannot be loaded.
        explicit configuration_parser(const std::string& _file);

        auto clear() -> void;

        /// Merges the top-level keys of the JSON object stored in \p _file into this parser.
        ///
        /// \throws mbean::exception CONFIGURATION_FILE_ERROR if the file cannot be opened,
        ///                          is not valid JSON or does not hold a JSON object.
        auto load(const std::string& _file) -> void;

        /// Merges the top-level keys of \p _object into this parser.
        ///
        /// \throws mbean::exception INVALID_ANY_CAST if \p _object is not a JSON object.
        auto load(const nlohmann::json& _object) -> void;

        auto has_entry(const std::string& _key) const -> bool;

        /// Returns true if \p _key is absent or holds a JSON null.
        auto is_null(const std::string& _key) const -> bool;

        template <typename T>
        auto set(const std::string& _key, const T& _val) -> T&
        {
            root_[_key] = boost::any(_val);
            return boost::any_cast<T&>(root_[_key]);
        } // set

        template <typename T>
        auto set(const key_path_t& _keys, const T& _val) -> T&
        {
            if (_keys.empty()) {
                MBEAN_THROW(INVALID_ARGUMENT, "\"set\" requires at least one key");
            }

            boost::optional<boost::any&> cur_val;

            for (const auto& key : _keys) {
                if (!cur_val) {
                    cur_val.reset(root_[key]);
                    continue;
                }

                if (cur_val->empty()) {
                    *cur_val = object_type{};
                }

                try {
                    cur_val.reset(boost::any_cast<object_type&>(*cur_val)[key]);
                }
                catch (const boost::bad_any_cast&) {
                    MBEAN_THROW(INVALID_ANY_CAST, fmt::format("value at \"{}\" was not a map", key));
                }
            }

            *cur_val = _val;
            return boost::any_cast<T&>(*cur_val);
        } // set with path

        template <typename T>
        auto get(const std::string& _key) -> T&
        {
            try {
                return boost::any_cast<T&>(root_.at(_key));
            }
            catch (const boost::bad_any_cast&) {
                MBEAN_THROW(INVALID_ANY_CAST, fmt::format("value at \"{}\" was incorrect type", _key));
            }
            catch (const std::out_of_range&) {
                MBEAN_THROW(KEY_NOT_FOUND, fmt::format("key \"{}\" not found in map.", _key));
            }
        } // get

        template <typename T>
        auto get(const std::string& _key) const -> const T&
        {
            try {
                return boost::any_cast<const T&>(root_.at(_key));
            }
            catch (const boost::bad_any_cast&) {
                MBEAN_THROW(INVALID_ANY_CAST, fmt::format("value at \"{}\" was incorrect type", _key));
            }
            catch (const std::out_of_range&) {
                MBEAN_THROW(KEY_NOT_FOUND, fmt::format("key \"{}\" not found in map.", _key));
            }
        } // get

        template <typename T>
        auto get(const key_path_t& _keys) const -> const T&
        {
            if (_keys.empty()) {
                MBEAN_THROW(INVALID_ARGUMENT, "\"get\" requires at least one key");
            }

            const boost::any* cur_val = nullptr;

            for (const auto& key : _keys) {
                try {
                    if (!cur_val) {
                        cur_val = &root_.at(key);
                    }
                    else {
                        try {
                            cur_val = &boost::any_cast<const object_type&>(*cur_val).at(key);
                        }
                        catch (const boost::bad_any_cast&) {
                            MBEAN_THROW(INVALID_ANY_CAST, fmt::format("value before \"{}\" was not a map", key));
                        }
                    }
                }
                catch (const std::out_of_range&) {
                    MBEAN_THROW(KEY_NOT_FOUND, fmt::format("key \"{}\" not found in map.", key));
                }
            }

            try {
                return boost::any_cast<const T&>(*cur_val);
            }
            catch (const boost::bad_any_cast&) {
                MBEAN_THROW(INVALID_ANY_CAST, "value was incorrect type");
            }
        } // get with path

        /// Returns the value at \p _key rendered as text.
        ///
        /// Strings are returned as is. Integral, floating point and boolean values are
        /// converted, so a port may be configured as either 1099 or "1099".
        ///
        /// \throws mbean::exception KEY_NOT_FOUND or INVALID_ANY_CAST.
        auto get_string(const std::string& _key) const -> std::string;

        auto remove(const std::string& _key) -> void;

        auto map() noexcept -> object_type& { return root_; }

        auto map() const noexcept -> const object_type& { return root_; }

    private:
        static auto convert_json(const nlohmann::json& _json) -> boost::any;

        object_type root_;
    }; // class configuration_parser

    /// Maps a configuration keyword onto the environment variable that overrides it.
    auto to_env(const std::string& _key) -> std::string;
} // namespace mbean

#endif // MBEAN_CONFIGURATION_PARSER_HPP
