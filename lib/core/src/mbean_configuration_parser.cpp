#include "mbean/mbean_configuration_parser.hpp"

#include "mbean/mbean_logger.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace mbean
{
    configuration_parser::configuration_parser(const std::string& _file)
    {
        load(_file);
    } // ctor

    auto configuration_parser::clear() -> void
    {
        root_.clear();
    } // clear

    auto configuration_parser::has_entry(const std::string& _key) const -> bool
    {
        return root_.count(_key) != 0;
    } // has_entry

    auto configuration_parser::is_null(const std::string& _key) const -> bool
    {
        const auto iter = root_.find(_key);
        return iter == std::end(root_) || iter->second.empty();
    } // is_null

    auto configuration_parser::load(const std::string& _file) -> void
    {
        if (_file.empty()) {
            MBEAN_THROW(CONFIGURATION_FILE_ERROR, "file is empty");
        }

        json config;

        {
            std::ifstream in{_file};

            if (!in) {
                MBEAN_THROW(CONFIGURATION_FILE_ERROR, fmt::format("failed to open file [{}]", _file));
            }

            try {
                in >> config;
            }
            catch (const json::parse_error& e) {
                MBEAN_THROW(CONFIGURATION_FILE_ERROR,
                            fmt::format("failed to parse json [file={}, error={}].", _file, e.what()));
            }
        }

        try {
            load(config);
        }
        catch (const mbean::exception&) {
            MBEAN_THROW_NESTED(CONFIGURATION_FILE_ERROR,
                               fmt::format("configuration file [{}] did not contain a json object.", _file));
        }

        log::configuration::debug("Loaded configuration file [{}].", _file);
    } // load

    auto configuration_parser::load(const json& _object) -> void
    {
        if (!_object.is_object()) {
            MBEAN_THROW(INVALID_ANY_CAST, "configuration is not a json object.");
        }

        const auto json_object_any = convert_json(_object);
        const auto& json_object = boost::any_cast<const object_type&>(json_object_any);

        for (auto&& [key, value] : json_object) {
            root_[key] = value;
        }
    } // load

    auto configuration_parser::get_string(const std::string& _key) const -> std::string
    {
        const auto iter = root_.find(_key);

        if (iter == std::end(root_)) {
            MBEAN_THROW(KEY_NOT_FOUND, fmt::format("key \"{}\" not found in map.", _key));
        }

        const auto& value = iter->second;

        if (const auto* s = boost::any_cast<std::string>(&value); s) {
            return *s;
        }

        if (const auto* i = boost::any_cast<int>(&value); i) {
            return std::to_string(*i);
        }

        if (const auto* i = boost::any_cast<std::int64_t>(&value); i) {
            return std::to_string(*i);
        }

        if (const auto* u = boost::any_cast<std::uint64_t>(&value); u) {
            return std::to_string(*u);
        }

        if (const auto* d = boost::any_cast<double>(&value); d) {
            return boost::lexical_cast<std::string>(*d);
        }

        if (const auto* b = boost::any_cast<bool>(&value); b) {
            return *b ? "true" : "false";
        }

        if (value.empty()) {
            MBEAN_THROW(INVALID_ANY_CAST, fmt::format("value at \"{}\" is null", _key));
        }

        MBEAN_THROW(INVALID_ANY_CAST, fmt::format("value at \"{}\" cannot be represented as a string", _key));
    } // get_string

    auto configuration_parser::convert_json(const json& _json) -> boost::any
    {
        switch (_json.type()) {
            case json::value_t::string:
                return _json.get<std::string>();

            case json::value_t::number_float:
                return _json.get<double>();

            case json::value_t::number_integer: {
                const auto value = _json.get<std::int64_t>();

                if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
                    return value;
                }

                return static_cast<int>(value);
            }

            case json::value_t::number_unsigned: {
                const auto value = _json.get<std::uint64_t>();

                if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                    return value;
                }

                return static_cast<int>(value);
            }

            case json::value_t::boolean:
                return _json.get<bool>();

            case json::value_t::array: {
                std::vector<boost::any> array;

                for (auto&& jj : _json) {
                    array.push_back(convert_json(jj));
                }

                return array;
            }

            case json::value_t::object: {
                object_type object;

                for (auto&& [k, v] : _json.items()) {
                    object.insert({k, convert_json(v)});
                }

                return object;
            }

            case json::value_t::null:
                return {};

            default:
                const auto type = static_cast<std::uint8_t>(_json.type());
                MBEAN_THROW(INVALID_ANY_CAST, fmt::format("unhandled type in json_typeof: {}", type));
        }
    } // convert_json

    auto configuration_parser::remove(const std::string& _key) -> void
    {
        if (!root_.erase(_key)) {
            MBEAN_THROW(KEY_NOT_FOUND, fmt::format("key \"{}\" not found in map.", _key));
        }
    } // remove

    auto to_env(const std::string& _key) -> std::string
    {
        return boost::to_upper_copy<std::string>(_key);
    } // to_env
} // namespace mbean
