#ifndef MBEAN_ENVIRONMENT_PROPERTIES_HPP
#define MBEAN_ENVIRONMENT_PROPERTIES_HPP

#include "mbean/mbean_configuration_parser.hpp"

#include <mutex>
#include <string>

namespace mbean
{
    /// Location of the environment file relative to the user's home directory.
    inline const std::string MBEAN_JSON_ENV_FILE = "/.mbean/mbean_environment.json";

    /// Returns the path of the environment file.
    ///
    /// The value of the MBEAN_ENVIRONMENT_FILE environment variable is preferred.
    /// Otherwise, the file is looked up in $HOME.
    auto get_json_environment_file() -> std::string;

    class environment_properties
    {
    public:
        /// Access method for the singleton.
        static auto instance() -> environment_properties&;

        environment_properties(const environment_properties&) = delete;
        auto operator=(const environment_properties&) -> environment_properties& = delete;

        /// Reads the environment file and overlays the environment variables of the
        /// known keywords (e.g. MBEAN_HOST overrides mbean_host).
        ///
        /// Any previously captured values are discarded.
        auto capture() -> void;

        /// \throws mbean::exception KEY_NOT_FOUND or INVALID_ANY_CAST.
        template <typename T>
        auto get_property(const std::string& _key) const -> T
        {
            std::lock_guard lock{mutex_};
            return config_props_.get<T>(_key);
        }

        template <typename T>
        auto set_property(const std::string& _key, const T& _val) -> T
        {
            std::lock_guard lock{mutex_};
            return config_props_.set<T>(_key, _val);
        }

        auto has_property(const std::string& _key) const -> bool;

        /// \throws mbean::exception KEY_NOT_FOUND.
        auto remove(const std::string& _key) -> void;

        /// Returns a copy of the captured properties.
        auto snapshot() const -> configuration_parser;

    private:
        environment_properties();

        auto capture_json(const std::string& _file) -> void;

        auto capture_environment_variables() -> void;

        mutable std::mutex mutex_;
        configuration_parser config_props_;
    }; // class environment_properties

    template <typename T>
    auto get_environment_property(const std::string& _prop) -> T
    {
        return environment_properties::instance().get_property<T>(_prop);
    }

    template <typename T>
    auto set_environment_property(const std::string& _prop, const T& _val) -> T
    {
        return environment_properties::instance().set_property<T>(_prop, _val);
    }
} // namespace mbean

#endif // MBEAN_ENVIRONMENT_PROPERTIES_HPP
