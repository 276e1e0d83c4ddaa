#include "mbean/mbean_environment_properties.hpp"

#include "mbean/mbean_configuration_keywords.hpp"
#include "mbean/mbean_logger.hpp"

#include <boost/filesystem.hpp>

#include <cstdlib>
#include <string>

namespace fs = boost::filesystem;

namespace mbean
{
    auto get_json_environment_file() -> std::string
    {
        const auto env_var = to_env(KW_CFG_MBEAN_ENVIRONMENT_FILE);

        if (const char* mbean_env = std::getenv(env_var.c_str()); mbean_env && *mbean_env) {
            return mbean_env;
        }

        std::string json_file;

        // If HOME is not set, the file is looked up relative to the working directory.
        if (const char* home_dir = std::getenv("HOME"); home_dir) {
            json_file = home_dir;
        }

        json_file += MBEAN_JSON_ENV_FILE;

        return json_file;
    } // get_json_environment_file

    auto environment_properties::instance() -> environment_properties&
    {
        static environment_properties instance;
        return instance;
    } // instance

    environment_properties::environment_properties()
    {
        capture();
    } // ctor

    auto environment_properties::capture() -> void
    {
        std::lock_guard lock{mutex_};

        config_props_.clear();

        if (const auto json_file = get_json_environment_file(); fs::exists(json_file)) {
            try {
                capture_json(json_file);
                config_props_.set<std::string>(KW_CFG_MBEAN_ENVIRONMENT_FILE, json_file);
            }
            catch (const mbean::exception& e) {
                log::configuration::error(
                    {{"log_message", "Could not load the environment file."}, {"file", json_file}, {"error", e.client_display_what()}});
            }
        }

        capture_environment_variables();
    } // capture

    auto environment_properties::capture_json(const std::string& _file) -> void
    {
        config_props_.load(_file);
    } // capture_json

    auto environment_properties::capture_environment_variables() -> void
    {
        for (const auto* key : {KW_CFG_MBEAN_HOST, KW_CFG_MBEAN_PORT, KW_CFG_MBEAN_LOGIN, KW_CFG_MBEAN_PASSWORD}) {
            const auto env_var = to_env(key);

            if (const char* value = std::getenv(env_var.c_str()); value) {
                config_props_.set<std::string>(key, value);
                log::configuration::debug("Environment variable [{}] overrides [{}].", env_var, key);
            }
        }
    } // capture_environment_variables

    auto environment_properties::has_property(const std::string& _key) const -> bool
    {
        std::lock_guard lock{mutex_};
        return config_props_.has_entry(_key);
    } // has_property

    auto environment_properties::remove(const std::string& _key) -> void
    {
        std::lock_guard lock{mutex_};
        config_props_.remove(_key);
    } // remove

    auto environment_properties::snapshot() const -> configuration_parser
    {
        std::lock_guard lock{mutex_};
        return config_props_;
    } // snapshot
} // namespace mbean
