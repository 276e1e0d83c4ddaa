#include "mbean/mbean_logger.hpp"

#include "mbean/mbean_configuration_keywords.hpp"
#include "mbean/mbean_environment_properties.hpp"
#include "mbean/mbean_exception.hpp"

#include <boost/any.hpp>

#include <spdlog/sinks/stdout_sinks.h>

#ifdef MBEAN_ENABLE_SYSLOG
#  include <spdlog/sinks/syslog_sink.h>
#  include <syslog.h>
#endif // MBEAN_ENABLE_SYSLOG

#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace
{
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::shared_ptr<spdlog::logger> g_log;

    template <typename Logger>
    auto load_level_from_config() noexcept -> void
    {
        Logger::set_level(mbean::log::get_level_from_config(Logger::name()));
    } // load_level_from_config
} // anonymous namespace

namespace mbean::log
{
    auto init(bool _write_to_stdout) noexcept -> void
    {
        try {
            std::vector<spdlog::sink_ptr> sinks;

#ifdef MBEAN_ENABLE_SYSLOG
            if (_write_to_stdout) {
                sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
            }
            else {
                std::string id;
                const bool enable_formatting = false;
                // NOLINTNEXTLINE(hicpp-signed-bitwise)
                sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(id, LOG_PID, LOG_LOCAL0, enable_formatting));
            }
#else
            static_cast<void>(_write_to_stdout);
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
#endif // MBEAN_ENABLE_SYSLOG

            auto log = std::make_shared<spdlog::logger>("mbean", std::begin(sinks), std::end(sinks));
            log->set_pattern("%v");
            log->set_level(spdlog::level::trace); // Filtering happens per category.

            std::atomic_store(&g_log, std::move(log));
        }
        catch (const std::exception& e) {
            spdlog::error("Could not initialize the mbean logger: {}", e.what());
        }

        load_level_from_config<configuration>();
        load_level_from_config<registry>();
        load_level_from_config<connection>();
        load_level_from_config<proxy>();
        load_level_from_config<validation>();
    } // init

    auto to_level(const std::string_view _level) noexcept -> level
    {
        // clang-format off
        static const std::unordered_map<std::string_view, level> conv_table{
            {"trace",    level::trace},
            {"debug",    level::debug},
            {"info",     level::info},
            {"warn",     level::warn},
            {"error",    level::error},
            {"critical", level::critical}
        };
        // clang-format on

        if (auto iter = conv_table.find(_level); std::end(conv_table) != iter) {
            return iter->second;
        }

        return level::info;
    } // to_level

    auto get_level_from_config(const std::string_view _category) noexcept -> level
    {
        using object_type = std::unordered_map<std::string, boost::any>;

        try {
            const auto& levels = get_environment_property<object_type>(KW_CFG_MBEAN_LOG_LEVEL);

            if (const auto iter = levels.find(std::string{_category}); iter != std::end(levels)) {
                return to_level(boost::any_cast<const std::string&>(iter->second));
            }
        }
        catch (const mbean::exception&) {
            // No log levels are configured.
        }
        catch (const boost::bad_any_cast&) {
            configuration::warn("Log level for category [{}] is not a string. Defaulting to [info].", _category);
        }

        return level::info;
    } // get_level_from_config

    namespace detail
    {
        auto get_logger() noexcept -> std::shared_ptr<spdlog::logger>
        {
            if (auto log = std::atomic_load(&g_log); log) {
                return log;
            }

            return spdlog::default_logger();
        } // get_logger

        auto utc_timestamp() -> std::string
        {
            using clock = std::chrono::system_clock;

            timeval tv{};

            if (gettimeofday(&tv, nullptr) != 0) {
                const auto now = clock::to_time_t(clock::now());

                std::tm tm{};
                gmtime_r(&now, &tm);

                std::stringstream ss;
                ss << std::put_time(&tm, "%FT%T.0");

                return ss.str();
            }

            const std::time_t now = tv.tv_sec;

            std::tm tm{};
            gmtime_r(&now, &tm);

            std::stringstream ss;
            ss << std::put_time(&tm, "%FT%T.") << std::setw(6) << std::setfill('0') << tv.tv_usec;

            return ss.str();
        } // utc_timestamp

        auto process_id() noexcept -> int
        {
            return static_cast<int>(getpid());
        } // process_id
    } // namespace detail
} // namespace mbean::log
