#ifndef MBEAN_LOGGER_HPP
#define MBEAN_LOGGER_HPP

/// \file

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace mbean::log
{
    enum class level : std::uint8_t
    {
        trace,
        debug,
        info,
        warn,
        error,
        critical
    }; // enum class level

    using key_value = std::pair<const std::string, std::string>;

    namespace category
    {
        struct configuration;
        struct registry;
        struct connection;
        struct proxy;
        struct validation;
    } // namespace category

    template <typename Category>
    class logger_config;

    template <typename Category>
    class logger;

    // clang-format off
    using configuration = logger<category::configuration>;
    using registry      = logger<category::registry>;
    using connection    = logger<category::connection>;
    using proxy         = logger<category::proxy>;
    using validation    = logger<category::validation>;
    // clang-format on

    /// Installs the sinks used by every category and loads the per-category levels
    /// from the environment properties.
    ///
    /// When not called, records are written through spdlog's default logger.
    ///
    /// \param[in] _write_to_stdout Write to stdout instead of syslog. Has no effect
    ///                             unless the library is built with MBEAN_ENABLE_SYSLOG.
    auto init(bool _write_to_stdout = true) noexcept -> void;

    auto to_level(const std::string_view _level) noexcept -> level;

    auto get_level_from_config(const std::string_view _category) noexcept -> level;

    namespace detail
    {
        auto get_logger() noexcept -> std::shared_ptr<spdlog::logger>;

        auto utc_timestamp() -> std::string;

        auto process_id() noexcept -> int;
    } // namespace detail

    template <typename Category>
    class logger
    {
    public:
        template <level Level>
        class impl;

        logger() = delete;

        logger(const logger&) = delete;
        auto operator=(const logger&) -> logger& = delete;

        static auto set_level(level _level) noexcept -> void
        {
            logger_config<Category>::level = _level;
        }

        static auto get_level() noexcept -> level
        {
            return logger_config<Category>::level;
        }

        static constexpr auto name() noexcept -> const char*
        {
            return logger_config<Category>::name;
        }

        // clang-format off
        inline static const auto trace    = impl<level::trace>{};
        inline static const auto debug    = impl<level::debug>{};
        inline static const auto info     = impl<level::info>{};
        inline static const auto warn     = impl<level::warn>{};
        inline static const auto error    = impl<level::error>{};
        inline static const auto critical = impl<level::critical>{};
        // clang-format on
    }; // class logger

    //
    // Logger Configuration
    //

    template <>
    class logger_config<category::configuration>
    {
        static constexpr const char* name = "configuration";
        inline static log::level level = log::level::info;

        friend class logger<category::configuration>;
    };

    template <>
    class logger_config<category::registry>
    {
        static constexpr const char* name = "registry";
        inline static log::level level = log::level::info;

        friend class logger<category::registry>;
    };

    template <>
    class logger_config<category::connection>
    {
        static constexpr const char* name = "connection";
        inline static log::level level = log::level::info;

        friend class logger<category::connection>;
    };

    template <>
    class logger_config<category::proxy>
    {
        static constexpr const char* name = "proxy";
        inline static log::level level = log::level::info;

        friend class logger<category::proxy>;
    };

    template <>
    class logger_config<category::validation>
    {
        static constexpr const char* name = "validation";
        inline static log::level level = log::level::info;

        friend class logger<category::validation>;
    };

    //
    // Logger
    //

    template <typename Category>
    template <level Level>
    class logger<Category>::impl
    {
    public:
        constexpr impl() = default;

        impl(const impl&) = delete;
        auto operator=(const impl&) -> impl& = delete;

        auto operator()(const std::string& _msg) const noexcept -> void
        {
            write({{tag::message, _msg}});
        }

        auto operator()(std::initializer_list<key_value> _list) const noexcept -> void
        {
            write(std::begin(_list), std::end(_list));
        }

        template <typename Arg, typename... Args>
        auto operator()(fmt::format_string<Arg, Args...> _format, Arg&& _arg, Args&&... _args) const noexcept
            -> void
        {
            if (!should_log()) {
                return;
            }

            try {
                write({{tag::message, fmt::format(_format, std::forward<Arg>(_arg), std::forward<Args>(_args)...)}});
            }
            catch (const std::exception&) {
                // fmt::format only throws on allocation failure here. Nothing left to report with.
            }
        }

    private:
        struct tag
        {
            // clang-format off
            inline static const char* const category  = "log_category";
            inline static const char* const level     = "log_level";
            inline static const char* const message   = "log_message";
            inline static const char* const pid       = "server_pid";
            inline static const char* const timestamp = "server_timestamp";
            // clang-format on
        };

        static auto should_log() noexcept -> bool
        {
            return Level >= logger_config<Category>::level;
        }

        static constexpr auto log_level_as_string() noexcept -> const char*
        {
            // clang-format off
            if constexpr (Level == level::trace)    { return "trace"; }
            if constexpr (Level == level::debug)    { return "debug"; }
            if constexpr (Level == level::info)     { return "info"; }
            if constexpr (Level == level::warn)     { return "warn"; }
            if constexpr (Level == level::error)    { return "error"; }
            if constexpr (Level == level::critical) { return "critical"; }
            // clang-format on

            return "?";
        }

        static constexpr auto to_spdlog_level() noexcept -> spdlog::level::level_enum
        {
            // clang-format off
            if constexpr (Level == level::trace)    { return spdlog::level::trace; }
            if constexpr (Level == level::debug)    { return spdlog::level::debug; }
            if constexpr (Level == level::info)     { return spdlog::level::info; }
            if constexpr (Level == level::warn)     { return spdlog::level::warn; }
            if constexpr (Level == level::error)    { return spdlog::level::err; }
            // clang-format on

            return spdlog::level::critical;
        }

        auto write(std::initializer_list<key_value> _list) const noexcept -> void
        {
            write(std::begin(_list), std::end(_list));
        }

        template <typename ForwardIt>
        auto write(ForwardIt _first, ForwardIt _last) const noexcept -> void
        {
            if (!should_log()) {
                return;
            }

            auto log = detail::get_logger();

            if (!log) {
                return;
            }

            try {
                log->log(to_spdlog_level(), to_json_string(_first, _last));
            }
            catch (const std::exception&) {
                // Logging must never raise. A record that cannot be rendered is dropped.
            }
        }

        template <typename ForwardIt>
        auto to_json_string(ForwardIt _first, ForwardIt _last) const -> std::string
        {
            nlohmann::json object;

            for (; _first != _last; ++_first) {
                object[_first->first] = _first->second;
            }

            object[tag::category] = logger_config<Category>::name;
            object[tag::level] = log_level_as_string();
            object[tag::pid] = detail::process_id();
            object[tag::timestamp] = detail::utc_timestamp();

            return object.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
    }; // class impl
} // namespace mbean::log

#endif // MBEAN_LOGGER_HPP
