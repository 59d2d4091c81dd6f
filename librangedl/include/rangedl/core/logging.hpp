// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_CORE_LOGGING_HPP
#define RANGEDL_CORE_LOGGING_HPP

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace spdlog
{
    class logger;
}

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   rangedl::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(rangedl::log_level::trace)
#define LOG_DEBUG       LOG(rangedl::log_level::debug)
#define LOG_INFO        LOG(rangedl::log_level::info)
#define LOG_WARNING     LOG(rangedl::log_level::warn)
#define LOG_ERROR       LOG(rangedl::log_level::err)
#define LOG_CRITICAL    LOG(rangedl::log_level::critical)
// clang-format on

namespace rangedl
{
    /** Level of logging, used to filter out logs which are at a lower level than the current one.
        Values match `spdlog::level::level_enum`.
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    /// @returns The name of the specified log level.
    [[nodiscard]] auto name_of(log_level level) noexcept -> const char*;

    /// @returns The log level named @p name ("warning" and "warn" are both accepted).
    [[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<log_level>;

    /** Specifies the source a log record is originating from.
     */
    enum class log_source
    {
        librangedl,
        libcurl,
    };

    [[nodiscard]] auto name_of(log_source source) noexcept -> const char*;

    namespace logging
    {
        struct LoggingParams
        {
            /// Minimum level a log record must have to not be filtered out.
            log_level logging_level = log_level::warn;

            /// Formatting pattern passed to spdlog.
            std::string log_pattern = "%^%-9!l%-8n%$ %v";
        };

        /**
         * Create (or recreate) the loggers of every log source.
         *
         * The level in @p params is overridden by the `RANGEDL_LOG_LEVEL`
         * environment variable when it is set to a valid level name.
         */
        void init(LoggingParams params = {});

        void set_log_level(log_level level);
        [[nodiscard]] auto get_log_level() -> log_level;

        /// @returns The logger of @p source, creating all loggers with default params if needed.
        [[nodiscard]] auto get_logger(log_source source) -> std::shared_ptr<spdlog::logger>;

        /// Masks the password of `user:password@host` URL userinfo.
        [[nodiscard]] auto hide_secrets(std::string_view str) -> std::string;

        class MessageLogger
        {
        public:

            explicit MessageLogger(log_level level);
            ~MessageLogger();

            MessageLogger(const MessageLogger&) = delete;
            MessageLogger& operator=(const MessageLogger&) = delete;

            std::stringstream& stream()
            {
                return m_stream;
            }

        private:

            log_level m_level;
            std::stringstream m_stream;

            static void emit(const std::string& msg, log_level level);
        };
    }
}

#endif
