// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "rangedl/core/logging.hpp"
#include "rangedl/util/environment.hpp"
#include "rangedl/util/string.hpp"

namespace rangedl
{
    namespace
    {
        constexpr std::array<log_source, 2> all_log_sources = { log_source::librangedl,
                                                                log_source::libcurl };

        auto to_spdlog(log_level level) -> spdlog::level::level_enum
        {
            static_assert(static_cast<int>(log_level::off) == static_cast<int>(spdlog::level::off));
            return static_cast<spdlog::level::level_enum>(level);
        }
    }

    auto name_of(log_level level) noexcept -> const char*
    {
        switch (level)
        {
            case log_level::trace:
                return "trace";
            case log_level::debug:
                return "debug";
            case log_level::info:
                return "info";
            case log_level::warn:
                return "warning";
            case log_level::err:
                return "error";
            case log_level::critical:
                return "critical";
            case log_level::off:
            default:
                return "off";
        }
    }

    auto parse_log_level(std::string_view name) -> std::optional<log_level>
    {
        const std::string lname = util::to_lower(util::strip(name));
        for (auto level : { log_level::trace,
                            log_level::debug,
                            log_level::info,
                            log_level::warn,
                            log_level::err,
                            log_level::critical,
                            log_level::off })
        {
            if (lname == name_of(level))
            {
                return level;
            }
        }
        if (lname == "warn")
        {
            return log_level::warn;
        }
        return std::nullopt;
    }

    auto name_of(log_source source) noexcept -> const char*
    {
        switch (source)
        {
            case log_source::libcurl:
                return "libcurl";
            case log_source::librangedl:
            default:
                return "librangedl";
        }
    }

    namespace logging
    {
        namespace
        {
            struct LoggingData
            {
                std::mutex mutex;
                std::array<std::shared_ptr<spdlog::logger>, all_log_sources.size()> loggers;
                log_level level = log_level::warn;
                bool initialized = false;
            };

            LoggingData& logging_data()
            {
                static LoggingData data;
                return data;
            }

            auto make_logger(log_source source, const std::string& pattern)
                -> std::shared_ptr<spdlog::logger>
            {
                auto logger = std::make_shared<spdlog::logger>(
                    name_of(source),
                    std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
                );
                logger->set_pattern(pattern);
                return logger;
            }

            // Must be called with the logging mutex held.
            void init_impl(LoggingData& data, LoggingParams params)
            {
                if (auto env_level = util::get_env("RANGEDL_LOG_LEVEL"); env_level.has_value())
                {
                    if (auto level = parse_log_level(env_level.value()); level.has_value())
                    {
                        params.logging_level = level.value();
                    }
                }

                for (auto source : all_log_sources)
                {
                    auto logger = make_logger(source, params.log_pattern);
                    logger->set_level(to_spdlog(params.logging_level));
                    spdlog::drop(name_of(source));
                    spdlog::register_logger(logger);
                    data.loggers[static_cast<std::size_t>(source)] = std::move(logger);
                }
                data.level = params.logging_level;
                data.initialized = true;
            }
        }

        void init(LoggingParams params)
        {
            auto& data = logging_data();
            std::lock_guard<std::mutex> lock(data.mutex);
            init_impl(data, std::move(params));
        }

        void set_log_level(log_level level)
        {
            auto& data = logging_data();
            std::lock_guard<std::mutex> lock(data.mutex);
            if (!data.initialized)
            {
                init_impl(data, {});
            }
            for (auto& logger : data.loggers)
            {
                logger->set_level(to_spdlog(level));
            }
            data.level = level;
        }

        auto get_log_level() -> log_level
        {
            auto& data = logging_data();
            std::lock_guard<std::mutex> lock(data.mutex);
            if (!data.initialized)
            {
                init_impl(data, {});
            }
            return data.level;
        }

        auto get_logger(log_source source) -> std::shared_ptr<spdlog::logger>
        {
            auto& data = logging_data();
            std::lock_guard<std::mutex> lock(data.mutex);
            if (!data.initialized)
            {
                init_impl(data, {});
            }
            return data.loggers[static_cast<std::size_t>(source)];
        }

        auto hide_secrets(std::string_view str) -> std::string
        {
            std::string res(str);
            std::size_t scheme_end = res.find("://");
            while (scheme_end != std::string::npos)
            {
                const std::size_t authority_start = scheme_end + 3;
                const std::size_t authority_end = res.find_first_of("/ \t\n", authority_start);
                const std::size_t at = res.rfind('@', authority_end == std::string::npos
                                                          ? std::string::npos
                                                          : authority_end);
                if (at != std::string::npos && at > authority_start)
                {
                    const std::size_t colon = res.find(':', authority_start);
                    if (colon != std::string::npos && colon < at)
                    {
                        res.replace(colon + 1, at - colon - 1, "*****");
                    }
                }
                scheme_end = res.find("://", authority_start);
            }
            return res;
        }

        MessageLogger::MessageLogger(log_level level)
            : m_level(level)
            , m_stream()
        {
        }

        MessageLogger::~MessageLogger()
        {
            emit(m_stream.str(), m_level);
        }

        void MessageLogger::emit(const std::string& msg, log_level level)
        {
            if (level == log_level::off)
            {
                return;
            }
            if (auto logger = get_logger(log_source::librangedl))
            {
                logger->log(to_spdlog(level), hide_secrets(msg));
            }
        }
    }
}
