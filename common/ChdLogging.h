/*
 * Copyright (c) 2025, NVIDIA CORPORATION.  All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <chd_structs.h>
#include <plog/Record.h>
#define PLOG_CAPTURE_FILE

#include <plog/Init.h>
#include <plog/Log.h>

#include <fmt/core.h>
#include <fmt/format.h>
#include <source_location>
#include <type_traits>

#include <string>

#define CHD_LOGGING_SEVERITY_OPTIONS "NONE, FATAL, ERROR, WARN, INFO, DEBUG, VERB"

#define CHD_LOGGING_SEVERITY_STRING_VERBOSE "VERB"
#define CHD_LOGGING_SEVERITY_STRING_DEBUG   "DEBUG"
#define CHD_LOGGING_SEVERITY_STRING_INFO    "INFO"
#define CHD_LOGGING_SEVERITY_STRING_WARNING "WARN"
#define CHD_LOGGING_SEVERITY_STRING_ERROR   "ERROR"
#define CHD_LOGGING_SEVERITY_STRING_FATAL   "FATAL"
#define CHD_LOGGING_SEVERITY_STRING_NONE    "NONE"

#define CHD_LOGGING_DEFAULT_CHDIAG_SEVERITY CHD_LOGGING_SEVERITY_STRING_WARNING
#define CHD_LOGGING_DEFAULT_CHDIAG_FILE     "./chdiag.log"
#define CHD_LOGGING_ENV_PREFIX              "CHD_LOG"

#define CHD_LOGGING_CONSTANT_HYPHEN  "-"
#define MAX_SEVERITY_STRING_LENGTH   6

#define CHD_LOGGING_LOGGER_STRING_BASE    "BASE"
#define CHD_LOGGING_LOGGER_STRING_CONSOLE "CONSOLE"
#define CHD_LOGGING_LOGGER_STRING_FILE    "FILE"

enum loggerCategory_t
{
    BASE_LOGGER = 0, // Default logger. You are probably looking to use this
    CONSOLE_LOGGER,
    FILE_LOGGER,
};

#define CHD_LOG_VERBOSE_TO(logger) PLOG_(logger, plog::verbose)
#define CHD_LOG_DEBUG_TO(logger)   PLOG_(logger, plog::debug)
#define CHD_LOG_INFO_TO(logger)    PLOG_(logger, plog::info)
#define CHD_LOG_WARNING_TO(logger) PLOG_(logger, plog::warning)
#define CHD_LOG_ERROR_TO(logger)   PLOG_(logger, plog::error)
#define CHD_LOG_FATAL_TO(logger)   PLOG_(logger, plog::fatal)

#define CHD_LOG_DEBUG PLOG_(BASE_LOGGER, plog::debug)
#define CHD_LOG_ERROR PLOG_(BASE_LOGGER, plog::error)

namespace details
{

/**
 * Like fmt::format_string, but also captures the source location of the caller.
 * The format string is still checked at compile time.
 */
template <class... TArgs>
struct basic_format_string
{
    fmt::format_string<TArgs...> fmt;
    std::source_location loc;

    template <class T>
    // NOLINTNEXTLINE(google-explicit-constructor)
    consteval basic_format_string(T const &arg, std::source_location loc = std::source_location::current())
        : fmt(arg)
        , loc(loc)
    {}
};

/*
 * libfmt refuses to format non-void pointers, so any pointer argument is passed through as void const*.
 * Strings stay strings.
 */
template <class T>
struct type_identity;

template <class T>
    requires(!std::is_pointer_v<std::remove_reference_t<T>> || std::is_convertible_v<T, fmt::string_view>)
struct type_identity<T>
{
    using type = T;
};

template <class T>
    requires(std::is_pointer_v<std::remove_reference_t<T>> && !std::is_convertible_v<T, fmt::string_view>)
struct type_identity<T>
{
    using type = void const *;
};

template <class T>
using type_identity_t = typename type_identity<T>::type;

template <class... TArgs>
using format_string = basic_format_string<type_identity_t<TArgs>...>;

template <loggerCategory_t TLogger, plog::Severity TSeverity, class... TArgs>
inline void log(format_string<TArgs...> format, TArgs &&...args)
{
    // Unrolled PLOG_ macro that takes the location from source_location instead of __FILE__/__LINE__
    if (plog::get<TLogger>() && plog::get<TLogger>()->checkSeverity(TSeverity))
    {
        (*plog::get<TLogger>()) += plog::Record(TSeverity,
                                                format.loc.function_name(),
                                                format.loc.line(),
                                                format.loc.file_name(),
                                                reinterpret_cast<void *>(0),
                                                TLogger)
                                       .ref()
                                   << fmt::format(format.fmt, type_identity_t<TArgs>(std::forward<TArgs>(args))...);
    }
}

template <class... TArgs>
constexpr auto log_helper_create_format(format_string<TArgs...> format, TArgs &&...)
{
    return format;
}

} // namespace details

namespace
{
template <class... TArgs>
inline void log_verbose(details::format_string<TArgs...> format, TArgs &&...args)
{
    details::log<BASE_LOGGER, plog::verbose>(format, std::forward<TArgs>(args)...);
}

template <class T>
    requires std::is_convertible_v<T, std::string_view>
inline void log_verbose(T &&msg, std::source_location loc = std::source_location::current())
{
    auto format = details::log_helper_create_format("{}", std::forward<T>(msg));
    format.loc  = loc;
    log_verbose(format, std::forward<T>(msg));
}

template <class... TArgs>
inline void log_info(details::format_string<TArgs...> format, TArgs &&...args)
{
    details::log<BASE_LOGGER, plog::info>(format, std::forward<TArgs>(args)...);
}

template <class T>
    requires std::is_convertible_v<T, std::string_view>
inline void log_info(T &&msg, std::source_location loc = std::source_location::current())
{
    auto format = details::log_helper_create_format("{}", std::forward<T>(msg));
    format.loc  = loc;
    log_info(format, std::forward<T>(msg));
}

template <class... TArgs>
inline void log_debug(details::format_string<TArgs...> format, TArgs &&...args)
{
    details::log<BASE_LOGGER, plog::debug>(format, std::forward<TArgs>(args)...);
}

template <class T>
    requires std::is_convertible_v<T, std::string_view>
inline void log_debug(T &&msg, std::source_location loc = std::source_location::current())
{
    auto format = details::log_helper_create_format("{}", std::forward<T>(msg));
    format.loc  = loc;
    log_debug(format, std::forward<T>(msg));
}

template <class... TArgs>
inline void log_error(details::format_string<TArgs...> format, TArgs &&...args)
{
    details::log<BASE_LOGGER, plog::error>(format, std::forward<TArgs>(args)...);
}

template <class T>
    requires std::is_convertible_v<T, std::string_view>
inline void log_error(T &&msg, std::source_location loc = std::source_location::current())
{
    auto format = details::log_helper_create_format("{}", std::forward<T>(msg));
    format.loc  = loc;
    log_error(format, std::forward<T>(msg));
}

template <class... TArgs>
inline void log_warning(details::format_string<TArgs...> format, TArgs &&...args)
{
    details::log<BASE_LOGGER, plog::warning>(format, std::forward<TArgs>(args)...);
}

template <class T>
    requires std::is_convertible_v<T, std::string_view>
inline void log_warning(T &&msg, std::source_location loc = std::source_location::current())
{
    auto format = details::log_helper_create_format("{}", std::forward<T>(msg));
    format.loc  = loc;
    log_warning(format, std::forward<T>(msg));
}

template <class... TArgs>
inline void log_fatal(details::format_string<TArgs...> format, TArgs &&...args)
{
    details::log<BASE_LOGGER, plog::fatal>(format, std::forward<TArgs>(args)...);
}

template <class T>
    requires std::is_convertible_v<T, std::string_view>
inline void log_fatal(T &&msg, std::source_location loc = std::source_location::current())
{
    auto format = details::log_helper_create_format("{}", std::forward<T>(msg));
    format.loc  = loc;
    log_fatal(format, std::forward<T>(msg));
}
} // namespace

/*
 * Public interface for the ChdLogging class
 */
void ChdLoggingInit(const char *logFile,
                    const ChdLoggingSeverity_t severity,
                    const ChdLoggingSeverity_t consoleSeverity);
std::string LoggingSeverityToString(int inputSeverity, const char *defaultSeverity);
ChdLoggingSeverity_t LoggingSeverityFromString(const char *severityStr, ChdLoggingSeverity_t defaultSeverity);
std::string GetLogSeverityFromArgAndEnv(const std::string &arg,
                                        const std::string &defaultValue,
                                        const std::string &envPrefix);
std::string GetLogFilenameFromArgAndEnv(const std::string &arg,
                                        const std::string &defaultValue,
                                        const std::string &envPrefix);
bool IsValidSeverity(const char *severityStr);
