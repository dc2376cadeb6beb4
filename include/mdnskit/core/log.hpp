/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "platform.hpp"
#include "string.hpp"

#include <fmt/format.h>

#include <atomic>
#include <cstdlib>

#ifndef MDK_ENABLE_SPDLOG
    #define MDK_ENABLE_SPDLOG 0
#endif

#if MDK_ENABLE_SPDLOG

    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

    #if MDK_MACOS
        #define SPDLOG_FUNCTION __PRETTY_FUNCTION__
    #endif

    #include <spdlog/spdlog.h>

    #ifndef MDK_TRACE
        #define MDK_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
    #endif

    #ifndef MDK_DEBUG
        #define MDK_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
    #endif

    #ifndef MDK_CRITICAL
        #define MDK_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
    #endif

    #ifndef MDK_ERROR
        #define MDK_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
    #endif

    #ifndef MDK_WARNING
        #define MDK_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
    #endif

    #ifndef MDK_INFO
        #define MDK_INFO(...) SPDLOG_INFO(__VA_ARGS__)
    #endif

#else

namespace mdk {

enum class LogLevel { off, critical, error, warning, info, debug, trace };

inline std::atomic log_level = LogLevel::info;

}  // namespace mdk

    #ifndef MDK_TRACE
        #define MDK_TRACE(...)                                         \
            if (mdk::log_level.load() >= mdk::LogLevel::trace) {       \
                fmt::print("[T] " __VA_ARGS__);                        \
                fmt::print("\n");                                      \
            }
    #endif

    #ifndef MDK_DEBUG
        #define MDK_DEBUG(...)                                         \
            if (mdk::log_level.load() >= mdk::LogLevel::debug) {       \
                fmt::print("[D] " __VA_ARGS__);                        \
                fmt::print("\n");                                      \
            }
    #endif

    #ifndef MDK_CRITICAL
        #define MDK_CRITICAL(...)                                      \
            if (mdk::log_level.load() >= mdk::LogLevel::critical) {    \
                fmt::print("[C] " __VA_ARGS__);                        \
                fmt::print("\n");                                      \
            }
    #endif

    #ifndef MDK_ERROR
        #define MDK_ERROR(...)                                         \
            if (mdk::log_level.load() >= mdk::LogLevel::error) {       \
                fmt::print("[E] " __VA_ARGS__);                        \
                fmt::print("\n");                                      \
            }
    #endif

    #ifndef MDK_WARNING
        #define MDK_WARNING(...)                                       \
            if (mdk::log_level.load() >= mdk::LogLevel::warning) {     \
                fmt::print("[W] " __VA_ARGS__);                        \
                fmt::print("\n");                                      \
            }
    #endif

    #ifndef MDK_INFO
        #define MDK_INFO(...)                                          \
            if (mdk::log_level.load() >= mdk::LogLevel::info) {        \
                fmt::print("[I] " __VA_ARGS__);                        \
                fmt::print("\n");                                      \
            }
    #endif

#endif

namespace mdk {

/**
 * Sets the log level for the application based on the given string.
 * The following are valid values:
 *  - TRACE
 *  - DEBUG
 *  - INFO (default)
 *  - WARN
 *  - ERROR
 *  - CRITICAL
 *  - OFF
 * @param level The log level as string, case-insensitive.
 */
inline void set_log_level(const char* level) {
#if MDK_ENABLE_SPDLOG
    if (string_compare_case_insensitive(level, "TRACE")) {
        spdlog::set_level(spdlog::level::trace);
    } else if (string_compare_case_insensitive(level, "DEBUG")) {
        spdlog::set_level(spdlog::level::debug);
    } else if (string_compare_case_insensitive(level, "INFO")) {
        spdlog::set_level(spdlog::level::info);
    } else if (string_compare_case_insensitive(level, "WARN")) {
        spdlog::set_level(spdlog::level::warn);
    } else if (string_compare_case_insensitive(level, "ERROR")) {
        spdlog::set_level(spdlog::level::err);
    } else if (string_compare_case_insensitive(level, "CRITICAL")) {
        spdlog::set_level(spdlog::level::critical);
    } else if (string_compare_case_insensitive(level, "OFF")) {
        spdlog::set_level(spdlog::level::off);
    } else {
        fmt::print("Invalid log level: {}. Setting log level to info.\n", level);
        spdlog::set_level(spdlog::level::info);
    }
#else
    if (string_compare_case_insensitive(level, "TRACE")) {
        log_level = LogLevel::trace;
    } else if (string_compare_case_insensitive(level, "DEBUG")) {
        log_level = LogLevel::debug;
    } else if (string_compare_case_insensitive(level, "INFO")) {
        log_level = LogLevel::info;
    } else if (string_compare_case_insensitive(level, "WARN")) {
        log_level = LogLevel::warning;
    } else if (string_compare_case_insensitive(level, "ERROR")) {
        log_level = LogLevel::error;
    } else if (string_compare_case_insensitive(level, "CRITICAL")) {
        log_level = LogLevel::critical;
    } else if (string_compare_case_insensitive(level, "OFF")) {
        log_level = LogLevel::off;
    } else {
        fmt::print("Invalid log level: {}. Setting log level to info.\n", level);
        log_level = LogLevel::info;
    }
#endif
}

/**
 * Tries to find given environment variable and set the log level accordingly. See set_log_level for valid values.
 * By default the log level is set to INFO. If an invalid loglevel is passed, the loglevel will be set to INFO.
 * @param env_var The environment variable to read the log level from.
 */
inline void set_log_level_from_env(const char* env_var = "MDK_LOG_LEVEL") {
    if (const char* env_value = std::getenv(env_var)) {
        set_log_level(env_value);
    } else {
        set_log_level("INFO");
    }
}

}  // namespace mdk
