//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/config.hpp"
#include "logship/error.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>
#include <spdlog/logger.h>

#include <memory>
#include <string_view>

namespace logship {

namespace detail {

/// Returns the process-wide logger. Messages logged before
/// `create_log_context` runs go to a null sink.
auto logger() -> std::shared_ptr<spdlog::logger>&;

/// Flushes and tears down the process-wide logger.
void shutdown_logger() noexcept;

} // namespace detail

/// Parses a console verbosity into one of the `LOGSHIP_LOG_LEVEL_*` values.
/// Accepts quiet, error, warning, info, verbose, debug, and trace.
auto parse_verbosity(std::string_view str) -> caf::expected<int>;

/// Installs the process-wide console logger. Destroying the returned guard
/// flushes and shuts it down again.
/// @param verbosity The runtime verbosity, see `parse_verbosity`.
/// @param format The spdlog pattern for every line.
[[nodiscard]] auto create_log_context(std::string_view verbosity,
                                      std::string_view format)
  -> caf::expected<caf::detail::scope_guard<void (*)() noexcept>>;

} // namespace logship

// Messages above the compile-time ceiling LOGSHIP_LOG_LEVEL vanish entirely.
// VERBOSE maps to spdlog's debug level, DEBUG and TRACE share spdlog's trace
// level.

#define LOGSHIP_LOG(level, ...)                                                \
  do {                                                                         \
    auto& logship_logger_ = ::logship::detail::logger();                       \
    if (logship_logger_->should_log(level))                                    \
      logship_logger_->log(::spdlog::source_loc{__FILE__, __LINE__, __func__}, \
                           level, __VA_ARGS__);                                \
  } while (false)

#define LOGSHIP_DISCARD_ARGS(...)                                              \
  do {                                                                         \
  } while (false)

#if LOGSHIP_LOG_LEVEL >= LOGSHIP_LOG_LEVEL_TRACE
#  define LOGSHIP_TRACE(...) LOGSHIP_LOG(::spdlog::level::trace, __VA_ARGS__)
#else
#  define LOGSHIP_TRACE(...) LOGSHIP_DISCARD_ARGS(__VA_ARGS__)
#endif

#if LOGSHIP_LOG_LEVEL >= LOGSHIP_LOG_LEVEL_DEBUG
#  define LOGSHIP_DEBUG(...) LOGSHIP_LOG(::spdlog::level::trace, __VA_ARGS__)
#else
#  define LOGSHIP_DEBUG(...) LOGSHIP_DISCARD_ARGS(__VA_ARGS__)
#endif

#if LOGSHIP_LOG_LEVEL >= LOGSHIP_LOG_LEVEL_VERBOSE
#  define LOGSHIP_VERBOSE(...) LOGSHIP_LOG(::spdlog::level::debug, __VA_ARGS__)
#else
#  define LOGSHIP_VERBOSE(...) LOGSHIP_DISCARD_ARGS(__VA_ARGS__)
#endif

#if LOGSHIP_LOG_LEVEL >= LOGSHIP_LOG_LEVEL_INFO
#  define LOGSHIP_INFO(...) LOGSHIP_LOG(::spdlog::level::info, __VA_ARGS__)
#else
#  define LOGSHIP_INFO(...) LOGSHIP_DISCARD_ARGS(__VA_ARGS__)
#endif

#if LOGSHIP_LOG_LEVEL >= LOGSHIP_LOG_LEVEL_WARNING
#  define LOGSHIP_WARN(...) LOGSHIP_LOG(::spdlog::level::warn, __VA_ARGS__)
#else
#  define LOGSHIP_WARN(...) LOGSHIP_DISCARD_ARGS(__VA_ARGS__)
#endif

#if LOGSHIP_LOG_LEVEL >= LOGSHIP_LOG_LEVEL_ERROR
#  define LOGSHIP_ERROR(...) LOGSHIP_LOG(::spdlog::level::err, __VA_ARGS__)
#else
#  define LOGSHIP_ERROR(...) LOGSHIP_DISCARD_ARGS(__VA_ARGS__)
#endif
