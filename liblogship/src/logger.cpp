//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/logger.hpp"

#include "logship/defaults.hpp"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace logship {

namespace {

constexpr auto null_logger_name = "/dev/null";

constexpr auto verbosities = std::array<std::pair<std::string_view, int>, 7>{{
  {"quiet", LOGSHIP_LOG_LEVEL_QUIET},
  {"error", LOGSHIP_LOG_LEVEL_ERROR},
  {"warning", LOGSHIP_LOG_LEVEL_WARNING},
  {"info", LOGSHIP_LOG_LEVEL_INFO},
  {"verbose", LOGSHIP_LOG_LEVEL_VERBOSE},
  {"debug", LOGSHIP_LOG_LEVEL_DEBUG},
  {"trace", LOGSHIP_LOG_LEVEL_TRACE},
}};

auto to_spdlog_level(int level) -> spdlog::level::level_enum {
  switch (level) {
    case LOGSHIP_LOG_LEVEL_QUIET:
      return spdlog::level::off;
    case LOGSHIP_LOG_LEVEL_CRITICAL:
      return spdlog::level::critical;
    case LOGSHIP_LOG_LEVEL_ERROR:
      return spdlog::level::err;
    case LOGSHIP_LOG_LEVEL_WARNING:
      return spdlog::level::warn;
    case LOGSHIP_LOG_LEVEL_INFO:
      return spdlog::level::info;
    case LOGSHIP_LOG_LEVEL_VERBOSE:
      return spdlog::level::debug;
    case LOGSHIP_LOG_LEVEL_DEBUG:
    case LOGSHIP_LOG_LEVEL_TRACE:
      return spdlog::level::trace;
  }
  LOGSHIP_UNREACHABLE();
}

auto make_console_logger(int level, std::string_view format)
  -> std::shared_ptr<spdlog::logger> {
  spdlog::init_thread_pool(defaults::logger::queue_size,
                           defaults::logger::logger_threads);
  auto sink = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(
    spdlog::color_mode::automatic);
  sink->set_pattern(std::string{format});
  auto result = std::make_shared<spdlog::async_logger>(
    "logship", std::move(sink), spdlog::thread_pool(),
    spdlog::async_overflow_policy::block);
  result->set_level(to_spdlog_level(level));
  return result;
}

} // namespace

namespace detail {

auto logger() -> std::shared_ptr<spdlog::logger>& {
  static auto instance = spdlog::null_logger_mt(null_logger_name);
  return instance;
}

void shutdown_logger() noexcept {
  LOGSHIP_DEBUG("shutting down the logger");
  logger()->flush();
  spdlog::shutdown();
  logger() = spdlog::null_logger_mt(null_logger_name);
}

} // namespace detail

auto parse_verbosity(std::string_view str) -> caf::expected<int> {
  auto lowered = std::string{str};
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  for (const auto& [name, level] : verbosities)
    if (name == lowered)
      return level;
  return caf::make_error(ec::invalid_configuration,
                         fmt::format("invalid verbosity '{}'", str));
}

auto create_log_context(std::string_view verbosity, std::string_view format)
  -> caf::expected<caf::detail::scope_guard<void (*)() noexcept>> {
  auto level = parse_verbosity(verbosity);
  if (not level)
    return add_context(level.error(), "failed to start logger");
  if (detail::logger()->name() != null_logger_name)
    return caf::make_error(ec::logic_error,
                           "failed to start logger: already running");
  try {
    detail::logger() = make_console_logger(*level, format);
    spdlog::register_logger(detail::logger());
  } catch (const spdlog::spdlog_ex& err) {
    return caf::make_error(ec::unspecified,
                           fmt::format("failed to start logger: {}",
                                       err.what()));
  }
  return caf::detail::make_scope_guard(&detail::shutdown_logger);
}

} // namespace logship
