//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/config.hpp"

#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/format.h>

#include <exception>
#include <source_location>
#include <string>
#include <utility>

namespace logship {

/// Signals a violated internal invariant. Never used for errors that callers
/// can handle; those travel as `caf::error`.
class panic_exception final : public std::exception {
public:
  panic_exception(std::string message, std::source_location location,
                  boost::stacktrace::stacktrace stacktrace)
    : what_{fmt::format("{} (at {}:{})", message, location.file_name(),
                        location.line())},
      location_{location},
      stacktrace_{std::move(stacktrace)} {
  }

  auto what() const noexcept -> const char* override {
    return what_.c_str();
  }

  auto location() const noexcept -> const std::source_location& {
    return location_;
  }

  /// The stack at the point of the panic, without the panic machinery.
  auto stacktrace() const noexcept -> const boost::stacktrace::stacktrace& {
    return stacktrace_;
  }

private:
  std::string what_;
  std::source_location location_;
  boost::stacktrace::stacktrace stacktrace_;
};

/// Throws a `panic_exception` for `location`.
[[noreturn]] LOGSHIP_NO_INLINE inline void
panic_at(std::source_location location, std::string message) {
  // Skip this frame.
  auto stacktrace = boost::stacktrace::stacktrace{1, 256};
  throw panic_exception{std::move(message), location, std::move(stacktrace)};
}

} // namespace logship

/// Panics if `expr` evaluates to false. An optional second argument adds a
/// message.
#define LOGSHIP_ASSERT(expr, ...)                                              \
  do {                                                                         \
    if (not(expr)) [[unlikely]] {                                              \
      ::logship::panic_at(std::source_location::current(),                     \
                          fmt::format("assertion `{}` failed" __VA_OPT__(      \
                                        ": {}"),                               \
                                      #expr __VA_OPT__(, __VA_ARGS__)));       \
    }                                                                          \
  } while (false)

#define LOGSHIP_UNREACHABLE()                                                  \
  ::logship::panic_at(std::source_location::current(), "unreachable")
