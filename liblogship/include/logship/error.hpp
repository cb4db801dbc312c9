//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#include "logship/panic.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <source_location>
#include <string>
#include <type_traits>

namespace logship {

/// The error codes of logship.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The unspecified default error code.
  unspecified,
  /// A signal did not contain decodable primary data.
  decode_error,
  /// Failed to encode records into transmittable batches.
  encode_error,
  /// The remote endpoint rejected a batch or could not be reached.
  upload_error,
  /// The exporter does not handle this signal kind or payload.
  unsupported_signal,
  /// A component received an invalid configuration.
  invalid_configuration,
  /// Failure during parsing.
  parse_error,
  /// An error while accessing the filesystem.
  filesystem_error,
  /// An error caused by wrong internal application logic.
  logic_error,
  /// Encountered a currently unimplemented code path or missing feature.
  unimplemented,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> const char*;

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

template <class Inspector>
auto inspect(Inspector& f, ec& x) {
  using underlying = std::underlying_type_t<ec>;
  auto get = [&] {
    return static_cast<underlying>(x);
  };
  auto set = [&](underlying value) {
    if (value >= static_cast<underlying>(ec::ec_count)) {
      return false;
    }
    x = static_cast<ec>(value);
    return true;
  };
  return f.apply(get, set);
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

/// Attaches a human-readable context string to an error while keeping its
/// code and category.
template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

inline void check(const caf::error& err, std::source_location location
                                         = std::source_location::current()) {
  if (err) [[unlikely]] {
    panic_at(location, render(err));
  }
}

template <class T>
[[nodiscard]] auto
check(caf::expected<T> result, std::source_location location
                               = std::source_location::current()) -> T {
  if (not result) [[unlikely]] {
    panic_at(location, render(result.error()));
  }
  return std::move(result.value());
}

} // namespace logship

CAF_ERROR_CODE_ENUM(logship::ec)

template <>
struct fmt::formatter<caf::error> {
  template <class ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const caf::error& err, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", logship::render(err));
  }
};

template <>
struct fmt::formatter<logship::ec> {
  template <class ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(logship::ec x, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", logship::to_string(x));
  }
};
