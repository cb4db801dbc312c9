//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/error.hpp"
#include "logship/panic.hpp"

#include <arrow/array/builder_base.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <caf/error.hpp>

#include <concepts>
#include <memory>
#include <source_location>

namespace logship {

inline void
check(const arrow::Status& status, std::source_location location
                                   = std::source_location::current()) {
  if (not status.ok()) [[unlikely]] {
    panic_at(location, status.ToString());
  }
}

template <class T>
[[nodiscard]] auto
check(arrow::Result<T> result, std::source_location location
                               = std::source_location::current()) -> T {
  check(result.status(), location);
  return result.MoveValueUnsafe();
}

/// Finishes a builder and downcasts the result to the concrete array type.
template <class Array, std::derived_from<arrow::ArrayBuilder> T>
[[nodiscard]] auto
finish(T& x, std::source_location location = std::source_location::current())
  -> std::shared_ptr<Array> {
  auto array = check(x.Finish(), location);
  return std::static_pointer_cast<Array>(array);
}

/// Converts a failed Arrow status into an error with the given code.
inline auto to_error(const arrow::Status& status, ec code) -> caf::error {
  if (status.ok())
    return {};
  return caf::make_error(code, status.ToString());
}

} // namespace logship
