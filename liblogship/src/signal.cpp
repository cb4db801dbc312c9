//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/signal.hpp"

#include "logship/panic.hpp"

namespace logship {

auto to_string(signal_type x) -> std::string_view {
  switch (x) {
    case signal_type::logs:
      return "logs";
    case signal_type::traces:
      return "traces";
    case signal_type::metrics:
      return "metrics";
  }
  LOGSHIP_UNREACHABLE();
}

} // namespace logship
