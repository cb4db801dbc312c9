//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/error.hpp"

#include <caf/deep_to_string.hpp>
#include <caf/exit_reason.hpp>
#include <caf/message.hpp>
#include <caf/pec.hpp>
#include <caf/sec.hpp>

#include <array>
#include <string>
#include <string_view>

namespace logship {

namespace {

constexpr auto ec_names = std::array<const char*, 11>{
  "no_error",
  "unspecified",
  "decode_error",
  "encode_error",
  "upload_error",
  "unsupported_signal",
  "invalid_configuration",
  "parse_error",
  "filesystem_error",
  "logic_error",
  "unimplemented",
};

static_assert(ec_names.size() == static_cast<size_t>(ec::ec_count),
              "every error code needs a name");

/// Names the code of an error from one of the categories we encounter.
auto code_name(const caf::error& err) -> std::string {
  switch (err.category()) {
    case caf::type_id_v<ec>:
      return to_string(static_cast<ec>(err.code()));
    case caf::type_id_v<caf::pec>:
      return to_string(static_cast<caf::pec>(err.code()));
    case caf::type_id_v<caf::sec>:
      return to_string(static_cast<caf::sec>(err.code()));
    case caf::type_id_v<caf::exit_reason>:
      return to_string(static_cast<caf::exit_reason>(err.code()));
    default:
      return "Unknown";
  }
}

} // namespace

auto to_string(ec x) -> const char* {
  const auto index = static_cast<size_t>(x);
  LOGSHIP_ASSERT(index < ec_names.size());
  return ec_names[index];
}

auto render(const caf::error& err) -> std::string {
  if (not err)
    return {};
  auto result = fmt::format("!! {}", code_name(err));
  const auto& context = err.context();
  // Context strings are joined by spaces in the order they were attached,
  // newest first.
  for (size_t i = 0; i < context.size(); ++i) {
    result += i == 0 ? ": " : " ";
    if (context.match_element<std::string>(i))
      result += context.get_as<std::string>(i);
    else
      result += caf::deep_to_string(context);
  }
  return result;
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (not error)
    return error;
  auto context = caf::make_message(std::move(str));
  if (error.context())
    context = caf::message::concat(std::move(context), error.context());
  return caf::error{error.code(), error.category(), std::move(context)};
}

} // namespace logship
