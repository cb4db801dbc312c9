//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/detail/add_message_types.hpp"
#include "logship/error.hpp"
#include "logship/logger.hpp"
#include "logship/test/test.hpp"

#include <arrow/util/utf8.h>
#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>

#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace caf::test {

int main(int, char**);

} // namespace caf::test

namespace {

/// Console verbosity of the library while the suites run. Log output
/// interleaves with the test report, so it stays off unless requested.
constexpr auto default_test_verbosity = std::string_view{"quiet"};

/// Options for logship itself follow a `--` on the command line. Everything
/// before it belongs to the CAF test runner.
auto logship_args(std::span<char*> argv) -> std::vector<std::string> {
  auto delimiter = std::ranges::find_if(argv, [](const char* arg) {
    return std::string_view{arg} == "--";
  });
  if (delimiter == argv.end())
    return {};
  return {std::next(delimiter), argv.end()};
}

} // namespace

int main(int argc, char** argv) {
  auto verbosity = std::string{default_test_verbosity};
  auto args = logship_args(std::span{argv, static_cast<size_t>(argc)});
  if (not args.empty()) {
    auto options = caf::config_option_set{}
                     .add(verbosity, "logship-verbosity",
                          "console verbosity of liblogship")
                     .add<bool>("help", "print this help text");
    auto settings = caf::settings{};
    auto [code, pos] = options.parse(settings, args);
    if (code != caf::pec::success) {
      fmt::print(stderr, "invalid argument {}: {}\n\n{}\n", *pos,
                 to_string(code), options.help_text());
      return EXIT_FAILURE;
    }
    if (caf::get_or(settings, "help", false)) {
      fmt::print("{}\n", options.help_text());
      return EXIT_SUCCESS;
    }
    logship::test::config = {args.begin(), args.end()};
  }
  logship::detail::add_message_types();
  arrow::util::InitializeUTF8();
  auto log_context = logship::create_log_context(verbosity, "%^[%s:%#] %v%$");
  if (not log_context) {
    fmt::print(stderr, "failed to set up logging: {}\n", log_context.error());
    return EXIT_FAILURE;
  }
  return caf::test::main(argc, argv);
}
