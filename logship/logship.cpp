//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/actors.hpp"
#include "logship/atoms.hpp"
#include "logship/defaults.hpp"
#include "logship/detail/add_message_types.hpp"
#include "logship/encoder.hpp"
#include "logship/error.hpp"
#include "logship/exporter.hpp"
#include "logship/exporter_config.hpp"
#include "logship/http_uploader.hpp"
#include "logship/ipc_source.hpp"
#include "logship/logger.hpp"
#include "logship/metrics.hpp"

#include <arrow/util/utf8.h>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <caf/detail/scope_guard.hpp>
#include <caf/scoped_actor.hpp>
#include <caf/settings.hpp>
#include <curl/curl.h>
#include <fmt/format.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

namespace {

/// How long the exporter may take to finish accepted work after the last
/// signal.
constexpr auto default_deadline = std::string_view{"30s"};

// Our custom configuration with extra command line options for this tool.
class configuration : public caf::actor_system_config {
public:
  configuration() {
    // As a stand-alone application, we reuse the global option group from CAF
    // to avoid unnecessary prefixing.
    opt_group{custom_options_, "global"}
      .add<std::string>("config,c", "path to the YAML configuration file")
      .add<std::string>("logs,l", "Arrow IPC stream with the logs table")
      .add<std::string>("log-attrs", "Arrow IPC stream with log attributes")
      .add<std::string>("resource-attrs",
                        "Arrow IPC stream with resource attributes")
      .add<std::string>("verbosity,v", "console verbosity (quiet, error, "
                                       "warning, info, verbose, debug, trace)")
      .add<std::string>("deadline", "time to wait for the exporter to drain");
  }
};

/// Reads an optional attribute stream.
auto read_optional_stream(const caf::actor_system_config& cfg,
                          std::string_view key)
  -> caf::expected<logship::record_batches> {
  const auto* path = caf::get_if<std::string>(&cfg, key);
  if (not path)
    return logship::record_batches{};
  return logship::read_ipc_stream(*path);
}

} // namespace

auto main(int argc, char** argv) -> int {
  using namespace logship;
  detail::add_message_types();
  arrow::util::InitializeUTF8();
  auto cfg = configuration{};
  if (auto err = cfg.parse(argc, argv)) {
    fmt::print(stderr, "failed to parse command line: {}\n", err);
    return EXIT_FAILURE;
  }
  if (cfg.cli_helptext_printed)
    return EXIT_SUCCESS;
  const auto* config_path = caf::get_if<std::string>(&cfg, "config");
  const auto* logs_path = caf::get_if<std::string>(&cfg, "logs");
  if (not config_path or not logs_path) {
    fmt::print(stderr, "usage: logship --config=<file> --logs=<file> "
                       "[--log-attrs=<file>] [--resource-attrs=<file>]\n");
    return EXIT_FAILURE;
  }
  auto config = load_config(*config_path);
  if (not config) {
    fmt::print(stderr, "{}\n", config.error());
    return EXIT_FAILURE;
  }
  if (const auto* verbosity = caf::get_if<std::string>(&cfg, "verbosity"))
    config->verbosity = *verbosity;
  auto deadline = parse_duration(
    caf::get_or(cfg, "deadline", std::string{default_deadline}));
  if (not deadline) {
    fmt::print(stderr, "invalid deadline: {}\n", deadline.error());
    return EXIT_FAILURE;
  }
  auto log_context = create_log_context(config->verbosity,
                                        defaults::logger::console_format);
  if (not log_context) {
    fmt::print(stderr, "failed to set up logging: {}\n", log_context.error());
    return EXIT_FAILURE;
  }
  auto logs = read_ipc_stream(*logs_path);
  if (not logs) {
    LOGSHIP_ERROR("failed to read {}: {}", *logs_path, logs.error());
    return EXIT_FAILURE;
  }
  auto log_attrs = read_optional_stream(cfg, "log-attrs");
  if (not log_attrs) {
    LOGSHIP_ERROR("failed to read log attributes: {}", log_attrs.error());
    return EXIT_FAILURE;
  }
  auto resource_attrs = read_optional_stream(cfg, "resource-attrs");
  if (not resource_attrs) {
    LOGSHIP_ERROR("failed to read resource attributes: {}",
                  resource_attrs.error());
    return EXIT_FAILURE;
  }
  if (auto code = curl_global_init(CURL_GLOBAL_DEFAULT); code != CURLE_OK) {
    LOGSHIP_ERROR("failed to initialize libcurl: {}",
                  curl_easy_strerror(code));
    return EXIT_FAILURE;
  }
  auto curl_guard = caf::detail::scope_guard{[]() noexcept {
    curl_global_cleanup();
  }};
  auto sys = caf::actor_system{cfg};
  auto self = caf::scoped_actor{sys};
  auto uploader = sys.spawn<caf::detached>(http_uploader, *config);
  auto enc = std::make_shared<ndjson_encoder>(config->make_encoder_options());
  auto exp = sys.spawn(exporter, config->make_exporter_options(),
                       std::move(enc), uploader);
  auto signals = make_signals(*logs, *log_attrs, *resource_attrs);
  LOGSHIP_VERBOSE("exporting {} signals to {}", signals.size(),
                  config->endpoint);
  auto nacked = size_t{0};
  for (auto i = size_t{0}; i < signals.size(); ++i) {
    auto result = self->mail(atom::consume_v, std::move(signals[i]))
                    .request(exp, caf::infinite)
                    .receive();
    if (not result) {
      ++nacked;
      LOGSHIP_ERROR("signal {}/{} was rejected: {}", i + 1, signals.size(),
                    result.error());
      continue;
    }
    LOGSHIP_INFO("signal {}/{} exported", i + 1, signals.size());
  }
  const auto until = caf::make_timestamp() + *deadline;
  auto terminal = self->mail(atom::shutdown_v, until)
                    .request(exp, *deadline)
                    .receive();
  self->send_exit(uploader, caf::exit_reason::user_shutdown);
  if (not terminal) {
    LOGSHIP_ERROR("exporter failed to shut down: {}", terminal.error());
    return EXIT_FAILURE;
  }
  const auto& metrics = terminal->metrics;
  fmt::print("consumed: {}\nexported: {}\nfailed: {}\nrecords: {}\n"
             "batches_exported: {}\nbatches_failed: {}\nbatches_skipped: {}\n"
             "upload_retries: {}\ndropped_attributes: {}\nrejected: {}\n",
             metrics.consumed, metrics.exported, metrics.failed,
             metrics.records, metrics.batches_exported, metrics.batches_failed,
             metrics.batches_skipped, metrics.upload_retries,
             metrics.dropped_attributes, metrics.rejected);
  return nacked == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
