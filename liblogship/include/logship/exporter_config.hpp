//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#include "logship/aliases.hpp"
#include "logship/defaults.hpp"
#include "logship/encoder.hpp"
#include "logship/exporter.hpp"
#include "logship/retry_policy.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace logship {

/// How the HTTP uploader authenticates against the endpoint.
enum class auth_method : uint8_t {
  managed_identity,
  certificate,
  workload_identity,
};

/// @relates auth_method
auto to_string(auth_method x) -> std::string_view;

/// Parses the configuration spelling of an authentication method.
/// @relates auth_method
auto parse_auth_method(std::string_view str) -> caf::expected<auth_method>;

/// The complete configuration of an exporter and its uploader.
struct exporter_config {
  std::string endpoint;
  std::string environment;
  std::string account;
  /// Spelled `namespace` in the configuration file.
  std::string namespace_name;
  std::string region;
  uint32_t config_major_version = 1;
  std::string tenant;
  std::string role_name;
  std::string role_instance;

  auth_method auth = auth_method::managed_identity;
  /// Path to a PKCS#12 file for certificate authentication.
  std::string cert_path;
  std::string cert_password;
  /// The resource a managed or workload identity requests tokens for.
  std::string identity_resource;
  std::string managed_identity_client_id;

  size_t upload_queue_size = defaults::exporter::upload_queue_size;
  duration upload_timeout = defaults::exporter::upload_timeout;
  size_t max_batch_bytes = defaults::encoder::max_batch_bytes;
  retry_policy batch_retry = {};

  /// The console verbosity of the logger.
  std::string verbosity = defaults::logger::console_verbosity;

  /// Checks required fields and value ranges.
  /// @returns `ec::invalid_configuration` naming the first problem.
  auto validate() const -> caf::error;

  /// Returns the options for the exporter actor.
  auto make_exporter_options() const -> exporter_options;

  /// Returns the options for the NDJSON encoder.
  auto make_encoder_options() const -> ndjson_encoder_options;
};

/// Parses a duration with a unit suffix, e.g., `100ms` or `5s`. The
/// supported units are `ns`, `us`, `ms`, `s`, `min`, and `h`.
auto parse_duration(std::string_view str) -> caf::expected<duration>;

/// Parses a YAML document into a configuration without validating it.
auto parse_config(std::string_view yaml) -> caf::expected<exporter_config>;

/// Reads, parses, and validates the configuration file at `path`.
auto load_config(const std::filesystem::path& path)
  -> caf::expected<exporter_config>;

} // namespace logship

template <>
struct fmt::formatter<logship::auth_method> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(logship::auth_method x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(logship::to_string(x), ctx);
  }
};
