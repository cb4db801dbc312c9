//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/exporter_config.hpp"

#include "logship/error.hpp"
#include "logship/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <chrono>
#include <limits>
#include <system_error>
#include <utility>

namespace logship {

namespace {

auto missing(std::string_view field) -> caf::error {
  return caf::make_error(
    ec::invalid_configuration,
    fmt::format("missing required configuration field `{}`", field));
}

auto invalid_value(std::string_view key, const YAML::Node& node) -> caf::error {
  return caf::make_error(ec::parse_error,
                         fmt::format("invalid value for `{}` at line {}", key,
                                     node.Mark().line + 1));
}

template <class T>
auto assign(std::string_view key, const YAML::Node& node, T& out)
  -> caf::error {
  if (not node.IsScalar())
    return invalid_value(key, node);
  try {
    out = node.as<T>();
  } catch (const YAML::BadConversion&) {
    return invalid_value(key, node);
  }
  return {};
}

auto assign(std::string_view key, const YAML::Node& node, duration& out)
  -> caf::error {
  if (not node.IsScalar())
    return invalid_value(key, node);
  auto result = parse_duration(node.Scalar());
  if (not result)
    return add_context(result.error(), "invalid value for `{}`", key);
  out = *result;
  return {};
}

auto assign(std::string_view key, const YAML::Node& node, auth_method& out)
  -> caf::error {
  if (not node.IsScalar())
    return invalid_value(key, node);
  auto result = parse_auth_method(node.Scalar());
  if (not result)
    return result.error();
  out = *result;
  return {};
}

auto parse_retry(const YAML::Node& node, retry_policy& policy) -> caf::error {
  if (not node.IsMap())
    return invalid_value("batch_retry", node);
  for (const auto& entry : node) {
    const auto key = entry.first.as<std::string>();
    const auto& value = entry.second;
    auto err = caf::error{};
    if (key == "max_retries")
      err = assign("batch_retry.max_retries", value, policy.max_retries);
    else if (key == "initial_interval")
      err = assign("batch_retry.initial_interval", value,
                   policy.initial_interval);
    else if (key == "max_interval")
      err = assign("batch_retry.max_interval", value, policy.max_interval);
    else if (key == "multiplier")
      err = assign("batch_retry.multiplier", value, policy.multiplier);
    else if (key == "enabled")
      err = assign("batch_retry.enabled", value, policy.enabled);
    else
      return caf::make_error(
        ec::parse_error,
        fmt::format("unknown configuration key `batch_retry.{}`", key));
    if (err)
      return err;
  }
  return {};
}

auto parse_node(const YAML::Node& node) -> caf::expected<exporter_config> {
  auto result = exporter_config{};
  if (node.IsNull())
    return result;
  if (not node.IsMap())
    return caf::make_error(ec::parse_error,
                           "configuration must be a YAML mapping");
  for (const auto& entry : node) {
    const auto key = entry.first.as<std::string>();
    const auto& value = entry.second;
    auto err = caf::error{};
    if (key == "endpoint")
      err = assign(key, value, result.endpoint);
    else if (key == "environment")
      err = assign(key, value, result.environment);
    else if (key == "account")
      err = assign(key, value, result.account);
    else if (key == "namespace")
      err = assign(key, value, result.namespace_name);
    else if (key == "region")
      err = assign(key, value, result.region);
    else if (key == "config_major_version")
      err = assign(key, value, result.config_major_version);
    else if (key == "tenant")
      err = assign(key, value, result.tenant);
    else if (key == "role_name")
      err = assign(key, value, result.role_name);
    else if (key == "role_instance")
      err = assign(key, value, result.role_instance);
    else if (key == "auth_method")
      err = assign(key, value, result.auth);
    else if (key == "cert_path")
      err = assign(key, value, result.cert_path);
    else if (key == "cert_password")
      err = assign(key, value, result.cert_password);
    else if (key == "identity_resource")
      err = assign(key, value, result.identity_resource);
    else if (key == "managed_identity_client_id")
      err = assign(key, value, result.managed_identity_client_id);
    else if (key == "upload_queue_size")
      err = assign(key, value, result.upload_queue_size);
    else if (key == "upload_timeout")
      err = assign(key, value, result.upload_timeout);
    else if (key == "max_batch_bytes")
      err = assign(key, value, result.max_batch_bytes);
    else if (key == "batch_retry")
      err = parse_retry(value, result.batch_retry);
    else if (key == "verbosity")
      err = assign(key, value, result.verbosity);
    else
      return caf::make_error(
        ec::parse_error, fmt::format("unknown configuration key `{}`", key));
    if (err)
      return err;
  }
  return result;
}

auto yaml_error(const YAML::Exception& e) -> caf::error {
  return caf::make_error(ec::parse_error,
                         fmt::format("failed to parse YAML at line {} column "
                                     "{}: {}",
                                     e.mark.line + 1, e.mark.column + 1,
                                     e.msg));
}

auto parse_document(const YAML::Node& node)
  -> caf::expected<exporter_config> {
  try {
    return parse_node(node);
  } catch (const YAML::Exception& e) {
    return yaml_error(e);
  }
}

} // namespace

auto to_string(auth_method x) -> std::string_view {
  switch (x) {
    case auth_method::managed_identity:
      return "managed_identity";
    case auth_method::certificate:
      return "certificate";
    case auth_method::workload_identity:
      return "workload_identity";
  }
  LOGSHIP_UNREACHABLE();
}

auto parse_auth_method(std::string_view str) -> caf::expected<auth_method> {
  for (auto x : {auth_method::managed_identity, auth_method::certificate,
                 auth_method::workload_identity})
    if (str == to_string(x))
      return x;
  return caf::make_error(ec::parse_error,
                         fmt::format("unknown auth_method `{}`; expected "
                                     "managed_identity, certificate, or "
                                     "workload_identity",
                                     str));
}

auto exporter_config::validate() const -> caf::error {
  const std::pair<std::string_view, const std::string*> required[] = {
    {"endpoint", &endpoint},   {"environment", &environment},
    {"account", &account},     {"namespace", &namespace_name},
    {"region", &region},       {"tenant", &tenant},
    {"role_name", &role_name}, {"role_instance", &role_instance},
  };
  for (const auto& [field, value] : required)
    if (value->empty())
      return missing(field);
  if (config_major_version == 0)
    return caf::make_error(ec::invalid_configuration,
                           "config_major_version must be > 0");
  switch (auth) {
    case auth_method::certificate:
      if (cert_path.empty())
        return missing("cert_path");
      break;
    case auth_method::managed_identity:
      if (identity_resource.empty())
        return missing("identity_resource (Managed Identity)");
      break;
    case auth_method::workload_identity:
      if (identity_resource.empty())
        return missing("identity_resource (Workload Identity)");
      break;
  }
  if (upload_queue_size == 0)
    return caf::make_error(ec::invalid_configuration,
                           "upload_queue_size must be > 0");
  if (max_batch_bytes == 0)
    return caf::make_error(ec::invalid_configuration,
                           "max_batch_bytes must be > 0");
  if (upload_timeout <= duration::zero())
    return caf::make_error(ec::invalid_configuration,
                           "upload_timeout must be > 0");
  return batch_retry.validate();
}

auto exporter_config::make_exporter_options() const -> exporter_options {
  return {
    .retry = batch_retry,
    .upload_timeout = upload_timeout
                      + defaults::exporter::request_timeout_margin,
    .upload_queue_size = upload_queue_size,
  };
}

auto exporter_config::make_encoder_options() const -> ndjson_encoder_options {
  return {
    .max_batch_bytes = max_batch_bytes,
    .default_event_name = std::string{defaults::encoder::event_name},
  };
}

auto parse_duration(std::string_view str) -> caf::expected<duration> {
  auto count = int64_t{0};
  const auto* first = str.data();
  const auto* last = str.data() + str.size();
  auto [ptr, errc] = std::from_chars(first, last, count);
  if (errc != std::errc{} or count < 0)
    return caf::make_error(ec::parse_error,
                           fmt::format("invalid duration `{}`", str));
  const auto unit = std::string_view{ptr, static_cast<size_t>(last - ptr)};
  auto scale = int64_t{0};
  if (unit == "ns")
    scale = 1;
  else if (unit == "us")
    scale = 1'000;
  else if (unit == "ms")
    scale = 1'000'000;
  else if (unit == "s")
    scale = 1'000'000'000;
  else if (unit == "min")
    scale = int64_t{60} * 1'000'000'000;
  else if (unit == "h")
    scale = int64_t{3'600} * 1'000'000'000;
  else if (unit.empty() and count == 0)
    return duration::zero();
  else
    return caf::make_error(ec::parse_error,
                           fmt::format("invalid duration unit in `{}`; "
                                       "expected ns, us, ms, s, min, or h",
                                       str));
  if (count > std::numeric_limits<int64_t>::max() / scale)
    return caf::make_error(ec::parse_error,
                           fmt::format("duration `{}` is out of range", str));
  return duration{count * scale};
}

auto parse_config(std::string_view yaml) -> caf::expected<exporter_config> {
  auto node = YAML::Node{};
  try {
    node = YAML::Load(std::string{yaml});
  } catch (const YAML::Exception& e) {
    return yaml_error(e);
  }
  return parse_document(node);
}

auto load_config(const std::filesystem::path& path)
  -> caf::expected<exporter_config> {
  auto node = YAML::Node{};
  try {
    node = YAML::LoadFile(path.string());
  } catch (const YAML::BadFile&) {
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open configuration file {}",
                                       path.string()));
  } catch (const YAML::Exception& e) {
    return add_context(yaml_error(e), "failed to load {}", path.string());
  }
  auto result = parse_document(node);
  if (not result)
    return add_context(result.error(), "failed to load {}", path.string());
  if (auto err = result->validate())
    return add_context(err, "invalid configuration in {}", path.string());
  LOGSHIP_DEBUG("loaded configuration for {} from {}", result->endpoint,
                path.string());
  return result;
}

} // namespace logship
