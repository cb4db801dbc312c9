//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/http_uploader.hpp"

#include "logship/config.hpp"
#include "logship/error.hpp"
#include "logship/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <utility>

namespace logship {

auto make_upload_headers(const exporter_config& config,
                         std::string_view event_name)
  -> std::vector<std::pair<std::string, std::string>> {
  auto result = std::vector<std::pair<std::string, std::string>>{
    {"Content-Type", "application/x-ndjson"},
    {"User-Agent", fmt::format("logship/{}", LOGSHIP_VERSION)},
    {"X-Logship-Event", std::string{event_name}},
    {"X-Logship-Namespace", config.namespace_name},
    {"X-Logship-Account", config.account},
    {"X-Logship-Environment", config.environment},
    {"X-Logship-Region", config.region},
    {"X-Logship-Tenant", config.tenant},
    {"X-Logship-Role", config.role_name},
    {"X-Logship-Role-Instance", config.role_instance},
    {"X-Logship-Config-Version",
     fmt::format("Ver{}v0", config.config_major_version)},
  };
  // Selects a user-assigned identity on the receiving side.
  if (config.auth == auth_method::managed_identity
      and not config.managed_identity_client_id.empty())
    result.emplace_back("X-Logship-Identity-Client-Id",
                        config.managed_identity_client_id);
  return result;
}

auto access_token(const exporter_config& config)
  -> caf::expected<std::string> {
  const auto* token = std::getenv(access_token_variable);
  if (token == nullptr or *token == '\0')
    return caf::make_error(ec::upload_error,
                           fmt::format("{} authentication requires an access "
                                       "token in {}",
                                       config.auth, access_token_variable));
  return std::string{token};
}

auto http_uploader_state::prepare(const encoded_batch& batch) -> caf::error {
  easy.reset();
  response.clear();
  auto headers = curl::header_list{};
  for (const auto& [header, value] : make_upload_headers(config,
                                                         batch.event_name))
    if (auto err = headers.add(header, value))
      return err;
  switch (config.auth) {
    case auth_method::certificate:
      if (auto err = easy.set(CURLOPT_SSLCERTTYPE, "P12"))
        return err;
      if (auto err = easy.set(CURLOPT_SSLCERT, config.cert_path))
        return err;
      if (not config.cert_password.empty())
        if (auto err = easy.set(CURLOPT_KEYPASSWD, config.cert_password))
          return err;
      break;
    case auth_method::managed_identity:
    case auth_method::workload_identity: {
      auto token = access_token(config);
      if (not token)
        return token.error();
      if (auto err
          = headers.add("Authorization", fmt::format("Bearer {}", *token)))
        return err;
      break;
    }
  }
  const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
    config.upload_timeout);
  if (auto err = easy.set(CURLOPT_URL, config.endpoint))
    return err;
  if (auto err = easy.set(CURLOPT_NOSIGNAL, 1L))
    return err;
  if (auto err = easy.set(CURLOPT_POST, 1L))
    return err;
  if (auto err
      = easy.set(CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count())))
    return err;
  // The handle does not copy the body, so the batch must stay alive until the
  // transfer completes.
  if (auto err = easy.set_body(batch.data))
    return err;
  if (auto err = easy.set_headers(std::move(headers)))
    return err;
  return easy.capture_response(response);
}

auto http_uploader_state::upload(const encoded_batch& batch) -> caf::error {
  if (auto err = prepare(batch))
    return add_context(err, "failed to prepare request");
  if (auto err = easy.perform())
    return err;
  const auto status = easy.response_code();
  if (status >= 400) {
    constexpr auto max_excerpt = size_t{256};
    auto excerpt = std::string_view{response}.substr(
      0, std::min(response.size(), max_excerpt));
    return caf::make_error(ec::upload_error,
                           fmt::format("HTTP status {} from {}: {}", status,
                                       config.endpoint, excerpt));
  }
  LOGSHIP_DEBUG("{} posted {} records ({} bytes) of event {} with status {}",
                name, batch.num_records, batch.data.size(), batch.event_name,
                status);
  return {};
}

auto http_uploader(uploader_actor::stateful_pointer<http_uploader_state> self,
                   exporter_config config) -> uploader_actor::behavior_type {
  self->state().self = self;
  self->state().config = std::move(config);
  LOGSHIP_VERBOSE("{} posts to {} with {} authentication",
                  http_uploader_state::name, self->state().config.endpoint,
                  self->state().config.auth);
  return {
    [self](atom::upload, const encoded_batch& batch) -> caf::result<void> {
      if (auto err = self->state().upload(batch))
        return err;
      return {};
    },
  };
}

} // namespace logship
