//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#include "logship/actors.hpp"
#include "logship/curl.hpp"
#include "logship/exporter_config.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/typed_event_based_actor.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace logship {

/// The environment variable holding the bearer token for identity-based
/// authentication.
inline constexpr auto access_token_variable = "LOGSHIP_ACCESS_TOKEN";

/// Returns the HTTP headers that identify a batch and its origin.
auto make_upload_headers(const exporter_config& config,
                         std::string_view event_name)
  -> std::vector<std::pair<std::string, std::string>>;

/// Looks up the bearer token for identity-based authentication.
/// @returns the token or `ec::upload_error` if it is not set.
auto access_token(const exporter_config& config) -> caf::expected<std::string>;

class http_uploader_state {
public:
  // -- constants --------------------------------------------------------------

  static inline constexpr auto name = "http-uploader";

  // -- constructors, destructors, and assignment operators --------------------

  http_uploader_state() = default;

  // -- member functions -------------------------------------------------------

  /// Resets the handle and configures it for posting `batch`.
  auto prepare(const encoded_batch& batch) -> caf::error;

  /// Posts `batch` to the endpoint and checks the response status.
  auto upload(const encoded_batch& batch) -> caf::error;

  // -- data members -----------------------------------------------------------

  uploader_actor::pointer self = nullptr;

  exporter_config config = {};

  curl::easy easy;

  /// The body of the last response.
  std::string response;
};

/// Spawns an UPLOADER that posts batches over HTTP. Spawn it detached, because
/// every request blocks until the transfer completes.
/// @param self The actor handle.
/// @param config The endpoint, identity, and authentication settings.
auto http_uploader(uploader_actor::stateful_pointer<http_uploader_state> self,
                   exporter_config config) -> uploader_actor::behavior_type;

} // namespace logship
