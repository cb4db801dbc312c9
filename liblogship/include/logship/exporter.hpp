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
#include "logship/defaults.hpp"
#include "logship/metrics.hpp"
#include "logship/retry_policy.hpp"
#include "logship/signal.hpp"

#include <caf/error.hpp>
#include <caf/timespan.hpp>
#include <caf/timestamp.hpp>
#include <caf/typed_event_based_actor.hpp>
#include <caf/typed_response_promise.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace logship {

/// The lifecycle of an exporter.
enum class exporter_phase : uint8_t {
  /// Accepts data and control messages.
  running,
  /// A shutdown arrived while a signal was in flight.
  draining,
  /// Terminal. The actor quits after entering this phase.
  stopped,
};

/// @relates exporter_phase
auto to_string(exporter_phase x) -> std::string_view;

/// Tuning knobs of an exporter.
struct exporter_options {
  /// Governs the attempts of every batch.
  retry_policy retry = {};
  /// The timeout of a single upload request to the uploader actor. Must
  /// exceed the transfer timeout of the uploader.
  caf::timespan upload_timeout = defaults::exporter::upload_timeout
                                 + defaults::exporter::request_timeout_margin;
  /// The number of data messages that may wait behind the signal in flight.
  size_t upload_queue_size = defaults::exporter::upload_queue_size;
};

/// The batches of the signal in flight.
struct pending_signal {
  caf::typed_response_promise<void> rp;
  std::vector<encoded_batch> batches;
  size_t next = 0;
  caf::error first_error = {};
};

/// A message that arrived while a signal was in flight.
using deferred_message = std::variant<
  std::pair<otap_signal, caf::typed_response_promise<void>>,
  caf::typed_response_promise<exporter_metrics>,
  std::pair<caf::timestamp, caf::typed_response_promise<terminal_state>>>;

class exporter_state {
public:
  // -- constants --------------------------------------------------------------

  static inline constexpr auto name = "exporter";

  // -- constructors, destructors, and assignment operators --------------------

  exporter_state() = default;

  // -- member functions -------------------------------------------------------

  /// Starts working on a signal.
  auto process(otap_signal signal, caf::typed_response_promise<void> rp)
    -> void;

  /// Uploads the next non-empty batch of the signal in flight.
  auto upload_next(std::shared_ptr<pending_signal> pending) -> void;

  /// Acknowledges or rejects a signal and picks up deferred messages.
  auto complete(caf::typed_response_promise<void>& rp, caf::error err)
    -> void;

  /// Handles deferred messages until the next signal goes in flight.
  auto resume() -> void;

  /// Reports the terminal state and quits.
  auto stop(caf::timestamp deadline,
            caf::typed_response_promise<terminal_state> rp) -> void;

  // -- data members -----------------------------------------------------------

  exporter_actor::pointer self = nullptr;

  exporter_options options = {};

  /// Turns decoded records into batches.
  std::shared_ptr<encoder> enc;

  /// Transmits batches.
  uploader_actor uploader;

  exporter_metrics metrics = {};

  exporter_phase phase = exporter_phase::running;

  /// Whether a signal is in flight.
  bool busy = false;

  /// Guards against reentrant calls to `resume`.
  bool resuming = false;

  std::deque<deferred_message> deferred;
};

/// Spawns an EXPORTER.
/// @param self The actor handle.
/// @param options The retry and queueing configuration.
/// @param enc The encoder for decoded records.
/// @param uploader The actor that transmits encoded batches.
auto exporter(exporter_actor::stateful_pointer<exporter_state> self,
              exporter_options options, std::shared_ptr<encoder> enc,
              uploader_actor uploader) -> exporter_actor::behavior_type;

} // namespace logship

template <>
struct fmt::formatter<logship::exporter_phase>
  : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(logship::exporter_phase x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(logship::to_string(x), ctx);
  }
};
