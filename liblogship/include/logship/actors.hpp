//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#include "logship/atoms.hpp"
#include "logship/encoder.hpp"
#include "logship/metrics.hpp"
#include "logship/signal.hpp"

#include <caf/timestamp.hpp>
#include <caf/typed_actor.hpp>

namespace logship {

/// Collects the handlers of a typed actor interface.
template <class... Fs>
struct typed_actor_fwd {
  using unwrap = caf::typed_actor<Fs...>;
};

/// The UPLOADER actor interface.
using uploader_actor = typed_actor_fwd<
  // Transmits one encoded batch. Responds with an error if the remote side
  // did not accept it.
  auto(atom::upload, encoded_batch)->caf::result<void>>::unwrap;

/// The EXPORTER actor interface.
using exporter_actor = typed_actor_fwd<
  // Decodes, encodes, and uploads one signal. The response acknowledges the
  // signal, an error response rejects it.
  auto(atom::consume, otap_signal)->caf::result<void>,
  // Reports the current counters.
  auto(atom::metrics)->caf::result<exporter_metrics>,
  // Finishes accepted work and stops.
  auto(atom::shutdown, caf::timestamp)->caf::result<terminal_state>>::unwrap;

} // namespace logship
