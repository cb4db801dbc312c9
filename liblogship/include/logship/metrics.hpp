//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#include <caf/timestamp.hpp>

#include <cstdint>

namespace logship {

/// Monotonic counters of an exporter.
struct exporter_metrics {
  /// Signals received, including unsupported ones.
  uint64_t consumed = 0;
  /// Signals whose batches all uploaded successfully.
  uint64_t exported = 0;
  /// Signals that were negatively acknowledged.
  uint64_t failed = 0;
  /// Log records decoded from supported signals.
  uint64_t records = 0;
  /// Batches that uploaded successfully.
  uint64_t batches_exported = 0;
  /// Batches that failed after exhausting all attempts.
  uint64_t batches_failed = 0;
  /// Batches with an empty payload that were never uploaded.
  uint64_t batches_skipped = 0;
  /// Upload attempts beyond the first one of a batch.
  uint64_t upload_retries = 0;
  /// Attribute rows that did not reach any record.
  uint64_t dropped_attributes = 0;
  /// Signals rejected because the deferred queue was full.
  uint64_t rejected = 0;

  friend auto operator==(const exporter_metrics&, const exporter_metrics&)
    -> bool = default;

  template <class Inspector>
  friend auto inspect(Inspector& f, exporter_metrics& x) {
    return f.object(x)
      .pretty_name("logship.exporter_metrics")
      .fields(f.field("consumed", x.consumed),
              f.field("exported", x.exported), f.field("failed", x.failed),
              f.field("records", x.records),
              f.field("batches_exported", x.batches_exported),
              f.field("batches_failed", x.batches_failed),
              f.field("batches_skipped", x.batches_skipped),
              f.field("upload_retries", x.upload_retries),
              f.field("dropped_attributes", x.dropped_attributes),
              f.field("rejected", x.rejected));
  }
};

/// The final report of an exporter after shutdown.
struct terminal_state {
  /// The deadline passed with the shutdown request.
  caf::timestamp deadline;
  /// The counters at the time the exporter stopped.
  exporter_metrics metrics;

  template <class Inspector>
  friend auto inspect(Inspector& f, terminal_state& x) {
    return f.object(x)
      .pretty_name("logship.terminal_state")
      .fields(f.field("deadline", x.deadline), f.field("metrics", x.metrics));
  }
};

} // namespace logship
