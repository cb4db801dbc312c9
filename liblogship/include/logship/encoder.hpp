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
#include "logship/log_record.hpp"

#include <caf/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace logship {

/// A transmittable unit of encoded log records.
struct encoded_batch {
  /// The event name shared by all records of the batch.
  std::string event_name;
  /// The encoded payload.
  blob data;
  /// The number of records in the payload.
  uint64_t num_records = 0;

  template <class Inspector>
  friend auto inspect(Inspector& f, encoded_batch& x) {
    return f.object(x)
      .pretty_name("logship.encoded_batch")
      .fields(f.field("event_name", x.event_name), f.field("data", x.data),
              f.field("num_records", x.num_records));
  }
};

/// Turns decoded log records into transmittable batches.
class encoder {
public:
  virtual ~encoder() noexcept = default;

  /// Encodes `records` into zero or more batches.
  virtual auto encode(std::span<const log_record> records)
    -> caf::expected<std::vector<encoded_batch>>
    = 0;
};

/// Options for the NDJSON encoder.
struct ndjson_encoder_options {
  /// Batches grow up to this many bytes before a new one starts.
  size_t max_batch_bytes = defaults::encoder::max_batch_bytes;
  /// The event name of records without one.
  std::string default_event_name = std::string{defaults::encoder::event_name};
};

/// Encodes every record as one JSON object per line, grouping records by
/// event name.
class ndjson_encoder final : public encoder {
public:
  explicit ndjson_encoder(ndjson_encoder_options options = {});

  auto encode(std::span<const log_record> records)
    -> caf::expected<std::vector<encoded_batch>> override;

private:
  ndjson_encoder_options options_;
};

/// Renders a single record as a JSON object without a trailing newline.
auto to_json(const log_record& record) -> std::string;

} // namespace logship
