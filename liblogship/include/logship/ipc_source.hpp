//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#include "logship/signal.hpp"

#include <caf/expected.hpp>

#include <filesystem>
#include <memory>
#include <vector>

namespace logship {

using record_batches = std::vector<std::shared_ptr<arrow::RecordBatch>>;

/// Reads all record batches of an Arrow IPC stream file.
/// @returns the batches in stream order, `ec::filesystem_error` if the file
/// cannot be opened, or `ec::decode_error` if the stream is malformed.
auto read_ipc_stream(const std::filesystem::path& path)
  -> caf::expected<record_batches>;

/// Pairs the i-th batch of `logs` with the i-th batches of the attribute
/// tables. Attribute sequences may be shorter than `logs` or empty, in which
/// case the remaining signals carry no attribute table.
auto make_signals(const record_batches& logs, const record_batches& log_attrs,
                  const record_batches& resource_attrs)
  -> std::vector<otap_signal>;

} // namespace logship
