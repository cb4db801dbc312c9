//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/ipc_source.hpp"

#include "logship/error.hpp"
#include "logship/logger.hpp"

#include <arrow/io/file.h>
#include <arrow/ipc/reader.h>
#include <arrow/record_batch.h>
#include <fmt/format.h>

namespace logship {

auto read_ipc_stream(const std::filesystem::path& path)
  -> caf::expected<record_batches> {
  auto file = arrow::io::ReadableFile::Open(path.string());
  if (not file.ok())
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open {}: {}", path.string(),
                                       file.status().ToString()));
  auto reader = arrow::ipc::RecordBatchStreamReader::Open(*file);
  if (not reader.ok())
    return caf::make_error(ec::decode_error,
                           fmt::format("failed to open stream reader for {}: "
                                       "{}",
                                       path.string(),
                                       reader.status().ToString()));
  auto result = record_batches{};
  while (true) {
    auto batch = std::shared_ptr<arrow::RecordBatch>{};
    auto status = (*reader)->ReadNext(&batch);
    if (not status.ok())
      return caf::make_error(ec::decode_error,
                             fmt::format("failed to read record batch {} of "
                                         "{}: {}",
                                         result.size(), path.string(),
                                         status.ToString()));
    // The reader signals the end of the stream with a null batch.
    if (not batch)
      break;
    result.push_back(std::move(batch));
  }
  LOGSHIP_DEBUG("read {} record batches from {}", result.size(),
                path.string());
  return result;
}

auto make_signals(const record_batches& logs, const record_batches& log_attrs,
                  const record_batches& resource_attrs)
  -> std::vector<otap_signal> {
  auto at = [](const record_batches& xs, size_t i) {
    return i < xs.size() ? xs[i] : nullptr;
  };
  auto result = std::vector<otap_signal>{};
  result.reserve(logs.size());
  for (auto i = size_t{0}; i < logs.size(); ++i) {
    result.push_back(otap_signal{
      .type = signal_type::logs,
      .payload = otap_batch{
        .logs = logs[i],
        .log_attrs = at(log_attrs, i),
        .resource_attrs = at(resource_attrs, i),
      },
    });
  }
  if (log_attrs.size() > logs.size() or resource_attrs.size() > logs.size())
    LOGSHIP_WARN("ignoring attribute batches without a matching logs batch");
  return result;
}

} // namespace logship
