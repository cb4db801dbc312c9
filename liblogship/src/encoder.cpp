//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/encoder.hpp"

#include "logship/error.hpp"
#include "logship/logger.hpp"

#include <arrow/util/utf8.h>
#include <fmt/format.h>

#include <iterator>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace logship {

namespace {

void append_escaped_char(std::string& out, char c) {
  switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
        fmt::format_to(std::back_inserter(out), "\\u{:04x}",
                       static_cast<unsigned char>(c));
      else
        out += c;
  }
}

/// Returns the length of the UTF-8 sequence that `lead` starts, or 0 if no
/// sequence can start with it.
auto sequence_length(unsigned char lead) -> size_t {
  if (lead < 0x80)
    return 1;
  if (lead >= 0xc2 and lead <= 0xdf)
    return 2;
  if (lead >= 0xe0 and lead <= 0xef)
    return 3;
  if (lead >= 0xf0 and lead <= 0xf4)
    return 4;
  return 0;
}

void append_escaped(std::string& out, std::string_view str) {
  out += '"';
  if (arrow::util::ValidateUTF8(str)) {
    for (auto c : str)
      append_escaped_char(out, c);
  } else {
    // Every byte that does not begin a valid sequence becomes U+FFFD.
    auto i = size_t{0};
    while (i < str.size()) {
      const auto n = sequence_length(static_cast<unsigned char>(str[i]));
      const auto sequence = str.substr(i, n);
      if (n > 0 and sequence.size() == n
          and arrow::util::ValidateUTF8(sequence)) {
        for (auto c : sequence)
          append_escaped_char(out, c);
        i += n;
      } else {
        out += "\\ufffd";
        ++i;
      }
    }
  }
  out += '"';
}

void append_hex(std::string& out, const blob& bytes) {
  out += '"';
  for (auto byte : bytes)
    fmt::format_to(std::back_inserter(out), "{:02x}",
                   std::to_integer<unsigned>(byte));
  out += '"';
}

void append_key(std::string& out, bool& first, std::string_view key) {
  if (not first)
    out += ',';
  first = false;
  append_escaped(out, key);
  out += ':';
}

} // namespace

auto to_json(const log_record& record) -> std::string {
  auto out = std::string{"{"};
  auto first = true;
  if (record.time_unix_nano) {
    append_key(out, first, "time_unix_nano");
    fmt::format_to(std::back_inserter(out), "{}",
                   record.time_unix_nano->time_since_epoch().count());
  }
  if (record.observed_time_unix_nano) {
    append_key(out, first, "observed_time_unix_nano");
    fmt::format_to(std::back_inserter(out), "{}",
                   record.observed_time_unix_nano->time_since_epoch().count());
  }
  if (record.severity_number) {
    append_key(out, first, "severity_number");
    fmt::format_to(std::back_inserter(out), "{}", *record.severity_number);
  }
  if (record.severity_text) {
    append_key(out, first, "severity_text");
    append_escaped(out, *record.severity_text);
  }
  if (record.body) {
    append_key(out, first, "body");
    append_escaped(out, std::get<std::string>(*record.body));
  }
  if (not record.trace_id.empty()) {
    append_key(out, first, "trace_id");
    append_hex(out, record.trace_id);
  }
  if (not record.span_id.empty()) {
    append_key(out, first, "span_id");
    append_hex(out, record.span_id);
  }
  if (record.flags) {
    append_key(out, first, "flags");
    fmt::format_to(std::back_inserter(out), "{}", *record.flags);
  }
  if (not record.attributes.empty()) {
    append_key(out, first, "attributes");
    out += '{';
    auto first_attribute = true;
    for (const auto& [key, value] : record.attributes) {
      append_key(out, first_attribute, key);
      if (const auto* str = std::get_if<std::string>(&value))
        append_escaped(out, *str);
      else
        fmt::format_to(std::back_inserter(out), "{}", std::get<int64_t>(value));
    }
    out += '}';
  }
  if (record.event_name) {
    append_key(out, first, "event_name");
    append_escaped(out, *record.event_name);
  }
  out += '}';
  return out;
}

ndjson_encoder::ndjson_encoder(ndjson_encoder_options options)
  : options_{std::move(options)} {
}

auto ndjson_encoder::encode(std::span<const log_record> records)
  -> caf::expected<std::vector<encoded_batch>> {
  if (options_.max_batch_bytes == 0)
    return caf::make_error(ec::encode_error,
                           "max_batch_bytes must be greater than zero");
  // Group by event name in order of first appearance.
  auto groups = std::vector<std::pair<std::string_view, std::vector<size_t>>>{};
  auto group_index = std::unordered_map<std::string_view, size_t>{};
  for (auto i = size_t{0}; i < records.size(); ++i) {
    auto name = std::string_view{records[i].event_name
                                   ? *records[i].event_name
                                   : options_.default_event_name};
    auto [it, inserted] = group_index.try_emplace(name, groups.size());
    if (inserted)
      groups.emplace_back(name, std::vector<size_t>{});
    groups[it->second].second.push_back(i);
  }
  auto result = std::vector<encoded_batch>{};
  for (const auto& [name, indices] : groups) {
    auto current = encoded_batch{std::string{name}, {}, 0};
    for (auto index : indices) {
      auto line = to_json(records[index]);
      line += '\n';
      if (not current.data.empty()
          and current.data.size() + line.size() > options_.max_batch_bytes) {
        result.push_back(std::move(current));
        current = encoded_batch{std::string{name}, {}, 0};
      }
      const auto* bytes = reinterpret_cast<const std::byte*>(line.data());
      current.data.insert(current.data.end(), bytes, bytes + line.size());
      ++current.num_records;
    }
    if (current.num_records > 0)
      result.push_back(std::move(current));
  }
  LOGSHIP_DEBUG("encoded {} records into {} batches", records.size(),
                result.size());
  return result;
}

} // namespace logship
