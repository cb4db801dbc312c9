//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/curl.hpp"

#include "logship/error.hpp"
#include "logship/panic.hpp"

#include <fmt/format.h>

namespace logship::curl {

namespace {

auto append_to_string(char* data, size_t size, size_t count, void* user_data)
  -> size_t {
  auto* sink = static_cast<std::string*>(user_data);
  sink->append(data, size * count);
  return size * count;
}

} // namespace

auto to_error(CURLcode code) -> caf::error {
  if (code == CURLE_OK)
    return {};
  return caf::make_error(ec::upload_error,
                         fmt::format("curl: {}", curl_easy_strerror(code)));
}

auto header_list::add(std::string_view name, std::string_view value)
  -> caf::error {
  LOGSHIP_ASSERT(not name.empty());
  // curl_slist_append copies the line and leaves the list untouched on
  // failure.
  const auto line = fmt::format("{}: {}", name, value);
  auto* head = curl_slist_append(list_.get(), line.c_str());
  if (head == nullptr)
    return caf::make_error(ec::upload_error,
                           fmt::format("curl: failed to add header {}", name));
  if (not list_)
    list_.reset(head);
  return {};
}

easy::easy() : handle_{curl_easy_init()} {
  LOGSHIP_ASSERT(handle_ != nullptr, "curl_easy_init failed");
}

auto easy::set(CURLoption option, long value) -> caf::error {
  return to_error(curl_easy_setopt(handle_.get(), option, value));
}

auto easy::set(CURLoption option, const char* value) -> caf::error {
  return to_error(curl_easy_setopt(handle_.get(), option, value));
}

auto easy::set_body(std::span<const std::byte> body) -> caf::error {
  if (auto err = to_error(curl_easy_setopt(
        handle_.get(), CURLOPT_POSTFIELDSIZE_LARGE,
        static_cast<curl_off_t>(body.size()))))
    return err;
  return to_error(
    curl_easy_setopt(handle_.get(), CURLOPT_POSTFIELDS, body.data()));
}

auto easy::set_headers(header_list headers) -> caf::error {
  headers_ = std::move(headers);
  return to_error(
    curl_easy_setopt(handle_.get(), CURLOPT_HTTPHEADER, headers_.get()));
}

auto easy::capture_response(std::string& sink) -> caf::error {
  if (auto err = to_error(curl_easy_setopt(
        handle_.get(), CURLOPT_WRITEFUNCTION, append_to_string)))
    return err;
  return to_error(curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, &sink));
}

auto easy::perform() -> caf::error {
  return to_error(curl_easy_perform(handle_.get()));
}

auto easy::response_code() const -> long {
  auto status = long{0};
  if (curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &status)
      != CURLE_OK)
    return 0;
  return status;
}

void easy::reset() {
  curl_easy_reset(handle_.get());
  headers_ = {};
}

} // namespace logship::curl
