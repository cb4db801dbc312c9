//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#include <caf/error.hpp>
#include <curl/curl.h>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace logship::curl {

/// Converts a curl result into an upload error. `CURLE_OK` maps to the
/// default-constructed error.
auto to_error(CURLcode code) -> caf::error;

/// An append-only list of HTTP request headers.
class header_list {
public:
  /// Adds the header `name: value`.
  auto add(std::string_view name, std::string_view value) -> caf::error;

  auto get() const noexcept -> curl_slist* {
    return list_.get();
  }

  auto empty() const noexcept -> bool {
    return list_ == nullptr;
  }

private:
  struct deleter {
    void operator()(curl_slist* ptr) const noexcept {
      curl_slist_free_all(ptr);
    }
  };

  std::unique_ptr<curl_slist, deleter> list_;
};

/// Owns a `CURL` easy handle configured for a single POST at a time.
///
/// Options set on the handle persist across transfers until `reset`. The
/// handle keeps the header list and the response sink alive until then, but
/// not the request body.
class easy {
public:
  easy();

  auto set(CURLoption option, long value) -> caf::error;

  /// @pre `value` outlives the next call to `perform`.
  auto set(CURLoption option, const char* value) -> caf::error;

  auto set(CURLoption option, const std::string& value) -> caf::error {
    return set(option, value.c_str());
  }

  /// Sets the POST body without copying it.
  /// @pre `body` outlives the next call to `perform`.
  auto set_body(std::span<const std::byte> body) -> caf::error;

  /// Replaces the request headers.
  auto set_headers(header_list headers) -> caf::error;

  /// Appends every byte of the response body to `sink`.
  auto capture_response(std::string& sink) -> caf::error;

  /// Runs the transfer synchronously.
  auto perform() -> caf::error;

  /// Returns the HTTP status of the last transfer, or 0 if there was none.
  auto response_code() const -> long;

  /// Restores the default options and releases the header list.
  void reset();

private:
  struct deleter {
    void operator()(CURL* ptr) const noexcept {
      curl_easy_cleanup(ptr);
    }
  };

  std::unique_ptr<CURL, deleter> handle_;
  header_list headers_;
};

} // namespace logship::curl
