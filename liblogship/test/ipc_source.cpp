//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/ipc_source.hpp"

#include "logship/arrow_utils.hpp"
#include "logship/error.hpp"
#include "logship/test/fixtures/otap.hpp"
#include "logship/test/test.hpp"

#include <arrow/io/file.h>
#include <arrow/ipc/writer.h>

#include <filesystem>
#include <fstream>

using namespace logship;
using namespace logship::fixtures;

namespace {

void write_stream(const std::filesystem::path& path,
                  const record_batches& batches) {
  auto out = check(arrow::io::FileOutputStream::Open(path.string()));
  auto writer
    = check(arrow::ipc::MakeStreamWriter(out, batches.front()->schema()));
  for (const auto& batch : batches)
    check(writer->WriteRecordBatch(*batch));
  check(writer->Close());
  check(out->Close());
}

} // namespace

TEST("read all batches of a stream") {
  auto path = std::filesystem::temp_directory_path() / "logship-logs.arrows";
  auto first = make_logs({{.body = "a"}, {.body = "b"}});
  auto second = make_logs({{.body = "c"}});
  write_stream(path, {first, second});
  auto batches = unbox(read_ipc_stream(path));
  REQUIRE_EQUAL(batches.size(), size_t{2});
  CHECK_EQUAL(batches[0]->num_rows(), 2);
  CHECK_EQUAL(batches[1]->num_rows(), 1);
  CHECK(batches[0]->Equals(*first));
  std::filesystem::remove(path);
}

TEST("missing files and malformed streams") {
  auto path = std::filesystem::temp_directory_path() / "logship-missing.arrows";
  std::filesystem::remove(path);
  auto missing = read_ipc_stream(path);
  REQUIRE(not missing);
  CHECK_EQUAL(missing.error(), ec::filesystem_error);
  {
    auto out = std::ofstream{path};
    out << "this is not an Arrow IPC stream";
  }
  auto malformed = read_ipc_stream(path);
  REQUIRE(not malformed);
  CHECK_EQUAL(malformed.error(), ec::decode_error);
  std::filesystem::remove(path);
}

TEST("zip batches into signals") {
  auto logs = record_batches{make_logs({{}}), make_logs({{}}),
                             make_logs({{}})};
  auto attrs = record_batches{make_attrs({})};
  auto signals = make_signals(logs, attrs, {});
  REQUIRE_EQUAL(signals.size(), size_t{3});
  for (const auto& signal : signals)
    CHECK(signal.type == signal_type::logs);
  const auto& first = std::get<otap_batch>(signals[0].payload);
  CHECK(first.logs == logs[0]);
  CHECK(first.log_attrs == attrs[0]);
  CHECK(first.resource_attrs == nullptr);
  const auto& last = std::get<otap_batch>(signals[2].payload);
  CHECK(last.logs == logs[2]);
  CHECK(last.log_attrs == nullptr);
}
