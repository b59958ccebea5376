#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include "internal/model/chunk.hpp"
#include "internal/model/upload_state.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using chunkcam::model::CanTransition;
using chunkcam::model::Chunk;
using chunkcam::model::IsTerminal;
using chunkcam::testing::TempDir;
using chunkcam::testing::WriteFile;
using namespace chunkcam::v1;

template <typename Fn>
std::string PersistenceMessage(Fn&& fn) {
  try {
    fn();
  } catch (const chunkcam::util::PersistenceError& e) {
    return e.what();
  }
  return {};
}

void TestChunkFromFileCapturesSize() {
  TempDir    dir("chunkcam_model");
  const auto path  = WriteFile(dir.path() / "rec_dev_0.mp4", 321);
  const auto chunk = Chunk::FromFile(path, 300000, 1714566605123ull, 4);

  assert(chunk.path() == path);
  assert(chunk.file_name() == "rec_dev_0.mp4");
  assert(chunk.size_bytes() == 321);
  assert(chunk.duration_ms() == 300000);
  assert(chunk.recorded_at_ms() == 1714566605123ull);
  assert(chunk.sequence_index() == 4);
}

void TestChunkRejectsMissingOrEmptyFile() {
  TempDir dir("chunkcam_model");

  const auto missing = PersistenceMessage([&] { Chunk::FromFile(dir.path() / "nope.mp4", 1, 1, 0); });
  assert(missing.find("does not exist") != std::string::npos);

  const auto empty_path = WriteFile(dir.path() / "empty.mp4", 0);
  const auto empty      = PersistenceMessage([&] { Chunk::FromFile(empty_path, 1, 1, 0); });
  assert(empty.find("empty") != std::string::npos);

  const auto directory = PersistenceMessage([&] { Chunk::FromFile(dir.path(), 1, 1, 0); });
  assert(!directory.empty());
}

void TestUploadTransitions() {
  assert(CanTransition(UPLOAD_STATUS_PENDING, UPLOAD_STATUS_UPLOADING));
  assert(CanTransition(UPLOAD_STATUS_UPLOADING, UPLOAD_STATUS_COMPLETED));
  assert(CanTransition(UPLOAD_STATUS_UPLOADING, UPLOAD_STATUS_PENDING));
  assert(CanTransition(UPLOAD_STATUS_UPLOADING, UPLOAD_STATUS_FAILED));
  assert(CanTransition(UPLOAD_STATUS_FAILED, UPLOAD_STATUS_PENDING));

  assert(!CanTransition(UPLOAD_STATUS_PENDING, UPLOAD_STATUS_COMPLETED));
  assert(!CanTransition(UPLOAD_STATUS_PENDING, UPLOAD_STATUS_FAILED));
  assert(!CanTransition(UPLOAD_STATUS_COMPLETED, UPLOAD_STATUS_PENDING));
  assert(!CanTransition(UPLOAD_STATUS_FAILED, UPLOAD_STATUS_UPLOADING));
  assert(!CanTransition(UPLOAD_STATUS_UNSPECIFIED, UPLOAD_STATUS_PENDING));

  assert(IsTerminal(UPLOAD_STATUS_COMPLETED));
  assert(IsTerminal(UPLOAD_STATUS_FAILED));
  assert(!IsTerminal(UPLOAD_STATUS_UPLOADING));

  assert(std::string(chunkcam::model::StatusName(UPLOAD_STATUS_UPLOADING)) == "uploading");
}

void TestFileSafeTimestamp() {
  const auto tp = chunkcam::util::FromUnixMillis(1714566605123ull);
  assert(chunkcam::util::ToFileSafeIso8601(tp) == "2024-05-01T12-30-05-123Z");
  assert(chunkcam::util::ToFileSafeIso8601(chunkcam::util::FromUnixMillis(7)) == "1970-01-01T00-00-00-007Z");
  assert(chunkcam::util::ToUnixMillis(tp) == 1714566605123ull);
}

void TestUuidFormat() {
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i) {
    const auto id = chunkcam::util::GenerateUUIDString();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(chunkcam::util::ToString(chunkcam::util::FromString(id)) == id);
    seen.insert(id);
  }
  assert(seen.size() == 64);

  bool threw = false;
  try {
    chunkcam::util::FromString("0123456789abcdef0123456789abcdef0123");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestChunkFromFileCapturesSize();
  TestChunkRejectsMissingOrEmptyFile();
  TestUploadTransitions();
  TestFileSafeTimestamp();
  TestUuidFormat();

  std::cout << "chunkcam_unit_model: pass\n";
  return 0;
}
