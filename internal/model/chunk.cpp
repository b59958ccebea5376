#include "chunk.hpp"

#include <system_error>
#include <utility>

#include "internal/util/errors.hpp"

namespace chunkcam::model {

namespace fs = std::filesystem;

namespace {

uint64_t VerifiedSize(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw util::PersistenceError("chunk file does not exist: " + path.string());
  }

  const auto size = fs::file_size(path, ec);
  if (ec) {
    throw util::PersistenceError("cannot stat chunk file " + path.string() + ": " + ec.message());
  }
  if (size == 0) {
    throw util::PersistenceError("chunk file is empty: " + path.string());
  }
  return static_cast<uint64_t>(size);
}

} // namespace

Chunk::Chunk(fs::path path, uint64_t size_bytes, uint64_t duration_ms, uint64_t recorded_at_ms, uint32_t sequence_index)
    : path_(std::move(path)), size_bytes_(size_bytes), duration_ms_(duration_ms), recorded_at_ms_(recorded_at_ms), sequence_index_(sequence_index) {
}

Chunk Chunk::FromFile(const fs::path& path, uint64_t duration_ms, uint64_t recorded_at_ms, uint32_t sequence_index) {
  return Chunk(path, VerifiedSize(path), duration_ms, recorded_at_ms, sequence_index);
}

} // namespace chunkcam::model
