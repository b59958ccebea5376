#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkcam::model {

/*
  A completed, durable video segment.

  Only constructible through FromFile, which confirms the file exists and is
  non-empty. Immutable afterwards.
*/
class Chunk {
 public:
  static Chunk FromFile(const std::filesystem::path& path, uint64_t duration_ms, uint64_t recorded_at_ms, uint32_t sequence_index);

  const std::filesystem::path& path() const {
    return path_;
  }
  std::string file_name() const {
    return path_.filename().string();
  }
  uint64_t size_bytes() const {
    return size_bytes_;
  }
  uint64_t duration_ms() const {
    return duration_ms_;
  }
  uint64_t recorded_at_ms() const {
    return recorded_at_ms_;
  }
  uint32_t sequence_index() const {
    return sequence_index_;
  }

 private:
  Chunk(std::filesystem::path path, uint64_t size_bytes, uint64_t duration_ms, uint64_t recorded_at_ms, uint32_t sequence_index);

  std::filesystem::path path_;
  uint64_t              size_bytes_;
  uint64_t              duration_ms_;
  uint64_t              recorded_at_ms_;
  uint32_t              sequence_index_;
};

} // namespace chunkcam::model
