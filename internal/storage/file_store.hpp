#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace chunkcam::storage {

struct FileInfo {
  std::filesystem::path path;
  std::string           name;
  uint64_t              size_bytes = 0;
  util::TimePoint       created_at;
};

struct StorageInfo {
  uint64_t                   total_size_bytes = 0;
  uint64_t                   file_count       = 0;
  std::optional<std::string> oldest_file_name;
  std::optional<std::string> newest_file_name;
};

struct StorageStats {
  StorageInfo info;
  uint64_t    free_bytes    = 0;
  uint64_t    max_bytes     = 0;
  double      usage_percent = 0.0;
};

struct EvictionResult {
  uint64_t deleted_count   = 0;
  uint64_t freed_bytes     = 0;
  uint64_t remaining_bytes = 0;
};

/*
  Owns the on-disk chunk directory.

  The File Store is the only component that deletes chunk files. Eviction
  (quota and age) never touches a file the protected-path predicate claims;
  the composition root wires that predicate to the upload queue so files of
  pending or uploading items survive a cleanup pass.
*/
class FileStore {
 public:
  using ProtectedPathPredicate = std::function<bool(const std::filesystem::path&)>;
  using FreeSpaceProbe         = std::function<uint64_t(const std::filesystem::path&)>;

  static constexpr uint64_t kSafetyMarginBytes   = 100ull * 1024 * 1024;
  static constexpr double   kEvictionTargetRatio = 0.8;

  FileStore(std::filesystem::path root, std::shared_ptr<util::ClockSource> clock);

  const std::filesystem::path& Root() const {
    return root_;
  }

  void SetProtectedPathPredicate(ProtectedPathPredicate predicate);
  void SetFreeSpaceProbe(FreeSpaceProbe probe);

  void EnsureDirectory() const;

  // Moves `source` into the chunk directory as `file_name` and returns the new path.
  std::filesystem::path Adopt(const std::filesystem::path& source, const std::string& file_name) const;

  // Newest first. A missing directory is an empty listing.
  std::vector<FileInfo> ListFiles() const;
  StorageInfo           Info() const;
  StorageStats          Stats(uint64_t max_bytes) const;

  // No-op unless the total exceeds max_bytes; then deletes oldest first down
  // to kEvictionTargetRatio * max_bytes.
  EvictionResult EnforceQuota(uint64_t max_bytes);
  uint64_t       DeleteOlderThan(std::chrono::hours max_age);
  uint64_t       ClearAll();

  // True when the file is gone afterwards. Never throws.
  bool Remove(const std::filesystem::path& path) const;

  uint64_t EstimateFreeSpace() const;
  bool     HasEnoughSpace(uint64_t estimated_bytes) const;

  static uint64_t EstimateChunkBytes(uint32_t duration_minutes, const std::string& quality);

 private:
  bool IsProtected(const std::filesystem::path& path) const;

  std::filesystem::path              root_;
  std::shared_ptr<util::ClockSource> clock_;
  ProtectedPathPredicate             is_protected_;
  FreeSpaceProbe                     free_space_probe_;
};

} // namespace chunkcam::storage
