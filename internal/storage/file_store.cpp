#include "file_store.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chunkcam::storage {

namespace fs = std::filesystem;

using chunkcam::observability::IntField;
using chunkcam::observability::StringField;

namespace {

// st_mtim is the closest thing to a creation time the platform offers
util::TimePoint ModifiedAt(const fs::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return util::TimePoint{};
  }
  return util::TimePoint{} + std::chrono::seconds(st.st_mtim.tv_sec) +
         std::chrono::duration_cast<util::Clock::duration>(std::chrono::nanoseconds(st.st_mtim.tv_nsec));
}

bool NewerThan(const FileInfo& a, const FileInfo& b) {
  if (a.created_at != b.created_at) return a.created_at > b.created_at;
  return a.name > b.name;
}

uint64_t DefaultFreeSpace(const fs::path& root) {
  std::error_code ec;

  // statvfs needs an existing path; walk up until one exists
  fs::path probe = root;
  while (!probe.empty() && !fs::exists(probe, ec)) probe = probe.parent_path();
  if (probe.empty()) probe = fs::current_path(ec);

  const auto info = fs::space(probe, ec);
  if (ec) {
    throw std::runtime_error("space query failed for " + probe.string() + ": " + ec.message());
  }
  return static_cast<uint64_t>(info.available);
}

} // namespace

FileStore::FileStore(fs::path root, std::shared_ptr<util::ClockSource> clock)
    : root_(std::move(root)), clock_(std::move(clock)), free_space_probe_(DefaultFreeSpace) {
}

void FileStore::SetProtectedPathPredicate(ProtectedPathPredicate predicate) {
  is_protected_ = std::move(predicate);
}

void FileStore::SetFreeSpaceProbe(FreeSpaceProbe probe) {
  free_space_probe_ = std::move(probe);
}

bool FileStore::IsProtected(const fs::path& path) const {
  return is_protected_ && is_protected_(path);
}

void FileStore::EnsureDirectory() const {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw util::PersistenceError("cannot create chunk directory " + root_.string() + ": " + ec.message());
  }
}

fs::path FileStore::Adopt(const fs::path& source, const std::string& file_name) const {
  EnsureDirectory();

  const fs::path  target = root_ / file_name;
  std::error_code ec;
  fs::rename(source, target, ec);

  if (ec == std::errc::cross_device_link) {
    // capture staging may live on another filesystem; fall back to copy + unlink
    ec.clear();
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (!ec) fs::remove(source, ec);
    if (ec) {
      CHUNKCAM_LOG_WARN("staged capture left behind after copy", {StringField("path", source.string()), StringField("error", ec.message())});
      ec.clear();
    }
  }

  if (ec) {
    throw util::PersistenceError("cannot move " + source.string() + " to " + target.string() + ": " + ec.message());
  }
  return target;
}

std::vector<FileInfo> FileStore::ListFiles() const {
  std::vector<FileInfo> files;

  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    return files;
  }

  for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) continue;

    const auto size = it->file_size(entry_ec);
    if (entry_ec) continue; // vanished between readdir and stat

    FileInfo info;
    info.path       = it->path();
    info.name       = it->path().filename().string();
    info.size_bytes = static_cast<uint64_t>(size);
    info.created_at = ModifiedAt(it->path());
    files.push_back(std::move(info));
  }

  if (ec) {
    CHUNKCAM_LOG_WARN("chunk directory listing incomplete", {StringField("dir", root_.string()), StringField("error", ec.message())});
  }

  std::sort(files.begin(), files.end(), NewerThan);
  return files;
}

StorageInfo FileStore::Info() const {
  const auto files = ListFiles();

  StorageInfo info;
  info.file_count = files.size();
  for (const auto& file : files) info.total_size_bytes += file.size_bytes;

  if (!files.empty()) {
    info.newest_file_name = files.front().name;
    info.oldest_file_name = files.back().name;
  }
  return info;
}

StorageStats FileStore::Stats(uint64_t max_bytes) const {
  StorageStats stats;
  stats.info       = Info();
  stats.free_bytes = EstimateFreeSpace();
  stats.max_bytes  = max_bytes;
  if (max_bytes > 0) {
    stats.usage_percent = static_cast<double>(stats.info.total_size_bytes) * 100.0 / static_cast<double>(max_bytes);
  }
  return stats;
}

bool FileStore::Remove(const fs::path& path) const {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    CHUNKCAM_LOG_WARN("failed to delete chunk file", {StringField("path", path.string()), StringField("error", ec.message())});
    return false;
  }
  return true;
}

EvictionResult FileStore::EnforceQuota(uint64_t max_bytes) {
  auto files = ListFiles();

  EvictionResult result;
  for (const auto& file : files) result.remaining_bytes += file.size_bytes;

  if (result.remaining_bytes <= max_bytes) {
    return result;
  }

  const auto target = static_cast<uint64_t>(static_cast<double>(max_bytes) * kEvictionTargetRatio);

  // oldest first
  std::reverse(files.begin(), files.end());

  for (const auto& file : files) {
    if (result.remaining_bytes <= target) break;

    if (IsProtected(file.path)) {
      CHUNKCAM_LOG_DEBUG("quota eviction skipped queued file", {StringField("file", file.name)});
      continue;
    }

    if (!Remove(file.path)) continue;

    result.remaining_bytes -= file.size_bytes;
    result.freed_bytes += file.size_bytes;
    ++result.deleted_count;
  }

  CHUNKCAM_LOG_INFO("storage quota enforced", {IntField("deleted", static_cast<int64_t>(result.deleted_count)),
                                               IntField("freed_bytes", static_cast<int64_t>(result.freed_bytes)),
                                               IntField("remaining_bytes", static_cast<int64_t>(result.remaining_bytes)),
                                               IntField("target_bytes", static_cast<int64_t>(target))});
  return result;
}

uint64_t FileStore::DeleteOlderThan(std::chrono::hours max_age) {
  const auto cutoff  = clock_->Now() - max_age;
  uint64_t   deleted = 0;

  for (const auto& file : ListFiles()) {
    if (file.created_at >= cutoff || IsProtected(file.path)) continue;
    if (Remove(file.path)) ++deleted;
  }

  if (deleted > 0) {
    CHUNKCAM_LOG_INFO("deleted old chunk files", {IntField("deleted", static_cast<int64_t>(deleted)), IntField("max_age_hours", max_age.count())});
  }
  return deleted;
}

uint64_t FileStore::ClearAll() {
  uint64_t deleted = 0;
  for (const auto& file : ListFiles()) {
    if (Remove(file.path)) ++deleted;
  }

  CHUNKCAM_LOG_INFO("cleared local chunk files", {IntField("deleted", static_cast<int64_t>(deleted))});
  return deleted;
}

uint64_t FileStore::EstimateFreeSpace() const {
  try {
    return free_space_probe_(root_);
  } catch (const std::exception& e) {
    CHUNKCAM_LOG_ERROR("failed to query free space", {StringField("error", e.what())});
    return 0;
  }
}

bool FileStore::HasEnoughSpace(uint64_t estimated_bytes) const {
  return EstimateFreeSpace() > estimated_bytes + kSafetyMarginBytes;
}

uint64_t FileStore::EstimateChunkBytes(uint32_t duration_minutes, const std::string& quality) {
  constexpr uint64_t kMiB = 1024 * 1024;

  uint64_t bytes_per_minute = 4 * kMiB;
  if (quality == "480p") {
    bytes_per_minute = 2 * kMiB;
  } else if (quality == "1080p") {
    bytes_per_minute = 8 * kMiB;
  }
  return static_cast<uint64_t>(duration_minutes) * bytes_per_minute;
}

} // namespace chunkcam::storage
