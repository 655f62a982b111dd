#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "log.hpp"

// In-progress transfers live here, inside the shared root so that the final
// rename never crosses a filesystem boundary.
inline constexpr const char* kStagingDirName = ".sync_tmp";
inline constexpr const char* kStagingSuffix = ".lsync-part";
inline constexpr const char* kConfigDirName = ".config";

struct FileEntry {
  std::string relative_path;
  uint64_t size = 0;
  std::string content_hash; // SHA-256, lowercase hex
  int64_t modified_at = 0;  // ms since the Unix epoch

  bool operator==(const FileEntry& other) const {
    return relative_path == other.relative_path && size == other.size &&
           content_hash == other.content_hash && modified_at == other.modified_at;
  }
};

// Immutable snapshot of one peer's shared directory.
struct Catalog {
  std::string owner;
  int64_t generated_at = 0;
  std::map<std::string, FileEntry> entries; // keyed by relative_path

  const FileEntry* find(const std::string& relative_path) const {
    auto it = entries.find(relative_path);
    return it == entries.end() ? nullptr : &it->second;
  }
  std::size_t size() const { return entries.size(); }
};

// True for paths the engine owns (staging area, config, partial files).
bool is_reserved_path(const std::string& relative_path);

class CatalogBuilder {
public:
  explicit CatalogBuilder(std::string owner, std::shared_ptr<Logger> logger = nullptr);

  // Unreadable files and directories are skipped with a warning.
  Catalog build(const std::filesystem::path& root) const;

private:
  std::optional<FileEntry> describe(const std::filesystem::path& root,
                                    const std::filesystem::path& file) const;

  std::string owner_;
  std::shared_ptr<Logger> logger_;
};

// Serves inbound catalog requests; rescans only when the cached snapshot is
// older than max_age.
class CatalogCache {
public:
  using Clock = std::chrono::steady_clock;

  CatalogCache(std::shared_ptr<const CatalogBuilder> builder,
               std::filesystem::path root,
               std::chrono::milliseconds max_age);

  std::shared_ptr<const Catalog> get(Clock::time_point now = Clock::now());
  void invalidate();

private:
  std::shared_ptr<const CatalogBuilder> builder_;
  std::filesystem::path root_;
  std::chrono::milliseconds max_age_;

  std::mutex m_;
  std::shared_ptr<const Catalog> cached_;
  Clock::time_point built_at_{};
};
