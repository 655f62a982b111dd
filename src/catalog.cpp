#include "catalog.hpp"

#include <array>

#include "utils.hpp"

bool is_reserved_path(const std::string& relative_path) {
  if(relative_path.empty()) return false;
  static const std::array<const char*, 2> reserved_dirs = {
    kStagingDirName,
    kConfigDirName
  };
  for(const auto* prefix : reserved_dirs) {
    std::string view(prefix);
    if(relative_path == view) return true;
    if(relative_path.rfind(view + "/", 0) == 0) return true;
  }
  const std::string suffix(kStagingSuffix);
  return relative_path.size() >= suffix.size() &&
         relative_path.compare(relative_path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

CatalogBuilder::CatalogBuilder(std::string owner, std::shared_ptr<Logger> logger)
  : owner_(std::move(owner)), logger_(std::move(logger)) {}

std::optional<FileEntry> CatalogBuilder::describe(const std::filesystem::path& root,
                                                  const std::filesystem::path& file) const {
  auto rel = normalize_relative_path(file.lexically_relative(root).generic_string());
  if(!rel) {
    log_warn(logger_.get(), "Skipping {}: path escapes the shared root", file.string());
    return std::nullopt;
  }
  if(is_reserved_path(*rel)) return std::nullopt;

  std::error_code ec;
  auto size = std::filesystem::file_size(file, ec);
  if(ec) {
    log_warn(logger_.get(), "Skipping {}: {}", *rel, ec.message());
    return std::nullopt;
  }
  auto mtime = file_mtime_ms(file, ec);
  if(!mtime) {
    log_warn(logger_.get(), "Skipping {}: {}", *rel, ec.message());
    return std::nullopt;
  }
  auto hash = sha256_file(file);
  if(!hash) {
    log_warn(logger_.get(), "Skipping {}: unreadable", *rel);
    return std::nullopt;
  }

  FileEntry entry;
  entry.relative_path = *rel;
  entry.size = size;
  entry.content_hash = *hash;
  entry.modified_at = *mtime;
  return entry;
}

Catalog CatalogBuilder::build(const std::filesystem::path& root) const {
  Catalog catalog;
  catalog.owner = owner_;
  catalog.generated_at = unix_time_ms();

  std::error_code ec;
  if(!std::filesystem::is_directory(root, ec)) {
    log_error(logger_.get(), "Shared directory {} is not accessible", root.string());
    return catalog;
  }

  using dir_iter = std::filesystem::recursive_directory_iterator;
  dir_iter it(root, std::filesystem::directory_options::skip_permission_denied, ec);
  if(ec) {
    log_error(logger_.get(), "Cannot scan {}: {}", root.string(), ec.message());
    return catalog;
  }

  for(; it != dir_iter(); it.increment(ec)) {
    if(ec) break;
    const auto& path = it->path();

    std::error_code status_ec;
    auto status = it->symlink_status(status_ec);
    if(status_ec) {
      log_warn(logger_.get(), "Skipping {}: {}", path.string(), status_ec.message());
      continue;
    }
    if(std::filesystem::is_symlink(status)) {
      continue;
    }
    if(std::filesystem::is_directory(status)) {
      auto rel = normalize_relative_path(path.lexically_relative(root).generic_string());
      if(!rel || is_reserved_path(*rel)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if(!std::filesystem::is_regular_file(status)) {
      continue;
    }

    if(auto entry = describe(root, path)) {
      catalog.entries.emplace(entry->relative_path, std::move(*entry));
    }
  }
  if(ec) {
    log_warn(logger_.get(), "Scan of {} stopped early: {}", root.string(), ec.message());
  }

  log_debug(logger_.get(), "Catalog of {}: {} file(s)", root.string(), catalog.entries.size());
  return catalog;
}

CatalogCache::CatalogCache(std::shared_ptr<const CatalogBuilder> builder,
                           std::filesystem::path root,
                           std::chrono::milliseconds max_age)
  : builder_(std::move(builder)), root_(std::move(root)), max_age_(max_age) {}

std::shared_ptr<const Catalog> CatalogCache::get(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(m_);
  if(cached_ && max_age_.count() > 0 && now - built_at_ < max_age_) {
    return cached_;
  }
  cached_ = std::make_shared<const Catalog>(builder_->build(root_));
  built_at_ = now;
  return cached_;
}

void CatalogCache::invalidate() {
  std::lock_guard<std::mutex> lock(m_);
  cached_.reset();
}
