#include "dropway/storage/file_store.h"
#include "dropway/storage/chunk_store.h"
#include "dropway/log/logger.h"
#include <filesystem>
#include <system_error>

namespace dropway::storage {

FileStore::FileStore(const std::string& base_storage_path)
  : base_path_(base_storage_path) {
}

bool FileStore::initialize() {
  return ensure_directory(base_path_);
}

bool FileStore::ensure_directory(const std::string& path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    Logger::instance().error("[store] cannot create " + path + ": " + ec.message());
    return false;
  }
  return std::filesystem::is_directory(path, ec);
}

std::optional<std::string> FileStore::safe_file_name(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return std::nullopt;
  if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) return std::nullopt;
  if (name.find('\0') != std::string::npos) return std::nullopt;
  return name;
}

std::optional<std::string> FileStore::safe_relative_path(const std::string& name) {
  if (name.empty() || name.front() == '/' || name.back() == '/') return std::nullopt;
  size_t start = 0;
  for (;;) {
    size_t slash = name.find('/', start);
    if (!safe_file_name(name.substr(start, slash == std::string::npos ? std::string::npos : slash - start))) {
      return std::nullopt;
    }
    if (slash == std::string::npos) break;
    start = slash + 1;
  }
  return name;
}

std::string FileStore::get_temp_path(const std::string& filename, const std::string& hash_hex) const {
  return base_path_ + "/" + filename + "." + hash_hex.substr(0, 8) + ".part";
}

std::string FileStore::get_file_path(const std::string& filename) const {
  return base_path_ + "/" + filename;
}

bool FileStore::final_exists(const std::string& filename) const {
  std::error_code ec;
  return std::filesystem::exists(get_file_path(filename), ec);
}

std::string FileStore::finalize_file(const std::string& temp_path, const std::string& filename) {
  std::string final_path = get_file_path(filename);
  std::error_code ec;
  if (std::filesystem::exists(final_path, ec)) {
    throw StorageError("target already exists: " + final_path);
  }
  auto parent = std::filesystem::path(final_path).parent_path();
  if (!ensure_directory(parent.string())) throw StorageError("cannot create " + parent.string());
  std::filesystem::rename(temp_path, final_path, ec);
  if (ec) throw StorageError("rename " + temp_path + " -> " + final_path + ": " + ec.message());
  return final_path;
}

bool FileStore::cleanup(const std::string& temp_path) {
  std::error_code ec;
  std::filesystem::remove(temp_path, ec);
  if (ec) {
    Logger::instance().warn("[store] cannot remove " + temp_path + ": " + ec.message());
    return false;
  }
  return true;
}

std::optional<uint64_t> FileStore::free_space() const {
  std::error_code ec;
  auto info = std::filesystem::space(base_path_, ec);
  if (ec) return std::nullopt;
  return static_cast<uint64_t>(info.available);
}

} // namespace dropway::storage
