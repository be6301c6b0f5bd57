#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dropway::storage {

// Receiver-side download directory: <base>/<name>.<hash8>.part while a
// transfer runs, renamed to <base>/<name> once the whole-file hash matches.
// <name> may contain subdirectories; they are created on demand.
class FileStore {
public:
  explicit FileStore(const std::string& base_storage_path = "./downloads");

  // Create the base directory; false when it cannot be created
  bool initialize();

  const std::string& base_path() const { return base_path_; }

  // Rejects names that would escape the base directory. nullopt when unsafe.
  static std::optional<std::string> safe_file_name(const std::string& name);

  // "dir/sub/name": '/'-separated components that each pass safe_file_name.
  // Files of a sent directory arrive under such names.
  static std::optional<std::string> safe_relative_path(const std::string& name);

  std::string get_temp_path(const std::string& filename, const std::string& hash_hex) const;
  std::string get_file_path(const std::string& filename) const;

  bool final_exists(const std::string& filename) const;

  // Rename .part to the final name. Throws StorageError.
  std::string finalize_file(const std::string& temp_path, const std::string& filename);

  // Remove a .part file (discarded or failed transfers)
  bool cleanup(const std::string& temp_path);

  // Bytes available to an unprivileged writer on the base directory's volume;
  // nullopt when the volume cannot be queried
  std::optional<uint64_t> free_space() const;

private:
  std::string base_path_;

  bool ensure_directory(const std::string& path);
};

} // namespace dropway::storage
