// core/fstab.hpp - Mount table parsing
#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace ntfsmh {

struct FstabEntry {
  std::string device_spec; // /dev/sdX, UUID=..., LABEL=...
  std::string mount_point;
  std::string fs_type;
  std::string options = "defaults";
  int dump = 0;
  int pass = 0;

  bool is_ntfs() const;
};

std::vector<FstabEntry> parse_fstab(std::istream &in);
std::vector<FstabEntry> load_fstab(const fs::path &path);

// Entries whose type field names an NTFS driver (ntfs, ntfs3, ntfs-3g)
std::vector<FstabEntry> select_ntfs(const std::vector<FstabEntry> &entries);

// Decodes the octal escapes fstab uses for blanks, e.g. "\040" -> " "
std::string unescape_fstab_field(const std::string &field);

} // namespace ntfsmh
