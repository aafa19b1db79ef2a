// core/fstab.cpp - Mount table parsing implementation
#include "fstab.hpp"
#include "../utils.hpp"
#include <fstream>
#include <sstream>

namespace ntfsmh {

static bool is_octal(char c) { return c >= '0' && c <= '7'; }

std::string unescape_fstab_field(const std::string &field) {
  std::string out;
  out.reserve(field.size());
  for (size_t i = 0; i < field.size(); ++i) {
    if (field[i] == '\\' && i + 3 < field.size() && is_octal(field[i + 1]) &&
        is_octal(field[i + 2]) && is_octal(field[i + 3])) {
      int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 +
                  (field[i + 3] - '0');
      out += static_cast<char>(value);
      i += 3;
    } else {
      out += field[i];
    }
  }
  return out;
}

static int parse_number_field(const std::string &field) {
  try {
    return std::stoi(field);
  } catch (const std::exception &) {
    return 0;
  }
}

bool FstabEntry::is_ntfs() const { return contains_icase(fs_type, "ntfs"); }

std::vector<FstabEntry> parse_fstab(std::istream &in) {
  std::vector<FstabEntry> entries;
  std::string line;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string stripped = trim(line);
    if (stripped.empty() || stripped[0] == '#')
      continue;

    std::vector<std::string> fields = split_words(stripped);
    if (fields.size() < 3) {
      LOG_DEBUG("fstab line " + std::to_string(line_no) +
                " has too few fields, ignoring");
      continue;
    }

    FstabEntry entry;
    entry.device_spec = unescape_fstab_field(fields[0]);
    entry.mount_point = unescape_fstab_field(fields[1]);
    entry.fs_type = fields[2];
    if (fields.size() > 3)
      entry.options = fields[3];
    if (fields.size() > 4)
      entry.dump = parse_number_field(fields[4]);
    if (fields.size() > 5)
      entry.pass = parse_number_field(fields[5]);

    entries.push_back(entry);
  }

  return entries;
}

std::vector<FstabEntry> load_fstab(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("Cannot read mount table " + path.string());
    return {};
  }
  return parse_fstab(file);
}

std::vector<FstabEntry> select_ntfs(const std::vector<FstabEntry> &entries) {
  std::vector<FstabEntry> result;
  for (const auto &entry : entries) {
    if (entry.is_ntfs()) {
      result.push_back(entry);
    }
  }
  return result;
}

} // namespace ntfsmh
