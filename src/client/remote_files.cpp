#include "remote_files.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>

namespace pcex {

namespace {

std::string extension_of(const std::string &name) {
  auto dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0)
    return {};
  return to_lower(name.substr(dot + 1));
}

} // namespace

void sort_entries(std::vector<FileEntry> &entries, SortOrder order) {
  auto less = [order](const FileEntry &a, const FileEntry &b) {
    if (a.is_directory != b.is_directory)
      return a.is_directory;
    bool r;
    switch (order.key) {
    case SortKey::Date:
      if (a.modified == b.modified)
        return to_lower(a.name) < to_lower(b.name);
      r = a.modified < b.modified;
      break;
    case SortKey::Size:
      if (a.size == b.size)
        return to_lower(a.name) < to_lower(b.name);
      r = a.size < b.size;
      break;
    case SortKey::Type: {
      auto ea = extension_of(a.name), eb = extension_of(b.name);
      if (ea == eb)
        return to_lower(a.name) < to_lower(b.name);
      r = ea < eb;
      break;
    }
    default: {
      auto na = to_lower(a.name), nb = to_lower(b.name);
      if (na == nb)
        return false;
      r = na < nb;
      break;
    }
    }
    return order.ascending ? r : !r;
  };
  std::stable_sort(entries.begin(), entries.end(), less);
}

std::string join_remote_path(const std::string &parent,
                             const std::string &name) {
  if (parent.empty())
    return name;
  char last = parent.back();
  if (last == '/' || last == '\\')
    return parent + name;
  return parent + "/" + name;
}

Result<std::vector<FileEntry>> RemoteFiles::list(const std::string &path,
                                                 SortOrder order) {
  auto r = exec_.execute<std::vector<FileEntry>>(Command::ListDir,
                                                 encode_path(path),
                                                 decode_file_list);
  if (r)
    sort_entries(r.value(), order);
  return r;
}

Result<std::vector<FileEntry>> RemoteFiles::search(const std::string &query,
                                                   const std::string &path) {
  return exec_.execute<std::vector<FileEntry>>(
      Command::Search, encode_search(query, path), decode_file_list);
}

Result<FileEntry> RemoteFiles::file_info(const std::string &path) {
  return exec_.execute<FileEntry>(Command::GetFileInfo, encode_path(path),
                                  decode_file_entry);
}

Result<FileEntry> RemoteFiles::create_directory(const std::string &parent,
                                                const std::string &name) {
  return exec_.execute<FileEntry>(Command::CreateDir,
                                  encode_path(join_remote_path(parent, name)),
                                  decode_file_entry);
}

Result<FileEntry> RemoteFiles::rename(const std::string &path,
                                      const std::string &new_name) {
  return exec_.execute<FileEntry>(Command::Rename,
                                  encode_rename(path, new_name),
                                  decode_file_entry);
}

Result<void> RemoteFiles::remove(const std::vector<std::string> &paths) {
  for (const auto &p : paths) {
    auto r = exec_.execute(Command::Delete, encode_path(p));
    if (!r) {
      Logger::instance().log(LogLevel::WARN, "delete %s: %s", p.c_str(),
                             r.error().describe().c_str());
      return r;
    }
  }
  return {};
}

Result<StorageInfo> RemoteFiles::storage_info(const std::string &drive) {
  return exec_.execute<StorageInfo>(Command::GetStorageInfo,
                                    encode_path(drive), decode_storage_info);
}

Result<std::vector<std::string>> RemoteFiles::drives() {
  return exec_.execute<std::vector<std::string>>(Command::GetDrives, {},
                                                 decode_drive_list);
}

} // namespace pcex
