#pragma once
#include <string>
#include <vector>
#include "command_executor.hpp"
#include "payload.hpp"

namespace pcex {

enum class SortKey { Name, Date, Size, Type };

struct SortOrder {
    SortKey key{SortKey::Name};
    bool ascending{true};
};

// Directories first, then by key; names compare case-insensitively.
void sort_entries(std::vector<FileEntry>& entries, SortOrder order);

// Joins a parent path and a child name without doubling the separator.
std::string join_remote_path(const std::string& parent, const std::string& name);

// Browse operations on the remote file system.
class RemoteFiles {
public:
    explicit RemoteFiles(CommandExecutor& exec) : exec_(exec) {}

    Result<std::vector<FileEntry>> list(const std::string& path, SortOrder order = {});
    Result<std::vector<FileEntry>> search(const std::string& query, const std::string& path);
    Result<FileEntry> file_info(const std::string& path);
    Result<FileEntry> create_directory(const std::string& parent, const std::string& name);
    Result<FileEntry> rename(const std::string& path, const std::string& new_name);
    // Deletes each path in turn and stops at the first failure.
    Result<void> remove(const std::vector<std::string>& paths);
    Result<StorageInfo> storage_info(const std::string& drive);
    Result<std::vector<std::string>> drives();

private:
    CommandExecutor& exec_;
};

} // namespace pcex
