#pragma once

#include "workspace_guard.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sandbox {

struct DirectoryEntry {
    std::string name;
    bool is_directory = false;
    std::optional<std::uintmax_t> size; // regular files only
};

// Every function validates its path arguments through the guard first and
// throws ValidationError / NotFoundError / std::filesystem::filesystem_error.

std::string read_file(const WorkspaceGuard& guard, const std::string& path);

void write_file(const WorkspaceGuard& guard, const std::string& path, const std::string& content);

/// Entries sorted by name.
std::vector<DirectoryEntry> list_directory(const WorkspaceGuard& guard, const std::string& path);

/// Never throws: validation or I/O failures read as "does not exist".
bool file_exists(const WorkspaceGuard& guard, const std::string& path) noexcept;

/// Idempotent. Symlinks are unlinked, directories removed recursively, the root is refused.
void delete_file(const WorkspaceGuard& guard, const std::string& path);

/// Idempotent and recursive.
void create_directory(const WorkspaceGuard& guard, const std::string& path);

void copy_file(const WorkspaceGuard& guard, const std::string& src, const std::string& dest);

} // namespace sandbox
