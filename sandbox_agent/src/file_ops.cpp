#include "file_ops.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace sandbox {

namespace {

void ensure_parent_directory(const fs::path& path) {
    fs::path parent = path.parent_path();
    if (!parent.empty() && !fs::exists(parent)) {
        fs::create_directories(parent);
    }
}

} // namespace

std::string read_file(const WorkspaceGuard& guard, const std::string& path) {
    fs::path resolved = guard.validate_path(path);

    std::error_code ec;
    if (!fs::exists(resolved, ec)) {
        throw NotFoundError("File not found: " + path);
    }
    if (fs::is_directory(resolved, ec)) {
        throw fs::filesystem_error("Cannot read a directory", resolved,
                                   std::make_error_code(std::errc::is_a_directory));
    }

    std::ifstream in(resolved, std::ios::binary);
    if (!in) {
        throw fs::filesystem_error("Cannot open file for reading", resolved,
                                   std::make_error_code(std::errc::permission_denied));
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

void write_file(const WorkspaceGuard& guard, const std::string& path, const std::string& content) {
    fs::path resolved = guard.validate_path(path);
    ensure_parent_directory(resolved);

    std::ofstream out(resolved, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw fs::filesystem_error("Cannot open file for writing", resolved,
                                   std::make_error_code(std::errc::permission_denied));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw fs::filesystem_error("Failed to write file", resolved, std::make_error_code(std::errc::io_error));
    }
    LOG4CPLUS_DEBUG(action_logger(), "Wrote " << content.size() << " bytes to " << resolved.string());
}

std::vector<DirectoryEntry> list_directory(const WorkspaceGuard& guard, const std::string& path) {
    fs::path resolved = guard.validate_path(path);

    std::error_code ec;
    if (!fs::exists(resolved, ec)) {
        throw NotFoundError("Directory not found: " + path);
    }
    if (!fs::is_directory(resolved, ec)) {
        throw fs::filesystem_error("Not a directory", resolved, std::make_error_code(std::errc::not_a_directory));
    }

    std::vector<DirectoryEntry> entries;
    for (const auto& item : fs::directory_iterator(resolved)) {
        DirectoryEntry entry;
        entry.name = item.path().filename().string();

        auto status = item.symlink_status(ec);
        if (ec) {
            entries.push_back(std::move(entry));
            continue;
        }
        entry.is_directory = fs::is_directory(status);
        if (fs::is_regular_file(status)) {
            auto size = item.file_size(ec);
            if (!ec) {
                entry.size = size;
            }
        }
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
    return entries;
}

bool file_exists(const WorkspaceGuard& guard, const std::string& path) noexcept {
    try {
        fs::path resolved = guard.validate_path(path);
        std::error_code ec;
        return fs::exists(resolved, ec);
    } catch (const std::exception& exc) {
        LOG4CPLUS_DEBUG(action_logger(), "fileExists(" << path << ") treated as false: " << exc.what());
        return false;
    }
}

void delete_file(const WorkspaceGuard& guard, const std::string& path) {
    fs::path resolved = guard.validate_entry(path);
    if (resolved == guard.workspace().root) {
        throw ValidationError(ValidationError::Reason::InvalidArgument, "Refusing to delete the workspace root");
    }

    std::error_code ec;
    auto status = fs::symlink_status(resolved, ec);
    if (ec || !fs::exists(status)) {
        return;
    }

    if (fs::is_directory(status)) {
        auto removed = fs::remove_all(resolved);
        LOG4CPLUS_INFO(action_logger(), "Removed directory " << resolved.string() << " (" << removed << " entries)");
    } else {
        fs::remove(resolved);
        LOG4CPLUS_DEBUG(action_logger(), "Removed " << resolved.string());
    }
}

void create_directory(const WorkspaceGuard& guard, const std::string& path) {
    fs::path resolved = guard.validate_path(path);

    std::error_code ec;
    if (fs::is_directory(resolved, ec)) {
        return;
    }
    fs::create_directories(resolved);
}

void copy_file(const WorkspaceGuard& guard, const std::string& src, const std::string& dest) {
    fs::path source = guard.validate_path(src);
    fs::path target = guard.validate_path(dest);

    std::error_code ec;
    if (!fs::exists(source, ec)) {
        throw NotFoundError("File not found: " + src);
    }
    if (fs::is_directory(source, ec)) {
        throw ValidationError(ValidationError::Reason::InvalidArgument, "Source is a directory: " + src);
    }

    ensure_parent_directory(target);
    fs::copy_file(source, target, fs::copy_options::overwrite_existing);
    LOG4CPLUS_DEBUG(action_logger(), "Copied " << source.string() << " -> " << target.string());
}

} // namespace sandbox
