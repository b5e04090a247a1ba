#include "FileScanner.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

struct FileScanner::ScanContext {
    bool include_files{false};
    bool include_directories{false};
    bool include_symlinks{false};
    bool include_hidden{false};
    std::shared_ptr<spdlog::logger> logger;
};

std::vector<FileEntry>
FileScanner::get_directory_entries(const std::string &directory_path,
                                   FileScanOptions options) const
{
    std::vector<FileEntry> entries;
    auto logger = Logger::get_logger("core_logger");

    if (logger) {
        logger->debug("Scanning directory '{}' with options mask {}", directory_path, static_cast<int>(options));
    }

    ScanContext context;
    context.include_files = has_flag(options, FileScanOptions::Files);
    context.include_directories = has_flag(options, FileScanOptions::Directories);
    context.include_symlinks = has_flag(options, FileScanOptions::Symlinks);
    context.include_hidden = has_flag(options, FileScanOptions::HiddenFiles);
    context.logger = logger;

    try {
        const fs::path scan_path = Utils::utf8_to_path(directory_path);
        for (const auto &entry : fs::directory_iterator(scan_path)) {
            if (auto entry_info = build_entry(entry, context)) {
                entries.push_back(std::move(*entry_info));
            }
        }
    } catch (const fs::filesystem_error& ex) {
        if (logger) {
            logger->warn("Error while scanning '{}': {}", directory_path, ex.what());
        }
        throw;
    }

    std::sort(entries.begin(), entries.end(), [](const FileEntry& lhs, const FileEntry& rhs) {
        return lhs.file_name < rhs.file_name;
    });

    return entries;
}


FileKind FileScanner::classify(const fs::file_status& status)
{
    switch (status.type()) {
        case fs::file_type::regular: return FileKind::File;
        case fs::file_type::directory: return FileKind::Directory;
        case fs::file_type::symlink: return FileKind::Symlink;
        default: return FileKind::Other;
    }
}


bool FileScanner::is_file_hidden(const fs::path &path) const
{
    return Utils::path_to_utf8(path.filename()).starts_with(".");
}


std::optional<FileEntry> FileScanner::build_entry(const fs::directory_entry& entry,
                                                  const ScanContext& context) const
{
    const fs::path& entry_path = entry.path();
    std::string full_path = Utils::path_to_utf8(entry_path);
    std::string file_name = Utils::path_to_utf8(entry_path.filename());

    if (is_file_hidden(entry_path) && !context.include_hidden) {
        if (context.logger) {
            context.logger->trace("Skipping hidden entry '{}'", full_path);
        }
        return std::nullopt;
    }

    std::error_code ec;
    const FileKind kind = classify(entry.symlink_status(ec));
    if (ec) {
        if (context.logger) {
            context.logger->debug("Cannot stat '{}': {}", full_path, ec.message());
        }
        return std::nullopt;
    }

    const bool wanted = (kind == FileKind::File && context.include_files)
                        || (kind == FileKind::Directory && context.include_directories)
                        || (kind == FileKind::Symlink && context.include_symlinks)
                        || (kind == FileKind::Other && context.include_files);
    if (!wanted) {
        return std::nullopt;
    }

    return FileEntry{std::move(full_path), std::move(file_name), kind, SizeState::uncomputed()};
}
