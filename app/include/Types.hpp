#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <string>

enum class FileKind {File, Directory, Symlink, Other};

inline std::string to_string(FileKind kind) {
    switch (kind) {
        case FileKind::File: return "File";
        case FileKind::Directory: return "Directory";
        case FileKind::Symlink: return "Symlink";
        case FileKind::Other: return "Other";
        default: return "Unknown";
    }
}

enum class CreationKind {File, Directory};

inline std::string to_string(CreationKind kind) {
    return kind == CreationKind::Directory ? "directory" : "file";
}

/**
 * @brief Size of a tracked path: not yet computed, computed, or unavailable with a reason.
 */
struct SizeState {
    enum class Status {Uncomputed, Computed, Unavailable};

    Status status{Status::Uncomputed};
    std::uintmax_t bytes{0};
    std::string reason;

    static SizeState uncomputed() { return {}; }
    static SizeState computed(std::uintmax_t value) { return {Status::Computed, value, {}}; }
    static SizeState unavailable(std::string why) { return {Status::Unavailable, 0, std::move(why)}; }

    bool is_computed() const { return status == Status::Computed; }
};

inline bool operator==(const SizeState& lhs, const SizeState& rhs) {
    return lhs.status == rhs.status && lhs.bytes == rhs.bytes && lhs.reason == rhs.reason;
}

struct FileEntry {
    std::string full_path;
    std::string file_name;
    FileKind kind;
    SizeState size;
};

enum class FileScanOptions {
    None        = 0,
    Files       = 1 << 0,   // 0001
    Directories = 1 << 1,   // 0010
    HiddenFiles = 1 << 2,   // 0100
    Symlinks    = 1 << 3,   // 1000
    All         = Files | Directories | Symlinks
};

inline bool has_flag(FileScanOptions value, FileScanOptions flag) {
    return (static_cast<int>(value) & static_cast<int>(flag)) != 0;
}

inline FileScanOptions operator|(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) | static_cast<int>(b));
}

inline FileScanOptions operator&(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) & static_cast<int>(b));
}

inline FileScanOptions operator~(FileScanOptions a) {
    return static_cast<FileScanOptions>(~static_cast<int>(a));
}

enum class PasteCollisionPolicy {AutoRename, Fail};

enum class EscalationScope {SingleCommand, Batch};

#endif
