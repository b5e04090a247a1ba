#ifndef FILE_TRANSFER_HPP
#define FILE_TRANSFER_HPP

#include <filesystem>
#include <functional>
#include <stdexcept>
#include <vector>

class FileMutator;

namespace FileTransfer {

// Thrown between entries when the observer asks to stop; output written so far stays.
class TransferCancelled : public std::runtime_error {
public:
    TransferCancelled() : std::runtime_error("transfer cancelled") {}
};

// The copy of a cross-device move landed but the source could not be removed afterwards.
class SourceNotRemoved : public std::filesystem::filesystem_error {
public:
    using std::filesystem::filesystem_error::filesystem_error;
};

struct Observer {
    std::function<bool()> should_cancel;
    std::function<void(const std::filesystem::path& written)> on_entry;
};

/**
 * @brief Copies `from` to `to` one entry at a time (directories recursively,
 * children in name order, symlinks as links). The walk itself runs through
 * the mutator. Cancellation is checked before every entry.
 */
void copy_tree(const std::filesystem::path& from, const std::filesystem::path& to,
               FileMutator& mutator, const Observer& observer = {});

/**
 * @brief Renames `from` to `to`; when they are on different devices, copies
 * and then removes the source.
 * @return true when the atomic rename path was used.
 */
bool move_path(const std::filesystem::path& from, const std::filesystem::path& to,
               FileMutator& mutator, const Observer& observer = {});

}

#endif
