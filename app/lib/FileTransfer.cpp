#include "FileTransfer.hpp"

#include "FileMutator.hpp"
#include "Utils.hpp"

namespace fs = std::filesystem;

namespace FileTransfer {

namespace {

void check_cancel(const Observer& observer)
{
    if (observer.should_cancel && observer.should_cancel()) {
        throw TransferCancelled();
    }
}

void notify(const Observer& observer, const fs::path& written)
{
    if (observer.on_entry) {
        observer.on_entry(written);
    }
}

}

void copy_tree(const fs::path& from, const fs::path& to, FileMutator& mutator, const Observer& observer)
{
    check_cancel(observer);

    const fs::file_status status = mutator.entry_status(from, false);
    if (fs::is_symlink(status)) {
        mutator.copy_symlink(from, to);
        notify(observer, to);
        return;
    }
    if (!fs::is_directory(status)) {
        mutator.copy_file(from, to);
        notify(observer, to);
        return;
    }

    mutator.create_directory(to);
    notify(observer, to);
    for (const auto& child : mutator.list_directory(from)) {
        copy_tree(child, to / child.filename(), mutator, observer);
    }
}


bool move_path(const fs::path& from, const fs::path& to, FileMutator& mutator, const Observer& observer)
{
    check_cancel(observer);
    try {
        mutator.rename(from, to);
        notify(observer, to);
        return true;
    } catch (const fs::filesystem_error& ex) {
        if (!Utils::is_cross_device_error(ex.code())) {
            throw;
        }
    }

    copy_tree(from, to, mutator, observer);
    try {
        mutator.remove_all(from);
    } catch (const fs::filesystem_error& ex) {
        throw SourceNotRemoved(ex.what(), from, to, ex.code());
    }
    return false;
}

}
