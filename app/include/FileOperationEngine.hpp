#ifndef FILE_OPERATION_ENGINE_HPP
#define FILE_OPERATION_ENGINE_HPP

#include "Command.hpp"
#include "FileMutator.hpp"
#include "Outcome.hpp"
#include "Types.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

class SizeCache;
class TrashStore;
namespace spdlog { class logger; }

struct ApplyContext {
    // Checked between per-entry steps of copies and moves. May be null.
    const std::atomic<bool>* cancel_flag{nullptr};
    // Called with every filesystem object written.
    std::function<void(const std::filesystem::path&)> on_progress;
};

/**
 * @brief Applies commands to the filesystem.
 *
 * Paths are absolutized and checked again at apply time. A permission error
 * (EACCES/EPERM) yields PermissionDenied carrying the command narrowed to the
 * targets still to do, so the caller can retry it elevated. Every path touched
 * has its size, and its parent's size, invalidated. The engine never records
 * anything for undo.
 */
class FileOperationEngine {
public:
    FileOperationEngine(TrashStore& trash,
                        SizeCache& sizes,
                        PasteCollisionPolicy collision_policy = PasteCollisionPolicy::AutoRename,
                        std::shared_ptr<spdlog::logger> logger = nullptr);

    // Runs with the rights of the current process.
    Outcome apply(const Command& command, const ApplyContext& context = {});
    Outcome apply_with(const Command& command, FileMutator& mutator, const ApplyContext& context = {});

    PasteCollisionPolicy get_paste_collision_policy() const;
    void set_paste_collision_policy(PasteCollisionPolicy policy);

private:
    Outcome apply_copy(const CopyCommand& command, FileMutator& mutator, const ApplyContext& context);
    Outcome apply_move(const MoveCommand& command, FileMutator& mutator, const ApplyContext& context);
    Outcome apply_delete(const DeleteCommand& command, FileMutator& mutator);
    Outcome apply_rename(const RenameCommand& command, FileMutator& mutator);
    Outcome apply_create(const CreateNewCommand& command, FileMutator& mutator);
    Outcome apply_restore(const RestoreCommand& command, FileMutator& mutator);
    Outcome apply_relocate(const RelocateCommand& command, FileMutator& mutator);

    // Destination of a pasted source, honoring the collision policy; empty when the target must fail.
    std::filesystem::path paste_target(const std::filesystem::path& destination,
                                       const std::filesystem::path& source,
                                       FileMutator& mutator) const;
    void discard_partial(const std::filesystem::path& target, FileMutator& mutator);
    void invalidate_sizes(const std::vector<std::filesystem::path>& paths);
    void log_outcome(const Command& command, const Outcome& outcome, bool elevated) const;

    TrashStore& trash;
    SizeCache& sizes;
    std::atomic<PasteCollisionPolicy> collision_policy;
    std::shared_ptr<spdlog::logger> logger;
    DirectMutator direct_mutator;
};

#endif
