#include "FileOperationEngine.hpp"

#include "AppException.hpp"
#include "FileTransfer.hpp"
#include "SizeCache.hpp"
#include "TrashStore.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <type_traits>

namespace fs = std::filesystem;
using ErrorCodes::Code;

namespace {

Code code_for(const std::error_code& ec)
{
    if (Utils::is_permission_error(ec)) {
        return Code::PERMISSION_DENIED;
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return Code::PATH_NOT_FOUND;
    }
    if (ec == std::errc::file_exists) {
        return Code::DESTINATION_EXISTS;
    }
    if (ec == std::errc::not_a_directory) {
        return Code::NOT_A_DIRECTORY;
    }
    return Code::IO_ERROR;
}

TargetFailure failure_from(const fs::path& path, const fs::filesystem_error& ex)
{
    return {path, code_for(ex.code()), ex.what()};
}

TargetFailure failure_from(const fs::path& path, Code code)
{
    return {path, code, ErrorCodes::ErrorCatalog::get_error_info(code, Utils::path_to_utf8(path)).message};
}

std::string user_message(Code code, const fs::path& path)
{
    return ErrorCodes::ErrorCatalog::get_error_info(code, Utils::path_to_utf8(path)).get_user_message();
}

bool cancel_requested(const ApplyContext& context)
{
    return context.cancel_flag && context.cancel_flag->load();
}

FileTransfer::Observer make_observer(const ApplyContext& context, std::vector<fs::path>& written)
{
    FileTransfer::Observer observer;
    observer.should_cancel = [&context]() { return cancel_requested(context); };
    observer.on_entry = [&context, &written](const fs::path& path) {
        written.push_back(path);
        if (context.on_progress) {
            context.on_progress(path);
        }
    };
    return observer;
}

// Nothing in the batch went through.
Outcome failed_batch(std::vector<TargetFailure> failures)
{
    if (failures.empty()) {
        return Outcome::failed(Code::EMPTY_SELECTION, user_message(Code::EMPTY_SELECTION, {}));
    }
    const Code code = failures.front().code;
    std::string message = failures.size() == 1
        ? failures.front().detail
        : fmt::format("{} targets failed; first: {}", failures.size(), failures.front().detail);
    return Outcome::failed(code, std::move(message), std::move(failures));
}

// Throws when the lookup itself is denied.
std::optional<Outcome> check_destination_dir(const fs::path& destination, FileMutator& mutator)
{
    const fs::file_status status = mutator.entry_status(destination, true);
    if (!fs::exists(status)) {
        return Outcome::failed(Code::PATH_NOT_FOUND, user_message(Code::PATH_NOT_FOUND, destination));
    }
    if (!fs::is_directory(status)) {
        return Outcome::failed(Code::NOT_A_DIRECTORY, user_message(Code::NOT_A_DIRECTORY, destination));
    }
    return std::nullopt;
}

template <typename T>
std::vector<T> tail_from(const std::vector<T>& items, std::size_t index)
{
    return std::vector<T>(items.begin() + static_cast<std::ptrdiff_t>(index), items.end());
}

std::vector<fs::path> absolutized(const std::vector<fs::path>& paths)
{
    std::vector<fs::path> result;
    result.reserve(paths.size());
    for (const auto& path : paths) {
        result.push_back(Utils::absolutize(path));
    }
    return result;
}

}


FileOperationEngine::FileOperationEngine(TrashStore& trash,
                                         SizeCache& sizes,
                                         PasteCollisionPolicy collision_policy,
                                         std::shared_ptr<spdlog::logger> logger)
    : trash(trash),
      sizes(sizes),
      collision_policy(collision_policy),
      logger(std::move(logger))
{
}


PasteCollisionPolicy FileOperationEngine::get_paste_collision_policy() const
{
    return collision_policy.load();
}


void FileOperationEngine::set_paste_collision_policy(PasteCollisionPolicy policy)
{
    collision_policy.store(policy);
}


Outcome FileOperationEngine::apply(const Command& command, const ApplyContext& context)
{
    return apply_with(command, direct_mutator, context);
}


Outcome FileOperationEngine::apply_with(const Command& command, FileMutator& mutator, const ApplyContext& context)
{
    Outcome outcome;
    try {
        outcome = std::visit([&](const auto& cmd) -> Outcome {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, CopyCommand>) {
                return apply_copy(cmd, mutator, context);
            } else if constexpr (std::is_same_v<T, MoveCommand>) {
                return apply_move(cmd, mutator, context);
            } else if constexpr (std::is_same_v<T, DeleteCommand>) {
                return apply_delete(cmd, mutator);
            } else if constexpr (std::is_same_v<T, RenameCommand>) {
                return apply_rename(cmd, mutator);
            } else if constexpr (std::is_same_v<T, CreateNewCommand>) {
                return apply_create(cmd, mutator);
            } else if constexpr (std::is_same_v<T, RestoreCommand>) {
                return apply_restore(cmd, mutator);
            } else {
                return apply_relocate(cmd, mutator);
            }
        }, command);
    } catch (const ErrorCodes::AppException& ex) {
        outcome = Outcome::failed(ex.get_error_code(), ex.get_user_message());
    } catch (const fs::filesystem_error& ex) {
        // Only lookups made before any target was touched get here.
        if (Utils::is_permission_error(ex.code())) {
            outcome = Outcome::permission_denied(command, ex.what());
        } else {
            outcome = Outcome::failed(code_for(ex.code()), ex.what());
        }
    }

    log_outcome(command, outcome, mutator.elevated());
    return outcome;
}


fs::path FileOperationEngine::paste_target(const fs::path& destination, const fs::path& source,
                                           FileMutator& mutator) const
{
    const fs::path desired = destination / source.filename();
    if (!mutator.entry_exists(desired)) {
        return desired;
    }
    if (collision_policy.load() == PasteCollisionPolicy::Fail) {
        return {};
    }
    return Utils::unique_destination(desired, [&mutator](const fs::path& path) {
        return mutator.entry_exists(path);
    });
}


void FileOperationEngine::discard_partial(const fs::path& target, FileMutator& mutator)
{
    if (!Utils::entry_exists(target)) {
        return;
    }
    try {
        mutator.remove_all(target);
    } catch (const fs::filesystem_error& ex) {
        if (logger) {
            logger->warn("Could not remove partial output '{}': {}", Utils::path_to_utf8(target), ex.what());
        }
    }
}


void FileOperationEngine::invalidate_sizes(const std::vector<fs::path>& paths)
{
    for (const auto& path : paths) {
        sizes.invalidate(path);
        sizes.invalidate_parent(path);
    }
}


Outcome FileOperationEngine::apply_copy(const CopyCommand& command, FileMutator& mutator, const ApplyContext& context)
{
    const fs::path destination = Utils::absolutize(command.destination);
    if (auto rejected = check_destination_dir(destination, mutator)) {
        return *rejected;
    }

    const std::vector<fs::path> sources = absolutized(command.sources);
    CopiedEntries done{CopyCommand{{}, destination}, {}};
    std::vector<TargetFailure> failures;

    for (std::size_t i = 0; i < sources.size(); ++i) {
        const fs::path& source = sources[i];
        if (cancel_requested(context)) {
            invalidate_sizes(done.created);
            return Outcome::cancelled(done.created);
        }
        fs::path target;
        std::vector<fs::path> written;
        try {
            const fs::file_status status = mutator.entry_status(source, false);
            if (!fs::exists(status)) {
                failures.push_back(failure_from(source, Code::PATH_NOT_FOUND));
                continue;
            }
            if (fs::is_directory(status) && Utils::is_within(destination, source)) {
                failures.push_back(failure_from(source, Code::INTO_ITSELF));
                continue;
            }
            target = paste_target(destination, source, mutator);
            if (target.empty()) {
                failures.push_back(failure_from(destination / source.filename(), Code::DESTINATION_EXISTS));
                continue;
            }

            FileTransfer::copy_tree(source, target, mutator, make_observer(context, written));
            done.command.sources.push_back(source);
            done.created.push_back(target);
        } catch (const FileTransfer::TransferCancelled&) {
            std::vector<fs::path> partial = done.created;
            partial.insert(partial.end(), written.begin(), written.end());
            invalidate_sizes(partial);
            return Outcome::cancelled(std::move(partial));
        } catch (const fs::filesystem_error& ex) {
            if (!written.empty()) {
                discard_partial(target, mutator);
            }
            if (Utils::is_permission_error(ex.code())) {
                invalidate_sizes(done.created);
                std::optional<ExecutedOperation> completed;
                if (!done.created.empty()) {
                    completed = std::move(done);
                }
                return Outcome::permission_denied(CopyCommand{tail_from(sources, i), destination},
                                                  ex.what(), std::move(completed), std::move(failures));
            }
            failures.push_back(failure_from(source, ex));
        }
    }

    invalidate_sizes(done.created);
    if (done.created.empty()) {
        return failed_batch(std::move(failures));
    }
    return Outcome::success(std::move(done), std::move(failures));
}


Outcome FileOperationEngine::apply_move(const MoveCommand& command, FileMutator& mutator, const ApplyContext& context)
{
    const fs::path destination = Utils::absolutize(command.destination);
    if (auto rejected = check_destination_dir(destination, mutator)) {
        return *rejected;
    }

    const std::vector<fs::path> sources = absolutized(command.sources);
    MovedEntries done{MoveCommand{{}, destination}, {}};
    std::vector<TargetFailure> failures;
    std::vector<fs::path> touched;

    const auto finish_touched = [&]() {
        for (const auto& move : done.moves) {
            touched.push_back(move.first);
            touched.push_back(move.second);
        }
        invalidate_sizes(touched);
    };

    for (std::size_t i = 0; i < sources.size(); ++i) {
        const fs::path& source = sources[i];
        if (cancel_requested(context)) {
            finish_touched();
            std::vector<fs::path> partial;
            for (const auto& move : done.moves) {
                partial.push_back(move.second);
            }
            return Outcome::cancelled(std::move(partial));
        }
        fs::path target;
        std::vector<fs::path> written;
        try {
            if (!mutator.entry_exists(source)) {
                failures.push_back(failure_from(source, Code::PATH_NOT_FOUND));
                continue;
            }
            if (source.parent_path() == destination) {
                failures.push_back(failure_from(source, Code::ALREADY_IN_DESTINATION));
                continue;
            }
            if (Utils::is_within(destination, source)) {
                failures.push_back(failure_from(source, Code::INTO_ITSELF));
                continue;
            }
            target = paste_target(destination, source, mutator);
            if (target.empty()) {
                failures.push_back(failure_from(destination / source.filename(), Code::DESTINATION_EXISTS));
                continue;
            }

            FileTransfer::move_path(source, target, mutator, make_observer(context, written));
            done.command.sources.push_back(source);
            done.moves.emplace_back(source, target);
        } catch (const FileTransfer::TransferCancelled&) {
            std::vector<fs::path> partial;
            for (const auto& move : done.moves) {
                partial.push_back(move.second);
            }
            partial.insert(partial.end(), written.begin(), written.end());
            touched.insert(touched.end(), written.begin(), written.end());
            finish_touched();
            return Outcome::cancelled(std::move(partial));
        } catch (const FileTransfer::SourceNotRemoved& ex) {
            // The copy is complete; keep it so nothing is lost.
            touched.push_back(source);
            touched.push_back(target);
            failures.push_back({source, code_for(ex.code()),
                                fmt::format("copied to '{}' but the source could not be removed: {}",
                                            Utils::path_to_utf8(target), ex.what())});
        } catch (const fs::filesystem_error& ex) {
            if (!written.empty()) {
                discard_partial(target, mutator);
            }
            if (Utils::is_permission_error(ex.code())) {
                finish_touched();
                std::optional<ExecutedOperation> completed;
                if (!done.moves.empty()) {
                    completed = std::move(done);
                }
                return Outcome::permission_denied(MoveCommand{tail_from(sources, i), destination},
                                                  ex.what(), std::move(completed), std::move(failures));
            }
            failures.push_back(failure_from(source, ex));
        }
    }

    finish_touched();
    if (done.moves.empty()) {
        return failed_batch(std::move(failures));
    }
    return Outcome::success(std::move(done), std::move(failures));
}


Outcome FileOperationEngine::apply_delete(const DeleteCommand& command, FileMutator& mutator)
{
    const std::vector<fs::path> targets = absolutized(command.targets);
    DeletedEntries done{DeleteCommand{}, {}};
    std::vector<TargetFailure> failures;

    for (std::size_t i = 0; i < targets.size(); ++i) {
        const fs::path& target = targets[i];
        if (Utils::is_within(trash.root(), target) || trash.contains(target)) {
            failures.push_back(failure_from(target, Code::TRASH_SELF_DELETE));
            continue;
        }

        try {
            if (!mutator.entry_exists(target)) {
                failures.push_back(failure_from(target, Code::PATH_NOT_FOUND));
                continue;
            }
            done.trashed.push_back(trash.trash(target, mutator));
            done.command.targets.push_back(target);
        } catch (const ErrorCodes::AppException& ex) {
            failures.push_back({target, ex.get_error_code(), ex.get_user_message()});
        } catch (const FileTransfer::SourceNotRemoved& ex) {
            failures.push_back({target, code_for(ex.code()),
                                fmt::format("copied into the trash as '{}' but the original could not be removed: {}",
                                            Utils::path_to_utf8(ex.path2()), ex.what())});
        } catch (const fs::filesystem_error& ex) {
            if (Utils::is_permission_error(ex.code())) {
                invalidate_sizes(touched_paths(done));
                std::optional<ExecutedOperation> completed;
                if (!done.trashed.empty()) {
                    completed = std::move(done);
                }
                return Outcome::permission_denied(DeleteCommand{tail_from(targets, i)},
                                                  ex.what(), std::move(completed), std::move(failures));
            }
            failures.push_back(failure_from(target, ex));
        }
    }

    invalidate_sizes(touched_paths(done));
    if (done.trashed.empty()) {
        return failed_batch(std::move(failures));
    }
    return Outcome::success(std::move(done), std::move(failures));
}


Outcome FileOperationEngine::apply_rename(const RenameCommand& command, FileMutator& mutator)
{
    const fs::path target = Utils::absolutize(command.target);
    if (!mutator.entry_exists(target)) {
        return Outcome::failed(Code::PATH_NOT_FOUND, user_message(Code::PATH_NOT_FOUND, target));
    }
    if (!CommandBuilder::is_valid_name(command.new_name)) {
        return Outcome::failed(Code::INVALID_NAME, user_message(Code::INVALID_NAME, Utils::utf8_to_path(command.new_name)));
    }
    const fs::path new_path = target.parent_path() / Utils::utf8_to_path(command.new_name);
    if (new_path == target) {
        return Outcome::failed(Code::NAME_UNCHANGED, user_message(Code::NAME_UNCHANGED, target));
    }
    if (mutator.entry_exists(new_path)) {
        return Outcome::failed(Code::NAME_COLLISION, user_message(Code::NAME_COLLISION, new_path));
    }

    const RenameCommand applied{target, command.new_name};
    try {
        mutator.rename(target, new_path);
    } catch (const fs::filesystem_error& ex) {
        if (Utils::is_permission_error(ex.code())) {
            return Outcome::permission_denied(applied, ex.what());
        }
        return Outcome::failed(code_for(ex.code()), ex.what(), {failure_from(target, ex)});
    }

    invalidate_sizes({target, new_path});
    return Outcome::success(RenamedEntry{applied, target, new_path});
}


Outcome FileOperationEngine::apply_create(const CreateNewCommand& command, FileMutator& mutator)
{
    const fs::path parent = Utils::absolutize(command.parent);
    if (auto rejected = check_destination_dir(parent, mutator)) {
        return *rejected;
    }
    if (!CommandBuilder::is_valid_name(command.name)) {
        return Outcome::failed(Code::INVALID_NAME, user_message(Code::INVALID_NAME, Utils::utf8_to_path(command.name)));
    }
    const fs::path created = parent / Utils::utf8_to_path(command.name);
    if (mutator.entry_exists(created)) {
        return Outcome::failed(Code::NAME_COLLISION, user_message(Code::NAME_COLLISION, created));
    }

    const CreateNewCommand applied{parent, command.name, command.kind};
    try {
        if (command.kind == CreationKind::Directory) {
            mutator.create_directory(created);
        } else {
            mutator.create_file(created);
        }
    } catch (const fs::filesystem_error& ex) {
        if (Utils::is_permission_error(ex.code())) {
            return Outcome::permission_denied(applied, ex.what());
        }
        return Outcome::failed(code_for(ex.code()), ex.what(), {failure_from(created, ex)});
    }

    invalidate_sizes({created});
    return Outcome::success(CreatedEntry{applied, created});
}


Outcome FileOperationEngine::apply_restore(const RestoreCommand& command, FileMutator& mutator)
{
    RestoredEntries done;
    std::vector<TargetFailure> failures;

    for (std::size_t i = 0; i < command.entries.size(); ++i) {
        const TrashEntry& entry = command.entries[i];
        try {
            trash.restore(entry, mutator);
            done.restored.push_back(entry);
        } catch (const ErrorCodes::AppException& ex) {
            failures.push_back({entry.original_path, ex.get_error_code(), ex.get_user_message()});
        } catch (const FileTransfer::SourceNotRemoved& ex) {
            failures.push_back({entry.original_path, code_for(ex.code()), ex.what()});
        } catch (const fs::filesystem_error& ex) {
            if (Utils::is_permission_error(ex.code())) {
                invalidate_sizes(touched_paths(done));
                std::optional<ExecutedOperation> completed;
                if (!done.restored.empty()) {
                    completed = std::move(done);
                }
                return Outcome::permission_denied(RestoreCommand{tail_from(command.entries, i)},
                                                  ex.what(), std::move(completed), std::move(failures));
            }
            failures.push_back(failure_from(entry.original_path, ex));
        }
    }

    invalidate_sizes(touched_paths(done));
    if (done.restored.empty()) {
        return failed_batch(std::move(failures));
    }
    return Outcome::success(std::move(done), std::move(failures));
}


Outcome FileOperationEngine::apply_relocate(const RelocateCommand& command, FileMutator& mutator)
{
    RelocatedEntries done;
    std::vector<TargetFailure> failures;

    for (std::size_t i = 0; i < command.moves.size(); ++i) {
        const fs::path from = Utils::absolutize(command.moves[i].first);
        const fs::path to = Utils::absolutize(command.moves[i].second);

        try {
            if (!mutator.entry_exists(from)) {
                failures.push_back(failure_from(from, Code::PATH_NOT_FOUND));
                continue;
            }
            if (mutator.entry_exists(to)) {
                failures.push_back(failure_from(to, Code::DESTINATION_EXISTS));
                continue;
            }
            FileTransfer::move_path(from, to, mutator);
            done.moves.emplace_back(from, to);
        } catch (const FileTransfer::SourceNotRemoved& ex) {
            failures.push_back({from, code_for(ex.code()), ex.what()});
        } catch (const fs::filesystem_error& ex) {
            if (Utils::is_permission_error(ex.code())) {
                invalidate_sizes(touched_paths(done));
                std::optional<ExecutedOperation> completed;
                if (!done.moves.empty()) {
                    completed = std::move(done);
                }
                return Outcome::permission_denied(RelocateCommand{tail_from(command.moves, i)},
                                                  ex.what(), std::move(completed), std::move(failures));
            }
            failures.push_back(failure_from(from, ex));
        }
    }

    invalidate_sizes(touched_paths(done));
    if (done.moves.empty()) {
        return failed_batch(std::move(failures));
    }
    return Outcome::success(std::move(done), std::move(failures));
}


void FileOperationEngine::log_outcome(const Command& command, const Outcome& outcome, bool elevated) const
{
    if (!logger) {
        return;
    }
    const std::string what = describe(command);
    const char* mode = elevated ? " [elevated]" : "";
    switch (outcome.status) {
        case OutcomeStatus::Success:
            logger->info("{}{}: done", what, mode);
            break;
        case OutcomeStatus::PermissionDenied:
            logger->warn("{}{}: permission denied ({})", what, mode, outcome.message);
            break;
        case OutcomeStatus::Failed:
            logger->error("{}{}: failed with {} ({})", what, mode,
                          ErrorCodes::ErrorCatalog::code_name(outcome.error), outcome.message);
            break;
        case OutcomeStatus::Cancelled:
            logger->warn("{}{}: cancelled, {} partial item(s) left in place", what, mode,
                         outcome.partial_output.size());
            break;
    }
    for (const auto& failure : outcome.failures) {
        logger->warn("  '{}': {} ({})", Utils::path_to_utf8(failure.path),
                     ErrorCodes::ErrorCatalog::code_name(failure.code), failure.detail);
    }
}
