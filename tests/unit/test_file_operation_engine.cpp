#include <catch2/catch_test_macros.hpp>
#include "FileOperationEngine.hpp"
#include "SizeCache.hpp"
#include "TestHelpers.hpp"
#include "TrashStore.hpp"
#include "UndoStack.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>

namespace {

struct EngineFixture {
    TempDir temp_dir;
    std::filesystem::path work{temp_dir.path() / "work"};
    SizeCache sizes;
    TrashStore trash{temp_dir.path() / "trash"};
    FileOperationEngine engine{trash, sizes};
    UndoStack undo_stack{engine};

    EngineFixture() {
        std::filesystem::create_directories(work);
    }

    Outcome apply_and_record(const Command& command) {
        Outcome outcome = engine.apply(command);
        if (outcome.executed) {
            undo_stack.record(*outcome.executed);
        }
        return outcome;
    }
};

}

TEST_CASE("rename then undo restores the original tree") {
    EngineFixture fx;
    write_file(fx.work / "a.txt", "alpha");
    const auto before = snapshot_tree(fx.work);

    const Outcome outcome = fx.apply_and_record(CommandBuilder::rename(fx.work / "a.txt", "b.txt"));
    REQUIRE(outcome.is_success());
    CHECK(read_file(fx.work / "b.txt") == "alpha");
    CHECK_FALSE(std::filesystem::exists(fx.work / "a.txt"));

    REQUIRE(fx.undo_stack.undo().succeeded());
    CHECK(snapshot_tree(fx.work) == before);
}

TEST_CASE("move then undo returns every source") {
    EngineFixture fx;
    write_file(fx.work / "src" / "one.txt", "1");
    write_file(fx.work / "src" / "dir" / "two.txt", "2");
    std::filesystem::create_directories(fx.work / "dest");
    const auto before = snapshot_tree(fx.work);

    const Outcome outcome = fx.apply_and_record(
        CommandBuilder::move({fx.work / "src" / "one.txt", fx.work / "src" / "dir"}, fx.work / "dest"));
    REQUIRE(outcome.is_success());
    CHECK(read_file(fx.work / "dest" / "one.txt") == "1");
    CHECK(read_file(fx.work / "dest" / "dir" / "two.txt") == "2");

    REQUIRE(fx.undo_stack.undo().succeeded());
    CHECK(snapshot_tree(fx.work) == before);
}

TEST_CASE("create then undo leaves the parent as it was") {
    EngineFixture fx;
    const auto before = snapshot_tree(fx.work);

    REQUIRE(fx.apply_and_record(CommandBuilder::create(fx.work, "notes.txt", CreationKind::File)).is_success());
    REQUIRE(fx.apply_and_record(CommandBuilder::create(fx.work, "folder", CreationKind::Directory)).is_success());
    CHECK(std::filesystem::is_regular_file(fx.work / "notes.txt"));
    CHECK(std::filesystem::is_directory(fx.work / "folder"));

    REQUIRE(fx.undo_stack.undo().succeeded());
    REQUIRE(fx.undo_stack.undo().succeeded());
    CHECK(snapshot_tree(fx.work) == before);
}

TEST_CASE("delete goes to the trash and undo restores it") {
    EngineFixture fx;
    write_file(fx.work / "keep" / "inner.txt", "x");
    write_file(fx.work / "gone.txt", "y");
    const auto before = snapshot_tree(fx.work);

    const Outcome outcome = fx.apply_and_record(CommandBuilder::remove({fx.work / "keep", fx.work / "gone.txt"}));
    REQUIRE(outcome.is_success());
    CHECK(count_entries(fx.work) == 0);
    CHECK(fx.trash.list().size() == 2);

    REQUIRE(fx.undo_stack.undo().succeeded());
    CHECK(snapshot_tree(fx.work) == before);
    CHECK(fx.trash.list().empty());
}

TEST_CASE("copy then undo moves the copies to the trash") {
    EngineFixture fx;
    write_file(fx.work / "a.txt", "a");
    std::filesystem::create_directories(fx.work / "dest");

    const Outcome outcome = fx.apply_and_record(CommandBuilder::copy({fx.work / "a.txt"}, fx.work / "dest"));
    REQUIRE(outcome.is_success());
    CHECK(read_file(fx.work / "dest" / "a.txt") == "a");
    CHECK(read_file(fx.work / "a.txt") == "a");

    REQUIRE(fx.undo_stack.undo().succeeded());
    CHECK_FALSE(std::filesystem::exists(fx.work / "dest" / "a.txt"));
    CHECK(fx.trash.list().size() == 1);
}

TEST_CASE("paste collisions auto-rename by default and fail when configured") {
    EngineFixture fx;
    write_file(fx.work / "report.txt", "new");
    write_file(fx.work / "dest" / "report.txt", "old");

    Outcome outcome = fx.engine.apply(CommandBuilder::copy({fx.work / "report.txt"}, fx.work / "dest"));
    REQUIRE(outcome.is_success());
    CHECK(read_file(fx.work / "dest" / "report.txt") == "old");
    CHECK(read_file(fx.work / "dest" / "report (1).txt") == "new");

    fx.engine.set_paste_collision_policy(PasteCollisionPolicy::Fail);
    outcome = fx.engine.apply(CommandBuilder::copy({fx.work / "report.txt"}, fx.work / "dest"));
    CHECK(outcome.status == OutcomeStatus::Failed);
    CHECK(outcome.error == ErrorCodes::Code::DESTINATION_EXISTS);
    CHECK(count_entries(fx.work / "dest") == 2);
}

TEST_CASE("copying a directory into itself is rejected") {
    EngineFixture fx;
    write_file(fx.work / "dir" / "f.txt");
    std::filesystem::create_directories(fx.work / "dir" / "inner");

    const Outcome outcome = fx.engine.apply(CommandBuilder::copy({fx.work / "dir"}, fx.work / "dir" / "inner"));
    CHECK(outcome.status == OutcomeStatus::Failed);
    CHECK(outcome.error == ErrorCodes::Code::INTO_ITSELF);
    CHECK(count_entries(fx.work / "dir" / "inner") == 0);
}

TEST_CASE("moving into the current parent is rejected") {
    EngineFixture fx;
    write_file(fx.work / "f.txt");

    const Outcome outcome = fx.engine.apply(CommandBuilder::move({fx.work / "f.txt"}, fx.work));
    CHECK(outcome.status == OutcomeStatus::Failed);
    CHECK(outcome.error == ErrorCodes::Code::ALREADY_IN_DESTINATION);
}

TEST_CASE("a missing source fails alone while the rest of the batch applies") {
    EngineFixture fx;
    write_file(fx.work / "a.txt");
    std::filesystem::create_directories(fx.work / "dest");

    const Outcome outcome = fx.apply_and_record(
        CommandBuilder::copy({fx.work / "a.txt", fx.work / "missing.txt"}, fx.work / "dest"));
    REQUIRE(outcome.is_partial());
    REQUIRE(outcome.failures.size() == 1);
    CHECK(outcome.failures.front().path == fx.work / "missing.txt");
    CHECK(outcome.failures.front().code == ErrorCodes::Code::PATH_NOT_FOUND);
    CHECK(std::filesystem::exists(fx.work / "dest" / "a.txt"));

    // Only the part that applied is undone.
    CHECK(fx.undo_stack.depth() == 1);
    REQUIRE(fx.undo_stack.undo().succeeded());
    CHECK(count_entries(fx.work / "dest") == 0);
}

TEST_CASE("cancelling between sources keeps what finished and reports it") {
    EngineFixture fx;
    std::vector<std::filesystem::path> sources;
    for (int i = 0; i < 10; ++i) {
        const auto path = fx.work / "src" / ("file" + std::to_string(i) + ".txt");
        write_file(path, std::to_string(i));
        sources.push_back(path);
    }
    std::filesystem::create_directories(fx.work / "dest");

    std::atomic<bool> cancel{false};
    int written = 0;
    ApplyContext context;
    context.cancel_flag = &cancel;
    context.on_progress = [&](const std::filesystem::path&) {
        if (++written == 5) {
            cancel = true;
        }
    };

    const Outcome outcome = fx.engine.apply(CommandBuilder::copy(sources, fx.work / "dest"), context);
    CHECK(outcome.status == OutcomeStatus::Cancelled);
    CHECK(outcome.error == ErrorCodes::Code::OPERATION_CANCELLED);
    REQUIRE(outcome.partial_output.size() == 5);
    CHECK(count_entries(fx.work / "dest") == 5);
    for (const auto& path : outcome.partial_output) {
        CHECK(std::filesystem::exists(path));
    }
    CHECK(count_entries(fx.work / "src") == 10);
}

TEST_CASE("cancelling inside a directory copy reports the partial tree") {
    EngineFixture fx;
    for (int i = 0; i < 10; ++i) {
        write_file(fx.work / "tree" / ("f" + std::to_string(i)), "x");
    }
    std::filesystem::create_directories(fx.work / "dest");

    std::atomic<bool> cancel{false};
    int written = 0;
    ApplyContext context;
    context.cancel_flag = &cancel;
    // The directory itself is the first entry written.
    context.on_progress = [&](const std::filesystem::path&) {
        if (++written == 6) {
            cancel = true;
        }
    };

    const Outcome outcome = fx.engine.apply(CommandBuilder::copy({fx.work / "tree"}, fx.work / "dest"), context);
    REQUIRE(outcome.status == OutcomeStatus::Cancelled);
    CHECK(outcome.partial_output.size() == 6);
    CHECK(count_entries(fx.work / "dest" / "tree") == 5);
}

TEST_CASE("permission denied narrows the command to the unfinished targets") {
    EngineFixture fx;
    write_file(fx.work / "open" / "a.txt");
    write_file(fx.work / "locked" / "b.txt");
    write_file(fx.work / "open" / "c.txt");

    DenyWritesGuard deny({fx.work / "locked"});
    const Outcome outcome = fx.engine.apply(CommandBuilder::remove(
        {fx.work / "open" / "a.txt", fx.work / "locked" / "b.txt", fx.work / "open" / "c.txt"}));

    REQUIRE(outcome.status == OutcomeStatus::PermissionDenied);
    CHECK(outcome.error == ErrorCodes::Code::PERMISSION_DENIED);
    REQUIRE(outcome.pending.has_value());
    const auto* pending = std::get_if<DeleteCommand>(&*outcome.pending);
    REQUIRE(pending != nullptr);
    const std::vector<std::filesystem::path> expected{fx.work / "locked" / "b.txt", fx.work / "open" / "c.txt"};
    CHECK(pending->targets == expected);

    REQUIRE(outcome.executed.has_value());
    const auto* done = std::get_if<DeletedEntries>(&*outcome.executed);
    REQUIRE(done != nullptr);
    REQUIRE(done->trashed.size() == 1);
    CHECK(done->trashed.front().original_path == fx.work / "open" / "a.txt");
    CHECK(std::filesystem::exists(fx.work / "locked" / "b.txt"));
}

TEST_CASE("deleting the trash or one of its ancestors is refused") {
    EngineFixture fx;
    write_file(fx.trash.root() / "1700000000-x.txt");

    Outcome outcome = fx.engine.apply(DeleteCommand{{fx.trash.root()}});
    CHECK(outcome.error == ErrorCodes::Code::TRASH_SELF_DELETE);

    outcome = fx.engine.apply(DeleteCommand{{fx.temp_dir.path()}});
    CHECK(outcome.error == ErrorCodes::Code::TRASH_SELF_DELETE);
    CHECK(std::filesystem::exists(fx.trash.root() / "1700000000-x.txt"));
}

TEST_CASE("applying a command invalidates the sizes it affects") {
    EngineFixture fx;
    write_file(fx.work / "a.txt", "123");
    REQUIRE(fx.sizes.size_of(fx.work).bytes == 3);

    REQUIRE(fx.engine.apply(CommandBuilder::create(fx.work, "b.txt", CreationKind::File)).is_success());
    CHECK_FALSE(fx.sizes.peek(fx.work).has_value());

    write_file(fx.work / "b.txt", "45");
    CHECK(fx.sizes.size_of(fx.work).bytes == 5);
}

TEST_CASE("rename and create recheck names at apply time") {
    EngineFixture fx;
    write_file(fx.work / "a.txt");
    write_file(fx.work / "b.txt");

    Outcome outcome = fx.engine.apply(RenameCommand{fx.work / "a.txt", "b.txt"});
    CHECK(outcome.error == ErrorCodes::Code::NAME_COLLISION);

    outcome = fx.engine.apply(RenameCommand{fx.work / "a.txt", "a.txt"});
    CHECK(outcome.error == ErrorCodes::Code::NAME_UNCHANGED);

    outcome = fx.engine.apply(CreateNewCommand{fx.work, "x/y", CreationKind::File});
    CHECK(outcome.error == ErrorCodes::Code::INVALID_NAME);

    outcome = fx.engine.apply(RenameCommand{fx.work / "missing", "z"});
    CHECK(outcome.error == ErrorCodes::Code::PATH_NOT_FOUND);
}
