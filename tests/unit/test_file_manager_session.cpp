#include <catch2/catch_test_macros.hpp>
#include "FileManagerSession.hpp"
#include "FileOperationEngine.hpp"
#include "OperationWorker.hpp"
#include "PrivilegeEscalationManager.hpp"
#include "SizeCache.hpp"
#include "TestHelpers.hpp"
#include "TrashStore.hpp"
#include "UndoStack.hpp"
#include <algorithm>
#include <filesystem>

namespace {

struct SessionFixture {
    TempDir temp_dir;
    std::filesystem::path work{temp_dir.path() / "work"};
    SizeCache sizes;
    TrashStore trash{temp_dir.path() / "trash"};
    FileOperationEngine engine{trash, sizes};
    FakeElevationBackend backend;
    PrivilegeEscalationManager escalation{engine, backend};
    UndoStack undo_stack{engine};
    OperationWorker worker{8};
    FileManagerSession session{engine, undo_stack, escalation, worker};

    SessionFixture() {
        std::filesystem::create_directories(work);
    }

    std::vector<SessionEvent> settle() {
        worker.wait_idle();
        return session.poll();
    }
};

bool has_kind(const std::vector<SessionEvent>& events, SessionEvent::Kind kind) {
    return std::any_of(events.begin(), events.end(), [kind](const SessionEvent& e) { return e.kind == kind; });
}

}

TEST_CASE("an applied command is reported and recorded for undo") {
    SessionFixture fx;
    REQUIRE(fx.session.submit(CommandBuilder::create(fx.work, "new.txt", CreationKind::File)));

    const auto events = fx.settle();
    REQUIRE(events.size() == 1);
    CHECK(events.front().kind == SessionEvent::Kind::Applied);
    CHECK(events.front().job_id != 0);
    CHECK(fx.session.undo_depth() == 1);

    REQUIRE(fx.session.request_undo());
    const auto undo_events = fx.settle();
    REQUIRE(undo_events.size() == 1);
    CHECK(undo_events.front().kind == SessionEvent::Kind::Undone);
    CHECK_FALSE(std::filesystem::exists(fx.work / "new.txt"));
}

TEST_CASE("undo queued right behind a command reverses that command") {
    SessionFixture fx;
    fx.session.submit(CommandBuilder::create(fx.work, "dir", CreationKind::Directory));
    fx.session.request_undo();

    const auto events = fx.settle();
    REQUIRE(events.size() == 2);
    CHECK(events[0].kind == SessionEvent::Kind::Applied);
    CHECK(events[1].kind == SessionEvent::Kind::Undone);
    CHECK_FALSE(std::filesystem::exists(fx.work / "dir"));
}

TEST_CASE("undo with empty history reports nothing to undo") {
    SessionFixture fx;
    fx.session.request_undo();
    const auto events = fx.settle();
    REQUIRE(events.size() == 1);
    CHECK(events.front().kind == SessionEvent::Kind::NothingToUndo);
}

TEST_CASE("a denied command waits for a credential and then runs elevated") {
    SessionFixture fx;
    write_file(fx.work / "locked" / "a.txt", "x");
    DenyWritesGuard deny({fx.work / "locked"});

    fx.session.submit(CommandBuilder::rename(fx.work / "locked" / "a.txt", "b.txt"));
    const auto events = fx.settle();
    REQUIRE(events.size() == 1);
    CHECK(events.front().kind == SessionEvent::Kind::NeedsEscalation);
    REQUIRE(fx.session.escalation_pending());
    CHECK(fx.session.commands_awaiting_escalation().size() == 1);
    CHECK(fx.session.undo_depth() == 0);

    std::string password = "hunter2";
    CHECK_FALSE(fx.session.provide_credential(password).has_value());
    CHECK(password.empty());
    CHECK_FALSE(fx.session.escalation_pending());

    const auto retried = fx.settle();
    REQUIRE(retried.size() == 1);
    CHECK(retried.front().kind == SessionEvent::Kind::Applied);
    CHECK(read_file(fx.work / "locked" / "b.txt") == "x");
    CHECK(fx.session.undo_depth() == 1);
    CHECK_FALSE(fx.escalation.state().active);
}

TEST_CASE("a later denied command asks again instead of reusing the finished session") {
    SessionFixture fx;
    DenyWritesGuard deny({fx.work});

    fx.session.submit(CommandBuilder::create(fx.work, "one", CreationKind::File));
    fx.settle();
    std::string password = "hunter2";
    REQUIRE_FALSE(fx.session.provide_credential(password).has_value());
    REQUIRE(fx.settle().size() == 1);
    REQUIRE(std::filesystem::exists(fx.work / "one"));
    const int runs_before = fx.backend.elevated_runs.load();

    fx.session.submit(CommandBuilder::create(fx.work, "two", CreationKind::File));
    const auto events = fx.settle();
    REQUIRE(events.size() == 1);
    CHECK(events.front().kind == SessionEvent::Kind::NeedsEscalation);
    CHECK(fx.session.escalation_pending());
    CHECK(fx.backend.elevated_runs.load() == runs_before);
    CHECK_FALSE(std::filesystem::exists(fx.work / "two"));
}

TEST_CASE("a rejected credential drops the waiting command") {
    SessionFixture fx;
    write_file(fx.work / "locked" / "a.txt");
    DenyWritesGuard deny({fx.work / "locked"});

    fx.session.submit(CommandBuilder::remove({fx.work / "locked" / "a.txt"}));
    fx.settle();
    REQUIRE(fx.session.escalation_pending());

    std::string password = "wrong";
    CHECK(fx.session.provide_credential(password) == std::optional<AuthError>(AuthError::InvalidCredential));
    CHECK(password.empty());
    CHECK_FALSE(fx.session.escalation_pending());

    const auto events = fx.settle();
    CHECK(has_kind(events, SessionEvent::Kind::EscalationFailed));
    CHECK(std::filesystem::exists(fx.work / "locked" / "a.txt"));
    CHECK(fx.session.undo_depth() == 0);
}

TEST_CASE("declining escalation leaves the filesystem untouched") {
    SessionFixture fx;
    DenyWritesGuard deny({fx.work});

    fx.session.submit(CommandBuilder::create(fx.work, "x", CreationKind::File));
    fx.settle();
    REQUIRE(fx.session.escalation_pending());

    fx.session.decline_escalation();
    const auto events = fx.session.poll();
    REQUIRE(events.size() == 1);
    CHECK(events.front().kind == SessionEvent::Kind::EscalationDeclined);
    CHECK_FALSE(std::filesystem::exists(fx.work / "x"));
    CHECK(fx.backend.validations.load() == 0);
}

TEST_CASE("batch scope retries every waiting command with one credential") {
    SessionFixture fx;
    fx.session.set_escalation_scope(EscalationScope::Batch);
    write_file(fx.work / "locked" / "a.txt");
    DenyWritesGuard deny({fx.work / "locked"});

    fx.session.submit(CommandBuilder::create(fx.work / "locked", "one", CreationKind::File));
    fx.session.submit(CommandBuilder::rename(fx.work / "locked" / "a.txt", "b.txt"));
    fx.settle();
    REQUIRE(fx.session.commands_awaiting_escalation().size() == 2);

    std::string password = "hunter2";
    REQUIRE_FALSE(fx.session.provide_credential(password).has_value());
    const auto events = fx.settle();
    REQUIRE(events.size() == 2);
    CHECK(events[0].kind == SessionEvent::Kind::Applied);
    CHECK(events[1].kind == SessionEvent::Kind::Applied);
    CHECK(std::filesystem::exists(fx.work / "locked" / "one"));
    CHECK(std::filesystem::exists(fx.work / "locked" / "b.txt"));
    CHECK(fx.backend.validations.load() == 1);
    CHECK(fx.session.undo_depth() == 2);
}

TEST_CASE("single-command scope asks once per waiting command") {
    SessionFixture fx;
    DenyWritesGuard deny({fx.work});

    fx.session.submit(CommandBuilder::create(fx.work, "one", CreationKind::File));
    fx.session.submit(CommandBuilder::create(fx.work, "two", CreationKind::File));
    fx.settle();
    REQUIRE(fx.session.commands_awaiting_escalation().size() == 1);

    fx.session.decline_escalation();
    CHECK(fx.session.escalation_pending());
    fx.session.decline_escalation();
    CHECK_FALSE(fx.session.escalation_pending());
}
