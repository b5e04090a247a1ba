#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "FileMutator.hpp"
#include "TestHelpers.hpp"
#include "TrashStore.hpp"
#include <filesystem>

namespace {

TrashStore::Clock fixed_clock(std::time_t value) {
    return [value]() { return value; };
}

}

TEST_CASE("trash names keep timestamp and basename recoverable") {
    CHECK(TrashStore::make_trash_name(1700000000, 0, "report.txt") == "1700000000-report.txt");
    CHECK(TrashStore::make_trash_name(1700000000, 2, "report.txt") == "1700000000.2-report.txt");

    const auto parsed = TrashStore::parse_trash_name("1700000000.2-my-report.txt");
    REQUIRE(parsed.has_value());
    CHECK(parsed->timestamp == 1700000000);
    CHECK(parsed->sequence == 2u);
    CHECK(parsed->basename == "my-report.txt");

    CHECK_FALSE(TrashStore::parse_trash_name("report.txt").has_value());
    CHECK_FALSE(TrashStore::parse_trash_name("17x-report.txt").has_value());
    CHECK_FALSE(TrashStore::parse_trash_name("1700000000-").has_value());
    CHECK_FALSE(TrashStore::parse_trash_name("99999999999999999999999-a").has_value());
}

TEST_CASE("trash moves the entry under the root and restore brings it back") {
    TempDir temp_dir;
    const auto work = temp_dir.path() / "work";
    write_file(work / "notes.txt", "hello");

    TrashStore trash(temp_dir.path() / "trash", fixed_clock(1700000000));
    DirectMutator mutator;

    const TrashEntry entry = trash.trash(work / "notes.txt", mutator);
    CHECK_FALSE(std::filesystem::exists(work / "notes.txt"));
    CHECK(entry.trash_name == "1700000000-notes.txt");
    CHECK(entry.trash_path == temp_dir.path() / "trash" / "1700000000-notes.txt");
    CHECK(entry.original_path == work / "notes.txt");
    CHECK(read_file(entry.trash_path) == "hello");

    trash.restore(entry, mutator);
    CHECK(read_file(work / "notes.txt") == "hello");
    CHECK_FALSE(std::filesystem::exists(entry.trash_path));
}

TEST_CASE("same basename deleted twice in one second gets distinct names") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a" / "same.txt", "first");
    write_file(temp_dir.path() / "b" / "same.txt", "second");

    TrashStore trash(temp_dir.path() / "trash", fixed_clock(1700000000));
    DirectMutator mutator;

    const TrashEntry first = trash.trash(temp_dir.path() / "a" / "same.txt", mutator);
    const TrashEntry second = trash.trash(temp_dir.path() / "b" / "same.txt", mutator);
    CHECK(first.trash_name == "1700000000-same.txt");
    CHECK(second.trash_name == "1700000000.1-same.txt");
    CHECK(read_file(first.trash_path) == "first");
    CHECK(read_file(second.trash_path) == "second");

    const auto listed = trash.list();
    REQUIRE(listed.size() == 2);
    CHECK(listed[0].original_path == temp_dir.path() / "a" / "same.txt");
    CHECK(listed[1].original_path == temp_dir.path() / "b" / "same.txt");
}

TEST_CASE("restore refuses to overwrite an occupied original path") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "doc.txt", "old");

    TrashStore trash(temp_dir.path() / "trash", fixed_clock(1700000000));
    DirectMutator mutator;
    const TrashEntry entry = trash.trash(temp_dir.path() / "doc.txt", mutator);
    write_file(temp_dir.path() / "doc.txt", "new");

    try {
        trash.restore(entry, mutator);
        FAIL("restore should have been refused");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::RESTORE_CONFLICT);
    }
    CHECK(read_file(temp_dir.path() / "doc.txt") == "new");
    CHECK(read_file(entry.trash_path) == "old");
}

TEST_CASE("restore of a vanished trash entry reports it missing") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "doc.txt");

    TrashStore trash(temp_dir.path() / "trash", fixed_clock(1700000000));
    DirectMutator mutator;
    const TrashEntry entry = trash.trash(temp_dir.path() / "doc.txt", mutator);
    std::filesystem::remove(entry.trash_path);

    REQUIRE_THROWS_AS(trash.restore(entry, mutator), ErrorCodes::AppException);
    CHECK_FALSE(std::filesystem::exists(temp_dir.path() / "doc.txt"));
}

TEST_CASE("paths inside the trash cannot be trashed") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "trash" / "1700000000-x.txt");

    TrashStore trash(temp_dir.path() / "trash", fixed_clock(1700000001));
    DirectMutator mutator;
    CHECK(trash.contains(temp_dir.path() / "trash" / "1700000000-x.txt"));
    CHECK_FALSE(trash.contains(temp_dir.path() / "trash-other"));

    try {
        trash.trash(temp_dir.path() / "trash" / "1700000000-x.txt", mutator);
        FAIL("trashing inside the trash should have been refused");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::TRASH_SELF_DELETE);
    }
}

TEST_CASE("a denied trash move leaves the original and frees the name") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "locked" / "file.txt");

    TrashStore trash(temp_dir.path() / "trash", fixed_clock(1700000000));
    DirectMutator mutator;
    {
        DenyWritesGuard deny({temp_dir.path() / "locked"});
        REQUIRE_THROWS_AS(trash.trash(temp_dir.path() / "locked" / "file.txt", mutator),
                          std::filesystem::filesystem_error);
    }
    CHECK(std::filesystem::exists(temp_dir.path() / "locked" / "file.txt"));

    const TrashEntry entry = trash.trash(temp_dir.path() / "locked" / "file.txt", mutator);
    CHECK(entry.trash_name == "1700000000-file.txt");
}

TEST_CASE("listing ignores foreign files and falls back to the basename") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "trash" / "README");
    write_file(temp_dir.path() / "trash" / "1600000000-old.txt");

    TrashStore trash(temp_dir.path() / "trash");
    const auto entries = trash.list();
    REQUIRE(entries.size() == 1);
    CHECK(entries.front().trash_name == "1600000000-old.txt");
    CHECK(entries.front().deleted_at == 1600000000);
    CHECK(entries.front().original_path == std::filesystem::path("old.txt"));
}
