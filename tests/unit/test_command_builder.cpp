#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "Command.hpp"
#include "TestHelpers.hpp"
#include <filesystem>
#include <functional>

namespace {

ErrorCodes::Code code_of(const std::function<void()>& action) {
    try {
        action();
    } catch (const ErrorCodes::AppException& ex) {
        return ex.get_error_code();
    }
    return ErrorCodes::Code::NO_ERROR;
}

}

TEST_CASE("empty selections are rejected before anything runs") {
    TempDir temp_dir;
    CHECK(code_of([] { CommandBuilder::remove({}); }) == ErrorCodes::Code::EMPTY_SELECTION);
    CHECK(code_of([&] { CommandBuilder::copy({}, temp_dir.path()); }) == ErrorCodes::Code::EMPTY_SELECTION);
    CHECK(code_of([&] { CommandBuilder::move({temp_dir.path() / "a"}, {}); }) == ErrorCodes::Code::EMPTY_SELECTION);
    CHECK(code_of([] { CommandBuilder::remove({std::filesystem::path{}}); }) == ErrorCodes::Code::EMPTY_SELECTION);
}

TEST_CASE("names must be a single path component") {
    CHECK(CommandBuilder::is_valid_name("report.txt"));
    CHECK(CommandBuilder::is_valid_name(".hidden"));
    CHECK(CommandBuilder::is_valid_name("name with spaces"));
    CHECK_FALSE(CommandBuilder::is_valid_name(""));
    CHECK_FALSE(CommandBuilder::is_valid_name("."));
    CHECK_FALSE(CommandBuilder::is_valid_name(".."));
    CHECK_FALSE(CommandBuilder::is_valid_name("a/b"));
    CHECK_FALSE(CommandBuilder::is_valid_name(std::string("a\0b", 3)));
}

TEST_CASE("rename rejects unchanged and colliding names") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a.txt");
    write_file(temp_dir.path() / "b.txt");

    CHECK(code_of([&] { CommandBuilder::rename(temp_dir.path() / "a.txt", "a.txt"); })
          == ErrorCodes::Code::NAME_UNCHANGED);
    CHECK(code_of([&] { CommandBuilder::rename(temp_dir.path() / "a.txt", "b.txt"); })
          == ErrorCodes::Code::NAME_COLLISION);
    CHECK(code_of([&] { CommandBuilder::rename(temp_dir.path() / "a.txt", "sub/c.txt"); })
          == ErrorCodes::Code::INVALID_NAME);

    const Command command = CommandBuilder::rename(temp_dir.path() / "a.txt", "c.txt");
    const auto* rename = std::get_if<RenameCommand>(&command);
    REQUIRE(rename != nullptr);
    CHECK(rename->target == temp_dir.path() / "a.txt");
    CHECK(rename->new_name == "c.txt");
}

TEST_CASE("create rejects names that already exist") {
    TempDir temp_dir;
    std::filesystem::create_directories(temp_dir.path() / "docs");

    CHECK(code_of([&] { CommandBuilder::create(temp_dir.path(), "docs", CreationKind::File); })
          == ErrorCodes::Code::NAME_COLLISION);
    CHECK(code_of([&] { CommandBuilder::create(temp_dir.path(), "..", CreationKind::Directory); })
          == ErrorCodes::Code::INVALID_NAME);

    const Command command = CommandBuilder::create(temp_dir.path(), "notes", CreationKind::Directory);
    const auto* create = std::get_if<CreateNewCommand>(&command);
    REQUIRE(create != nullptr);
    CHECK(create->kind == CreationKind::Directory);
    CHECK(create->parent == temp_dir.path());
}

TEST_CASE("selections are absolutized and normalized") {
    TempDir temp_dir;
    const auto source = temp_dir.path() / "sub" / ".." / "file.txt";
    const Command command = CommandBuilder::copy({source}, temp_dir.path() / "dest" / "");
    const auto* copy = std::get_if<CopyCommand>(&command);
    REQUIRE(copy != nullptr);
    REQUIRE(copy->sources.size() == 1);
    CHECK(copy->sources.front() == temp_dir.path() / "file.txt");
    CHECK(copy->destination == temp_dir.path() / "dest");
}

TEST_CASE("commands describe themselves and list their targets") {
    const Command remove = DeleteCommand{{"/tmp/x/a.txt", "/tmp/x/b.txt"}};
    CHECK(describe(remove) == "Delete 2 items");
    CHECK(target_count(remove) == 2);

    const Command rename = RenameCommand{"/tmp/x/a.txt", "b.txt"};
    CHECK(describe(rename) == "Rename 'a.txt' to 'b.txt'");
    CHECK(target_paths(rename) == std::vector<std::filesystem::path>{"/tmp/x/a.txt"});

    const Command create = CreateNewCommand{"/tmp/x", "new", CreationKind::Directory};
    CHECK(describe(create) == "Create directory 'new'");
    CHECK(target_paths(create) == std::vector<std::filesystem::path>{"/tmp/x/new"});
}
