#include <catch2/catch_test_macros.hpp>
#include "SizeCache.hpp"
#include "TestHelpers.hpp"
#include <filesystem>

TEST_CASE("files report their own size") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "five.txt", "12345");

    SizeCache cache;
    const SizeState state = cache.size_of(temp_dir.path() / "five.txt");
    REQUIRE(state.is_computed());
    CHECK(state.bytes == 5);
}

TEST_CASE("directory size counts immediate files only") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a.txt", "123");
    write_file(temp_dir.path() / ".hidden", "45");
    write_file(temp_dir.path() / "nested" / "deep.txt", "0123456789");

    SizeCache cache;
    const SizeState state = cache.size_of(temp_dir.path());
    REQUIRE(state.is_computed());
    CHECK(state.bytes == 5);
}

TEST_CASE("missing paths are unavailable with a reason") {
    TempDir temp_dir;
    SizeCache cache;
    const SizeState state = cache.size_of(temp_dir.path() / "nope");
    CHECK(state.status == SizeState::Status::Unavailable);
    CHECK_FALSE(state.reason.empty());
}

TEST_CASE("cached sizes stay until invalidated") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "grow.txt", "12");

    SizeCache cache;
    CHECK_FALSE(cache.peek(temp_dir.path() / "grow.txt").has_value());
    CHECK(cache.size_of(temp_dir.path() / "grow.txt").bytes == 2);

    write_file(temp_dir.path() / "grow.txt", "123456");
    CHECK(cache.size_of(temp_dir.path() / "grow.txt").bytes == 2);

    cache.invalidate(temp_dir.path() / "grow.txt");
    CHECK_FALSE(cache.peek(temp_dir.path() / "grow.txt").has_value());
    CHECK(cache.size_of(temp_dir.path() / "grow.txt").bytes == 6);
}

TEST_CASE("invalidate drops descendants but invalidate_parent only the parent") {
    TempDir temp_dir;
    const auto dir = temp_dir.path() / "dir";
    write_file(dir / "a.txt", "1");
    write_file(dir / "sub" / "b.txt", "22");
    write_file(temp_dir.path() / "dir2" / "c.txt", "333");

    SizeCache cache;
    cache.size_of(dir);
    cache.size_of(dir / "a.txt");
    cache.size_of(dir / "sub" / "b.txt");
    cache.size_of(temp_dir.path() / "dir2");
    REQUIRE(cache.cached_count() == 4);

    cache.invalidate_parent(dir / "a.txt");
    CHECK_FALSE(cache.peek(dir).has_value());
    CHECK(cache.peek(dir / "a.txt").has_value());
    CHECK(cache.peek(dir / "sub" / "b.txt").has_value());

    cache.invalidate(dir);
    CHECK_FALSE(cache.peek(dir / "a.txt").has_value());
    CHECK_FALSE(cache.peek(dir / "sub" / "b.txt").has_value());
    // A sibling sharing the name prefix survives.
    CHECK(cache.peek(temp_dir.path() / "dir2").has_value());
}

TEST_CASE("a file added in a subdirectory leaves the parent's cached size alone") {
    TempDir temp_dir;
    const auto dir = temp_dir.path() / "dir";
    write_file(dir / "a.txt", "1");
    std::filesystem::create_directories(dir / "sub");

    SizeCache cache;
    REQUIRE(cache.size_of(dir).bytes == 1);

    write_file(dir / "sub" / "new.bin", "0123456789");
    CHECK(cache.size_of(dir).bytes == 1);

    cache.invalidate(dir / "sub" / "new.bin");
    cache.invalidate_parent(dir / "sub" / "new.bin");
    REQUIRE(cache.peek(dir).has_value());
    CHECK(cache.peek(dir)->bytes == 1);

    cache.invalidate(dir);
    CHECK(cache.size_of(dir).bytes == 1);
}
