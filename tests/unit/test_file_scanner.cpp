#include <catch2/catch_test_macros.hpp>
#include "FileScanner.hpp"
#include "TestHelpers.hpp"
#include <fstream>
#include <filesystem>

TEST_CASE("hidden files require explicit flag") {
    TempDir temp_dir;
    write_file(temp_dir.path() / ".secret.txt");

    FileScanner scanner;
    auto entries = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files);
    REQUIRE(entries.empty());

    entries = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files | FileScanOptions::HiddenFiles);
    REQUIRE(entries.size() == 1);
    CHECK(entries.front().file_name == ".secret.txt");
    CHECK(entries.front().kind == FileKind::File);
}

TEST_CASE("entries are filtered by kind and sorted by name") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "b.txt");
    write_file(temp_dir.path() / "a.txt");
    std::filesystem::create_directories(temp_dir.path() / "dir");
    std::filesystem::create_symlink(temp_dir.path() / "a.txt", temp_dir.path() / "link");

    FileScanner scanner;
    auto files = scanner.get_directory_entries(temp_dir.path().string(), FileScanOptions::Files);
    REQUIRE(files.size() == 2);
    CHECK(files[0].file_name == "a.txt");
    CHECK(files[1].file_name == "b.txt");

    auto dirs = scanner.get_directory_entries(temp_dir.path().string(), FileScanOptions::Directories);
    REQUIRE(dirs.size() == 1);
    CHECK(dirs.front().kind == FileKind::Directory);

    auto all = scanner.get_directory_entries(temp_dir.path().string(), FileScanOptions::All);
    REQUIRE(all.size() == 4);
    CHECK(all[3].file_name == "link");
    CHECK(all[3].kind == FileKind::Symlink);
    CHECK(all[3].size.status == SizeState::Status::Uncomputed);
}

TEST_CASE("scanning never descends into subdirectories") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "nested" / "deep" / "file.txt");

    FileScanner scanner;
    const auto entries = scanner.get_directory_entries(temp_dir.path().string(), FileScanOptions::All);
    REQUIRE(entries.size() == 1);
    CHECK(entries.front().file_name == "nested");
}

TEST_CASE("scanning a missing directory throws") {
    TempDir temp_dir;
    FileScanner scanner;
    REQUIRE_THROWS_AS(scanner.get_directory_entries((temp_dir.path() / "gone").string(), FileScanOptions::All),
                      std::filesystem::filesystem_error);
}
