#include "FileMutator.hpp"

#include "ElevationBackend.hpp"
#include "TestHooks.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::error_code classify_tool_failure(const ProcessResult& result)
{
    if (!result.launched) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    const std::string& err = result.stderr_text;
    if (err.find("a password is required") != std::string::npos
        || err.find("Permission denied") != std::string::npos
        || err.find("Operation not permitted") != std::string::npos
        || err.find("not allowed to") != std::string::npos) {
        return std::make_error_code(std::errc::permission_denied);
    }
    if (err.find("File exists") != std::string::npos) {
        return std::make_error_code(std::errc::file_exists);
    }
    if (err.find("No such file or directory") != std::string::npos) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    if (err.find("Not a directory") != std::string::npos) {
        return std::make_error_code(std::errc::not_a_directory);
    }
    if (err.find("No space left") != std::string::npos) {
        return std::make_error_code(std::errc::no_space_on_device);
    }
    return std::make_error_code(std::errc::io_error);
}

ProcessResult run_tool(IElevationBackend& backend, const std::vector<std::string>& argv,
                       const fs::path& first, const fs::path& second = {})
{
    ProcessResult result = backend.run_elevated(argv);
    if (result.succeeded()) {
        return result;
    }
    std::string message = "elevated " + argv.front() + " failed";
    if (!result.stderr_text.empty()) {
        message += ": " + result.stderr_text;
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
            message.pop_back();
        }
    }
    if (second.empty()) {
        throw fs::filesystem_error(message, first, classify_tool_failure(result));
    }
    throw fs::filesystem_error(message, first, second, classify_tool_failure(result));
}

// Maps the %F field of stat(1).
fs::file_type file_type_from_stat(std::string description)
{
    while (!description.empty() && (description.back() == '\n' || description.back() == '\r')) {
        description.pop_back();
    }
    if (description == "regular file" || description == "regular empty file") {
        return fs::file_type::regular;
    }
    if (description == "directory") {
        return fs::file_type::directory;
    }
    if (description == "symbolic link") {
        return fs::file_type::symlink;
    }
    if (description == "fifo") {
        return fs::file_type::fifo;
    }
    if (description == "socket") {
        return fs::file_type::socket;
    }
    if (description == "character special file") {
        return fs::file_type::character;
    }
    if (description == "block special file") {
        return fs::file_type::block;
    }
    return fs::file_type::unknown;
}

}


bool FileMutator::entry_exists(const fs::path& path)
{
    return fs::exists(entry_status(path, false));
}


void DirectMutator::check_write_access(const fs::path& path, const char* operation) const
{
    if (TestHooks::write_access_denied(path)) {
        throw fs::filesystem_error(operation, path, std::make_error_code(std::errc::permission_denied));
    }
}


void DirectMutator::check_read_access(const fs::path& dir, const char* operation) const
{
    if (TestHooks::read_access_denied(dir)) {
        throw fs::filesystem_error(operation, dir, std::make_error_code(std::errc::permission_denied));
    }
}


void DirectMutator::rename(const fs::path& from, const fs::path& to)
{
    check_write_access(from, "rename");
    check_write_access(to, "rename");
    fs::rename(from, to);
}


void DirectMutator::copy_file(const fs::path& from, const fs::path& to)
{
    check_write_access(to, "copy_file");
    fs::copy_file(from, to, fs::copy_options::none);
}


void DirectMutator::copy_symlink(const fs::path& from, const fs::path& to)
{
    check_write_access(to, "copy_symlink");
    fs::copy_symlink(from, to);
}


void DirectMutator::create_directory(const fs::path& path)
{
    check_write_access(path, "create_directory");
    std::error_code ec;
    if (!fs::create_directory(path, ec)) {
        throw fs::filesystem_error("create_directory", path,
                                   ec ? ec : std::make_error_code(std::errc::file_exists));
    }
}


void DirectMutator::create_file(const fs::path& path)
{
    check_write_access(path, "create_file");
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
    if (fd < 0) {
        throw fs::filesystem_error("create_file", path, std::error_code(errno, std::generic_category()));
    }
    ::close(fd);
}


void DirectMutator::remove_all(const fs::path& path)
{
    check_write_access(path, "remove_all");
    fs::remove_all(path);
}


fs::file_status DirectMutator::entry_status(const fs::path& path, bool follow)
{
    if (path.has_relative_path()) {
        check_read_access(path.parent_path(), "entry_status");
    }
    std::error_code ec;
    const fs::file_status status = follow ? fs::status(path, ec) : fs::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        throw fs::filesystem_error("entry_status", path, ec);
    }
    return status;
}


std::vector<fs::path> DirectMutator::list_directory(const fs::path& dir)
{
    check_read_access(dir, "list_directory");
    std::vector<fs::path> children;
    for (const auto& entry : fs::directory_iterator(dir)) {
        children.push_back(entry.path());
    }
    std::sort(children.begin(), children.end());
    return children;
}


ElevatedMutator::ElevatedMutator(IElevationBackend& backend)
    : backend(backend)
{
}


void ElevatedMutator::rename(const fs::path& from, const fs::path& to)
{
    run_tool(backend, {"mv", "-T", "--", from.string(), to.string()}, from, to);
}


void ElevatedMutator::copy_file(const fs::path& from, const fs::path& to)
{
    run_tool(backend, {"cp", "-P", "-T", "--preserve=mode,timestamps", "--", from.string(), to.string()},
             from, to);
}


void ElevatedMutator::copy_symlink(const fs::path& from, const fs::path& to)
{
    run_tool(backend, {"cp", "-P", "-T", "--", from.string(), to.string()}, from, to);
}


void ElevatedMutator::create_directory(const fs::path& path)
{
    run_tool(backend, {"mkdir", "--", path.string()}, path);
}


void ElevatedMutator::create_file(const fs::path& path)
{
    if (entry_exists(path)) {
        throw fs::filesystem_error("create_file", path, std::make_error_code(std::errc::file_exists));
    }
    run_tool(backend, {"touch", "--", path.string()}, path);
}


void ElevatedMutator::remove_all(const fs::path& path)
{
    run_tool(backend, {"rm", "-rf", "--", path.string()}, path);
}


fs::file_status ElevatedMutator::entry_status(const fs::path& path, bool follow)
{
    std::vector<std::string> argv{"stat"};
    if (follow) {
        argv.push_back("-L");
    }
    argv.insert(argv.end(), {"-c", "%F", "--", path.string()});

    const ProcessResult result = backend.run_elevated(argv);
    if (result.succeeded()) {
        return fs::file_status(file_type_from_stat(result.stdout_text));
    }
    const std::error_code ec = classify_tool_failure(result);
    if (result.launched && (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)) {
        return fs::file_status(fs::file_type::not_found);
    }
    throw fs::filesystem_error("elevated stat failed: " + result.stderr_text, path, ec);
}


std::vector<fs::path> ElevatedMutator::list_directory(const fs::path& dir)
{
    const ProcessResult result = run_tool(
        backend, {"find", dir.string(), "-mindepth", "1", "-maxdepth", "1", "-printf", "%f\\0"}, dir);

    std::vector<fs::path> children;
    std::size_t start = 0;
    while (start < result.stdout_text.size()) {
        const std::size_t end = result.stdout_text.find('\0', start);
        const std::size_t stop = end == std::string::npos ? result.stdout_text.size() : end;
        if (stop > start) {
            children.push_back(dir / result.stdout_text.substr(start, stop - start));
        }
        start = stop + 1;
    }
    std::sort(children.begin(), children.end());
    return children;
}
