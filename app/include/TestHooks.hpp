#pragma once

#include <filesystem>
#include <functional>

namespace TestHooks {

// Returns true when writing `path` should fail with EACCES for an unprivileged process.
using WriteAccessProbe = std::function<bool(const std::filesystem::path& path)>;
void set_write_access_probe(WriteAccessProbe probe);
void reset_write_access_probe();
bool write_access_denied(const std::filesystem::path& path);

// Returns true when the directory `dir` cannot be listed or searched by an unprivileged process.
using ReadAccessProbe = std::function<bool(const std::filesystem::path& dir)>;
void set_read_access_probe(ReadAccessProbe probe);
void reset_read_access_probe();
bool read_access_denied(const std::filesystem::path& dir);

} // namespace TestHooks
