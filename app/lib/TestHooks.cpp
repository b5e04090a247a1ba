#include "TestHooks.hpp"

#include <mutex>
#include <utility>

namespace TestHooks {

namespace {
std::mutex& probe_mutex()
{
    static std::mutex mutex;
    return mutex;
}

WriteAccessProbe& write_access_probe()
{
    static WriteAccessProbe probe;
    return probe;
}

ReadAccessProbe& read_access_probe()
{
    static ReadAccessProbe probe;
    return probe;
}
}

void set_write_access_probe(WriteAccessProbe probe)
{
    std::lock_guard<std::mutex> lock(probe_mutex());
    write_access_probe() = std::move(probe);
}

void reset_write_access_probe()
{
    std::lock_guard<std::mutex> lock(probe_mutex());
    write_access_probe() = nullptr;
}

bool write_access_denied(const std::filesystem::path& path)
{
    WriteAccessProbe probe;
    {
        std::lock_guard<std::mutex> lock(probe_mutex());
        probe = write_access_probe();
    }
    return probe && probe(path);
}

void set_read_access_probe(ReadAccessProbe probe)
{
    std::lock_guard<std::mutex> lock(probe_mutex());
    read_access_probe() = std::move(probe);
}

void reset_read_access_probe()
{
    std::lock_guard<std::mutex> lock(probe_mutex());
    read_access_probe() = nullptr;
}

bool read_access_denied(const std::filesystem::path& dir)
{
    ReadAccessProbe probe;
    {
        std::lock_guard<std::mutex> lock(probe_mutex());
        probe = read_access_probe();
    }
    return probe && probe(dir);
}

} // namespace TestHooks
