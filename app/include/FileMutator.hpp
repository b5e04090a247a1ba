#ifndef FILE_MUTATOR_HPP
#define FILE_MUTATOR_HPP

#include <filesystem>
#include <vector>

class IElevationBackend;

/**
 * @brief Primitive filesystem mutations used by the engine and the trash store.
 *
 * Every method throws std::filesystem::filesystem_error on failure; the error
 * code distinguishes permission problems (EACCES/EPERM) and cross-device
 * renames (EXDEV) from other I/O failures. Lookups and listings go through the
 * mutator too, so an elevated mutator can read what the user cannot.
 */
class FileMutator {
public:
    virtual ~FileMutator() = default;

    virtual void rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
    virtual void copy_file(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
    virtual void copy_symlink(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
    virtual void create_directory(const std::filesystem::path& path) = 0;
    virtual void create_file(const std::filesystem::path& path) = 0;
    virtual void remove_all(const std::filesystem::path& path) = 0;

    // Status of `path` itself, or of its target when `follow` is set. A missing
    // entry yields file_type::not_found; a denied lookup throws.
    virtual std::filesystem::file_status entry_status(const std::filesystem::path& path, bool follow) = 0;
    // Children of `dir`, sorted by name.
    virtual std::vector<std::filesystem::path> list_directory(const std::filesystem::path& dir) = 0;

    virtual bool elevated() const = 0;

    bool entry_exists(const std::filesystem::path& path);
};

// In-process std::filesystem calls with the rights of the running user.
class DirectMutator : public FileMutator {
public:
    void rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
    void copy_file(const std::filesystem::path& from, const std::filesystem::path& to) override;
    void copy_symlink(const std::filesystem::path& from, const std::filesystem::path& to) override;
    void create_directory(const std::filesystem::path& path) override;
    void create_file(const std::filesystem::path& path) override;
    void remove_all(const std::filesystem::path& path) override;
    std::filesystem::file_status entry_status(const std::filesystem::path& path, bool follow) override;
    std::vector<std::filesystem::path> list_directory(const std::filesystem::path& dir) override;

    bool elevated() const override { return false; }

private:
    void check_write_access(const std::filesystem::path& path, const char* operation) const;
    void check_read_access(const std::filesystem::path& dir, const char* operation) const;
};

// Runs coreutils through the elevation backend (sudo -n mv/cp/mkdir/touch/rm/stat/find).
class ElevatedMutator : public FileMutator {
public:
    explicit ElevatedMutator(IElevationBackend& backend);

    void rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
    void copy_file(const std::filesystem::path& from, const std::filesystem::path& to) override;
    void copy_symlink(const std::filesystem::path& from, const std::filesystem::path& to) override;
    void create_directory(const std::filesystem::path& path) override;
    void create_file(const std::filesystem::path& path) override;
    void remove_all(const std::filesystem::path& path) override;
    std::filesystem::file_status entry_status(const std::filesystem::path& path, bool follow) override;
    std::vector<std::filesystem::path> list_directory(const std::filesystem::path& dir) override;

    bool elevated() const override { return true; }

private:
    IElevationBackend& backend;
};

#endif
