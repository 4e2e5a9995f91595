#pragma once

#include <string>
#include <string_view>

namespace solrank {

// File system operations the execution worker needs; every one throws
// std::runtime_error on failure
class FilesystemOperations {
public:
    FilesystemOperations() = default;
    FilesystemOperations(const FilesystemOperations&) = delete;
    FilesystemOperations(FilesystemOperations&&) = delete;
    FilesystemOperations& operator=(const FilesystemOperations&) = delete;
    FilesystemOperations& operator=(FilesystemOperations&&) = delete;

    virtual ~FilesystemOperations() = default;

    // Creates a new empty directory, returns its absolute path with a trailing '/'
    virtual std::string create_temporary_directory() = 0;

    virtual void write_file(const std::string& path, std::string_view data) = 0;

    virtual std::string read_file(const std::string& path) = 0;

    [[nodiscard]] virtual bool file_exists(const std::string& path) = 0;

    virtual void remove_recursively(const std::string& path) = 0;
};

// Operates on the local file system, temporary directories are created in
// @p root_dir
class LocalFilesystem : public FilesystemOperations {
    std::string root_dir_;

public:
    explicit LocalFilesystem(std::string root_dir);

    std::string create_temporary_directory() override;

    void write_file(const std::string& path, std::string_view data) override;

    std::string read_file(const std::string& path) override;

    [[nodiscard]] bool file_exists(const std::string& path) override;

    void remove_recursively(const std::string& path) override;
};

// Owns a directory created by FilesystemOperations and removes it on
// destruction
class SandboxDirectory {
    FilesystemOperations& fs_;
    std::string path_;

public:
    // Creates the directory
    explicit SandboxDirectory(FilesystemOperations& fs);

    SandboxDirectory(const SandboxDirectory&) = delete;
    SandboxDirectory(SandboxDirectory&&) = delete;
    SandboxDirectory& operator=(const SandboxDirectory&) = delete;
    SandboxDirectory& operator=(SandboxDirectory&&) = delete;

    // Path with a trailing '/'
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Removal errors are logged to errlog
    ~SandboxDirectory();
};

} // namespace solrank
