#pragma once

#include <string>
#include <utility>

class TemporaryDirectory {
private:
    std::string path_; // absolute path with trailing '/', empty if none

public:
    TemporaryDirectory() = default; // Does NOT create a temporary directory

    // @p templ has to end with "XXXXXX" (6 characters 'X'); relative templates
    // are resolved against the current working directory
    explicit TemporaryDirectory(const std::string& templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&& td) noexcept : path_(std::move(td.path_)) {
        td.path_.clear();
    }
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    // NOLINTNEXTLINE(performance-noexcept-move-constructor): it throws
    TemporaryDirectory& operator=(TemporaryDirectory&& td);

    ~TemporaryDirectory();

    // Returns true if object holds a real temporary directory
    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    // Directory absolute path with trailing '/'
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Gives up the ownership of the directory, returns its path
    [[nodiscard]] std::string release() noexcept { return std::exchange(path_, std::string{}); }

    /**
     * @brief Removes the directory now
     *
     * @errors Throws an exception std::runtime_error if the removal fails; the
     *   object no longer holds the directory in either case
     */
    void remove();
};
