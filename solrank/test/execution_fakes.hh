#pragma once

#include <chrono>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <solrank/execution/filesystem_operations.hh>
#include <solrank/execution/process_runner.hh>
#include <solranklib/concat_tostr.hh>
#include <solranklib/macros/throw.hh>
#include <string>
#include <vector>

// In-memory file system, safe to use from many threads
class FakeFilesystem : public solrank::FilesystemOperations {
    std::mutex mtx_;
    std::map<std::string, std::string> files_;
    std::set<std::string> dirs_;
    size_t created_ = 0;

public:
    bool fail_creating = false;
    bool fail_writing = false;

    std::string create_temporary_directory() override {
        std::lock_guard guard{mtx_};
        if (fail_creating) {
            THROW("mkdtemp() failed - No space left on device (os error 28)");
        }
        auto dir = concat_tostr("/sandbox/", ++created_, '/');
        dirs_.emplace(dir);
        return dir;
    }

    void write_file(const std::string& path, std::string_view data) override {
        std::lock_guard guard{mtx_};
        if (fail_writing) {
            THROW("write() failed - Disk quota exceeded (os error 122)");
        }
        files_[path] = data;
    }

    std::string read_file(const std::string& path) override {
        std::lock_guard guard{mtx_};
        auto it = files_.find(path);
        if (it == files_.end()) {
            THROW("open('", path, "') failed - No such file or directory (os error 2)");
        }
        return it->second;
    }

    bool file_exists(const std::string& path) override {
        std::lock_guard guard{mtx_};
        return files_.count(path) > 0;
    }

    void remove_recursively(const std::string& path) override {
        std::lock_guard guard{mtx_};
        if (dirs_.erase(path) == 0) {
            THROW("remove_r('", path, "') failed - No such file or directory (os error 2)");
        }
        for (auto it = files_.begin(); it != files_.end();) {
            it = (it->first.compare(0, path.size(), path) == 0 ? files_.erase(it) : std::next(it));
        }
    }

    size_t directories_alive() {
        std::lock_guard guard{mtx_};
        return dirs_.size();
    }

    size_t directories_created() {
        std::lock_guard guard{mtx_};
        return created_;
    }
};

struct RunCall {
    std::vector<std::string> argv;
    std::string working_dir;
    std::string program; // contents of program.py at the time of the call
    solrank::ProcessLimits limits;
};

// Simulates the interpreter: @p script reads program.py and writes the
// output files of the harness
class FakeProcessRunner : public solrank::ProcessRunner {
public:
    using Script = std::function<solrank::ProcessStatus(
        const std::string& program, const std::string& dir, FakeFilesystem& fs
    )>;

private:
    FakeFilesystem& fs_;
    Script script_;
    std::mutex mtx_;
    std::vector<RunCall> calls_;

public:
    FakeProcessRunner(FakeFilesystem& fs, Script script) : fs_(fs), script_(std::move(script)) {}

    solrank::ProcessStatus run(
        const std::vector<std::string>& argv,
        const std::string& working_dir,
        const std::string& stdout_path,
        const std::string& stderr_path,
        const solrank::ProcessLimits& limits
    ) override {
        auto program = fs_.read_file(working_dir + "program.py");
        {
            std::lock_guard guard{mtx_};
            calls_.push_back({argv, working_dir, program, limits});
        }
        fs_.write_file(stdout_path, "");
        fs_.write_file(stderr_path, "");
        return script_(program, working_dir, fs_);
    }

    std::vector<RunCall> calls() {
        std::lock_guard guard{mtx_};
        return calls_;
    }
};

inline solrank::ProcessStatus exited(int code) {
    return {
        .timed_out = false,
        .exited_normally = code == 0,
        .description = concat_tostr("exited with ", code),
        .runtime = std::chrono::milliseconds{40},
    };
}
