#include <exception>
#include <solrank/execution/filesystem_operations.hh>
#include <solranklib/errmsg.hh>
#include <solranklib/file_contents.hh>
#include <solranklib/file_manip.hh>
#include <solranklib/logger.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/temporary_directory.hh>

namespace solrank {

LocalFilesystem::LocalFilesystem(std::string root_dir) : root_dir_(std::move(root_dir)) {
    if (root_dir_.empty()) {
        root_dir_ = "./";
    } else if (root_dir_.back() != '/') {
        root_dir_ += '/';
    }
}

std::string LocalFilesystem::create_temporary_directory() {
    return TemporaryDirectory{concat_tostr(root_dir_, "solrank-sandbox.XXXXXX")}.release();
}

void LocalFilesystem::write_file(const std::string& path, std::string_view data) {
    put_file_contents(path, data);
}

std::string LocalFilesystem::read_file(const std::string& path) {
    return get_file_contents(path);
}

bool LocalFilesystem::file_exists(const std::string& path) { return is_regular_file(path); }

void LocalFilesystem::remove_recursively(const std::string& path) {
    if (remove_r(path) == -1) {
        THROW("remove_r('", path, "') failed", errmsg());
    }
}

SandboxDirectory::SandboxDirectory(FilesystemOperations& fs)
: fs_(fs)
, path_(fs.create_temporary_directory()) {}

SandboxDirectory::~SandboxDirectory() {
    try {
        fs_.remove_recursively(path_);
    } catch (const std::exception& e) {
        errlog("Error: failed to remove sandbox directory ", path_, ": ", e.what());
    }
}

} // namespace solrank
