#include <cstdlib>
#include <solranklib/errmsg.hh>
#include <solranklib/file_manip.hh>
#include <solranklib/logger.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/temporary_directory.hh>
#include <solranklib/working_directory.hh>
#include <utility>

TemporaryDirectory::TemporaryDirectory(const std::string& templ) {
    if (templ.size() < 6 or templ.compare(templ.size() - 6, 6, "XXXXXX") != 0) {
        THROW("Invalid temporary directory template: `", templ, '`');
    }

    std::string name = templ;
    // Create directory with permissions (mode: 0700/rwx------)
    if (mkdtemp(name.data()) == nullptr) {
        THROW("Cannot create temporary directory `", templ, '`', errmsg());
    }

    if (name.front() == '/') {
        path_ = std::move(name);
    } else {
        try {
            path_ = concat_tostr(get_cwd(), name);
        } catch (...) {
            (void)remove_r(name);
            throw;
        }
    }
    path_ += '/';
}

// NOLINTNEXTLINE(performance-noexcept-move-constructor): it throws
TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& td) {
    if (this != &td) {
        remove();
        path_ = std::exchange(td.path_, std::string{});
    }
    return *this;
}

void TemporaryDirectory::remove() {
    if (exists()) {
        auto path = std::exchange(path_, std::string{});
        if (remove_r(path) == -1) {
            THROW("remove_r('", path, "') failed", errmsg());
        }
    }
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists() and remove_r(path_) == -1) {
        // We cannot throw from the destructor
        errlog("Error: remove_r('", path_, "')", errmsg());
    }
}
