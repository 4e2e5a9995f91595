#include <algorithm>
#include <dirent.h>
#include <fnmatch.h>
#include <memory>
#include <solranklib/errmsg.hh>
#include <solranklib/file_manip.hh>
#include <solranklib/macros/throw.hh>
#include <sys/stat.h>
#include <unistd.h>

using std::string;
using std::vector;

namespace {

using DirPtr = std::unique_ptr<DIR, int (*)(DIR*)>;

int remove_rat_impl(int dirfd, const char* path) noexcept {
    int fd = openat(dirfd, path, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
    if (fd == -1) {
        return unlinkat(dirfd, path, 0);
    }

    DIR* dir = fdopendir(fd);
    if (dir == nullptr) {
        close(fd);
        return unlinkat(dirfd, path, AT_REMOVEDIR);
    }

    int ec = 0;
    int rc = 0;
    errno = 0;
    while (dirent* file = readdir(dir)) {
        if (file->d_name[0] == '.' and
            (file->d_name[1] == '\0' or (file->d_name[1] == '.' and file->d_name[2] == '\0')))
        {
            continue;
        }

#ifdef _DIRENT_HAVE_D_TYPE
        if (file->d_type == DT_DIR || file->d_type == DT_UNKNOWN) {
#endif
            if (remove_rat_impl(fd, file->d_name)) {
                ec = errno;
                rc = -1;
                break;
            }
#ifdef _DIRENT_HAVE_D_TYPE
        } else if (unlinkat(fd, file->d_name, 0)) {
            ec = errno;
            rc = -1;
            break;
        }
#endif
        errno = 0;
    }
    if (rc == 0 and errno != 0) {
        ec = errno;
        rc = -1;
    }

    (void)closedir(dir);

    if (rc == -1) {
        errno = ec;
        return -1;
    }

    return unlinkat(dirfd, path, AT_REMOVEDIR);
}

} // namespace

int remove_rat(int dirfd, const string& pathname) noexcept {
    return remove_rat_impl(dirfd, pathname.c_str());
}

bool path_exists(const string& pathname) noexcept {
    struct stat64 st = {};
    return (stat64(pathname.c_str(), &st) == 0);
}

bool is_directory(const string& pathname) noexcept {
    struct stat64 st = {};
    return (stat64(pathname.c_str(), &st) == 0 and S_ISDIR(st.st_mode));
}

bool is_regular_file(const string& pathname) noexcept {
    struct stat64 st = {};
    return (stat64(pathname.c_str(), &st) == 0 and S_ISREG(st.st_mode));
}

vector<string> list_matching_files(const string& dir, const char* pattern) {
    DirPtr dp{opendir(dir.c_str()), closedir};
    if (dp == nullptr) {
        THROW("opendir('", dir, "')", errmsg());
    }

    string dir_prefix = dir;
    if (not dir_prefix.empty() and dir_prefix.back() != '/') {
        dir_prefix += '/';
    }

    vector<string> res;
    for (;;) {
        errno = 0;
        dirent* file = readdir(dp.get());
        if (file == nullptr) {
            if (errno != 0) {
                THROW("readdir()", errmsg());
            }
            break;
        }

        if (fnmatch(pattern, file->d_name, FNM_PERIOD) == 0 and
            is_regular_file(dir_prefix + file->d_name))
        {
            res.emplace_back(file->d_name);
        }
    }

    std::sort(res.begin(), res.end());
    return res;
}
