#include <climits>
#include <solranklib/errmsg.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/working_directory.hh>
#include <unistd.h>

std::string get_cwd() {
    std::string res(PATH_MAX, '\0');
    while (getcwd(res.data(), res.size()) == nullptr) {
        if (errno != ERANGE) {
            THROW("Failed to get CWD", errmsg());
        }
        res.resize(res.size() * 2);
    }

    res.resize(res.find('\0'));
    if (res.back() != '/') {
        res += '/';
    }
    return res;
}
