#include <solranklib/errmsg.hh>
#include <solranklib/logger.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/time.hh>

using std::string;

Logger::Logger(const string& filename) : f_(fopen(filename.c_str(), "ae")), opened_(true) {
    if (f_ == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
}

void Logger::open(const string& filename) {
    FILE* f = fopen(filename.c_str(), "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }

    close();
    f_ = f;
    opened_ = true;
}

void Logger::Appender::flush_impl(const char* newline_or_empty_str) noexcept {
    if (flushed_) {
        return;
    }

    if (logger_.lock()) {
        if (label_) {
            try {
                (void)fprintf(
                    logger_.f_,
                    "[ %s ] %.*s%s",
                    local_mysql_datetime().c_str(),
                    static_cast<int>(buff_.size()),
                    buff_.data(),
                    newline_or_empty_str
                );
            } catch (const std::exception&) {
                (void)fprintf(
                    logger_.f_,
                    "[ unknown time ] %.*s%s",
                    static_cast<int>(buff_.size()),
                    buff_.data(),
                    newline_or_empty_str
                );
            }
        } else {
            (void)fprintf(
                logger_.f_,
                "%.*s%s",
                static_cast<int>(buff_.size()),
                buff_.data(),
                newline_or_empty_str
            );
        }

        (void)fflush(logger_.f_);
        logger_.unlock();
    }

    flushed_ = true;
    buff_.clear();
}
