#pragma once

#include <cstdio>
#include <memory>
#include <solranklib/defer.hh>
#include <solranklib/file_contents.hh>
#include <solranklib/logger.hh>
#include <solranklib/throw_assert.hh>
#include <string>

template <class LoggingFunc>
std::string intercept_logger(Logger& logger, LoggingFunc&& logging_func) {
    std::unique_ptr<FILE, int (*)(FILE*)> stream = {tmpfile(), fclose};
    throw_assert(stream);

    FILE* logger_stream = stream.get();
    stream.reset(logger.exchange_log_stream(stream.release()));
    bool old_label = logger.label(false);
    Defer guard = [&] {
        // Restores the previous stream and closes the intercepting one
        std::unique_ptr<FILE, int (*)(FILE*)> intercepting = {
            logger.exchange_log_stream(stream.release()), fclose
        };
        logger.label(old_label);
    };

    logging_func();

    // Get logged data
    rewind(logger_stream);
    return get_file_contents(fileno(logger_stream));
}
