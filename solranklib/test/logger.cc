#include "intercept_logger.hh"

#include <gtest/gtest.h>
#include <solranklib/logger.hh>
#include <solranklib/temporary_directory.hh>
#include <string>

using std::string;

// NOLINTNEXTLINE
TEST(Logger, appender_flushes_once_with_newline) {
    Logger logger(stderr);
    auto logged = intercept_logger(logger, [&] {
        logger("Processing line ", 25, "...");
        auto app = logger("Completed executing ");
        app(3, " records");
        app(" (", 1, " failed)");
    });
    EXPECT_EQ(logged, "Processing line 25...\nCompleted executing 3 records (1 failed)\n");
}

// NOLINTNEXTLINE
TEST(Logger, flush_no_nl) {
    Logger logger(stderr);
    auto logged = intercept_logger(logger, [&] {
        auto app = logger("a");
        app.flush_no_nl();
        app("b");
    });
    EXPECT_EQ(logged, "ab\n");
}

// NOLINTNEXTLINE
TEST(Logger, label) {
    TemporaryDirectory tmp_dir("/tmp/logger-test.XXXXXX");
    auto path = tmp_dir.path() + "log";
    {
        Logger logger(path);
        logger("message");
    }
    auto contents = get_file_contents(path);
    ASSERT_GE(contents.size(), 4U);
    EXPECT_EQ(contents.substr(0, 2), "[ ");
    EXPECT_NE(contents.find(" ] message\n"), string::npos);
}

// NOLINTNEXTLINE
TEST(Logger, dummy_logger) {
    Logger logger(nullptr);
    logger("goes nowhere"); // must not crash
    EXPECT_THROW(Logger("/nonexistent/dir/log"), std::runtime_error);
}
