#include <fcntl.h>
#include <gtest/gtest.h>
#include <solranklib/file_contents.hh>
#include <solranklib/file_descriptor.hh>
#include <solranklib/file_manip.hh>
#include <solranklib/temporary_directory.hh>
#include <string>
#include <utility>

// NOLINTNEXTLINE
TEST(TemporaryDirectory, removed_in_destructor) {
    std::string path;
    {
        TemporaryDirectory tmp_dir("/tmp/temporary-directory-test.XXXXXX");
        path = tmp_dir.path();
        EXPECT_TRUE(tmp_dir.exists());
        EXPECT_EQ(path.back(), '/');
        EXPECT_TRUE(is_directory(path));
        put_file_contents(path + "file", "data");
        (void)FileDescriptor{path + "empty", O_CREAT | O_WRONLY};
    }
    EXPECT_FALSE(path_exists(path));
}

// NOLINTNEXTLINE
TEST(TemporaryDirectory, default_constructor) {
    TemporaryDirectory tmp_dir;
    EXPECT_FALSE(tmp_dir.exists());
    EXPECT_EQ(tmp_dir.path(), "");
    tmp_dir.remove();
}

// NOLINTNEXTLINE
TEST(TemporaryDirectory, invalid_template) {
    EXPECT_THROW(TemporaryDirectory("/tmp/no-x-suffix"), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(TemporaryDirectory, move) {
    TemporaryDirectory a("/tmp/temporary-directory-test.XXXXXX");
    auto path = a.path();
    TemporaryDirectory b = std::move(a);
    EXPECT_FALSE(a.exists()); // NOLINT(bugprone-use-after-move)
    EXPECT_EQ(b.path(), path);

    TemporaryDirectory c("/tmp/temporary-directory-test.XXXXXX");
    auto c_path = c.path();
    c = std::move(b);
    EXPECT_FALSE(path_exists(c_path));
    EXPECT_EQ(c.path(), path);
    EXPECT_TRUE(is_directory(path));
}

// NOLINTNEXTLINE
TEST(TemporaryDirectory, release) {
    std::string path;
    {
        TemporaryDirectory tmp_dir("/tmp/temporary-directory-test.XXXXXX");
        path = tmp_dir.release();
        EXPECT_FALSE(tmp_dir.exists());
    }
    EXPECT_TRUE(is_directory(path));
    EXPECT_EQ(remove_r(path), 0);
}

// NOLINTNEXTLINE
TEST(TemporaryDirectory, explicit_remove) {
    TemporaryDirectory tmp_dir("/tmp/temporary-directory-test.XXXXXX");
    auto path = tmp_dir.path();
    tmp_dir.remove();
    EXPECT_FALSE(tmp_dir.exists());
    EXPECT_FALSE(path_exists(path));
}
