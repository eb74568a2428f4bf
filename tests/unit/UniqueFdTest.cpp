/**
 * @file UniqueFdTest.cpp
 * @brief Unit tests for the UniqueFd RAII wrapper used by backing file I/O
 */

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <jsave/util/UniqueFd.hpp>

using namespace JSave::detail;

class UniqueFdTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testFile_ = "./test_uniquefd.tmp";
        ::remove(testFile_.c_str());
    }

    void TearDown() override { ::remove(testFile_.c_str()); }

    std::string testFile_;
};

TEST_F(UniqueFdTest, DefaultIsInvalid) {
    UniqueFd fd;
    EXPECT_EQ(fd.get(), -1);
    EXPECT_FALSE(fd.valid());
    EXPECT_FALSE(static_cast<bool>(fd));
}

TEST_F(UniqueFdTest, OpenCreatesFile) {
    std::error_code ec;
    UniqueFd fd = UniqueFd::open(testFile_, O_CREAT | O_WRONLY, 0600, ec);

    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(fd.valid());
    EXPECT_EQ(::access(testFile_.c_str(), F_OK), 0);
}

TEST_F(UniqueFdTest, OpenSetsCloseOnExec) {
    std::error_code ec;
    UniqueFd fd = UniqueFd::open(testFile_, O_CREAT | O_WRONLY, 0600, ec);
    ASSERT_FALSE(ec);

    int fdFlags = ::fcntl(fd.get(), F_GETFD);
    ASSERT_GE(fdFlags, 0);
    EXPECT_TRUE(fdFlags & FD_CLOEXEC);
}

TEST_F(UniqueFdTest, OpenMissingFileReportsErrno) {
    std::error_code ec;
    UniqueFd fd = UniqueFd::open("./no_such_dir_uniquefd/file", O_RDONLY, 0, ec);

    EXPECT_FALSE(fd.valid());
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

TEST_F(UniqueFdTest, DestructorClosesFd) {
    int rawFd = ::open(testFile_.c_str(), O_CREAT | O_RDWR, 0644);
    ASSERT_GE(rawFd, 0);

    {
        UniqueFd fd(rawFd);
        EXPECT_TRUE(fd.valid());
    }

    EXPECT_EQ(::write(rawFd, "x", 1), -1);
}

TEST_F(UniqueFdTest, MoveTransfersOwnership) {
    std::error_code ec;
    UniqueFd fd1 = UniqueFd::open(testFile_, O_CREAT | O_RDWR, 0644, ec);
    ASSERT_FALSE(ec);
    int raw = fd1.get();

    UniqueFd fd2(std::move(fd1));
    EXPECT_FALSE(fd1.valid());
    EXPECT_EQ(fd2.get(), raw);

    UniqueFd fd3;
    fd3 = std::move(fd2);
    EXPECT_FALSE(fd2.valid());
    EXPECT_EQ(fd3.get(), raw);
}

TEST_F(UniqueFdTest, CloseReportsSuccessAndInvalidates) {
    std::error_code ec;
    UniqueFd fd = UniqueFd::open(testFile_, O_CREAT | O_RDWR, 0644, ec);
    ASSERT_FALSE(ec);
    int raw = fd.get();

    EXPECT_TRUE(fd.close(ec));
    EXPECT_FALSE(ec);
    EXPECT_FALSE(fd.valid());
    EXPECT_EQ(::write(raw, "x", 1), -1);

    // closing an empty handle is a no-op
    EXPECT_TRUE(fd.close(ec));
    EXPECT_FALSE(ec);
}

TEST_F(UniqueFdTest, CloseOfForeignClosedFdReportsError) {
    int rawFd = ::open(testFile_.c_str(), O_CREAT | O_RDWR, 0644);
    ASSERT_GE(rawFd, 0);
    UniqueFd fd(rawFd);
    ::close(rawFd);

    std::error_code ec;
    EXPECT_FALSE(fd.close(ec));
    EXPECT_EQ(ec, std::errc::bad_file_descriptor);
    EXPECT_FALSE(fd.valid());
}

TEST_F(UniqueFdTest, Release) {
    int rawFd = ::open(testFile_.c_str(), O_CREAT | O_RDWR, 0644);
    ASSERT_GE(rawFd, 0);

    UniqueFd fd(rawFd);
    int released = fd.release();

    EXPECT_EQ(released, rawFd);
    EXPECT_FALSE(fd.valid());

    ::close(released);
}
