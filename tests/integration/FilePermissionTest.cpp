/**
 * @file FilePermissionTest.cpp
 * @brief Integration tests for backing files that cannot be opened, read or written
 * @note Tests that depend on permission bits are skipped when running as root,
 *       since root bypasses them.
 */

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <map>
#include <string>

#include <jsave/jsave.hpp>

using namespace JSave;

class FilePermissionTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testDir_ = "./test_permission_dir";
        testFile_ = testDir_ + "/store.json";
        log::setLevel(log::Level::Error);
        cleanup();
        ASSERT_EQ(::mkdir(testDir_.c_str(), 0755), 0);
    }

    void TearDown() override {
        ::chmod(testDir_.c_str(), 0755);
        cleanup();
        log::setLevel(log::Level::Warning);
    }

    void cleanup() {
        ::chmod(testFile_.c_str(), 0644);
        ::remove(testFile_.c_str());
        ::rmdir(util::tempPathFor(testFile_).c_str());
        ::remove(util::tempPathFor(testFile_).c_str());
        ::rmdir(testDir_.c_str());
    }

    static bool isRoot() { return ::geteuid() == 0; }

    std::string testDir_;
    std::string testFile_;
};

using Map = std::map<std::string, int>;

TEST_F(FilePermissionTest, InitWithInMissingDirectory) {
    std::error_code ec;
    auto store = Mutex<Map>::initWith({}, "./no_such_dir_permission/store.json", ec);

    EXPECT_EQ(store, nullptr);
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
    EXPECT_TRUE(isIoError(ec));
}

TEST_F(FilePermissionTest, InitWithOnDirectory) {
    std::error_code ec;
    auto store = RwLock<Map>::initWith({}, testDir_, ec);

    EXPECT_EQ(store, nullptr);
    EXPECT_EQ(ec, std::errc::is_a_directory);
}

TEST_F(FilePermissionTest, InitMissingFile) {
    std::error_code ec;
    auto store = ReentrantMutex<Map>::init(testFile_, ec);

    EXPECT_EQ(store, nullptr);
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
    // init() never creates the file
    EXPECT_NE(::access(testFile_.c_str(), F_OK), 0);
}

TEST_F(FilePermissionTest, InitOnDirectory) {
    std::error_code ec;
    auto store = Mutex<Map>::init(testDir_, ec);

    EXPECT_EQ(store, nullptr);
    EXPECT_EQ(ec, std::errc::is_a_directory);
    EXPECT_TRUE(isIoError(ec));
}

TEST_F(FilePermissionTest, CreatedFileUsesFileMode) {
    Options options;
    options.fileMode = 0600;

    mode_t old = ::umask(0);
    std::error_code ec;
    auto store = Mutex<Map>::initWith({}, testFile_, ec, options);
    ::umask(old);
    ASSERT_TRUE(store) << ec.message();

    struct stat st{};
    ASSERT_EQ(::stat(testFile_.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

// 저장 실패는 메모리 값을 건드리지 않고, 원인이 해소되면 같은 store 로 재시도할 수 있어야 한다.
TEST_F(FilePermissionTest, FailedSaveKeepsValueAndCanBeRetried) {
    std::error_code ec;
    auto store = Mutex<Map>::initWith({}, testFile_, ec);
    ASSERT_TRUE(store);

    (*store->lock())["foo"] = 1;

    ASSERT_EQ(::remove(testFile_.c_str()), 0);
    ASSERT_EQ(::rmdir(testDir_.c_str()), 0);

    EXPECT_FALSE(store->save(ec));
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
    EXPECT_EQ(store->lock()->at("foo"), 1);

    ASSERT_EQ(::mkdir(testDir_.c_str(), 0755), 0);
    ASSERT_TRUE(store->save(ec)) << ec.message();
    EXPECT_FALSE(ec);

    auto reopened = Mutex<Map>::init(testFile_, ec);
    ASSERT_TRUE(reopened);
    EXPECT_EQ(reopened->lock()->at("foo"), 1);
}

TEST_F(FilePermissionTest, AtomicReplaceFailureKeepsPreviousFile) {
    Options options;
    options.writePolicy = WritePolicy::ReplaceAtomically;

    std::error_code ec;
    auto store = RwLock<Map>::initWith({{"v", 1}}, testFile_, ec, options);
    ASSERT_TRUE(store) << ec.message();

    store->write()->at("v") = 2;

    // the temporary name is taken by a directory, so the open fails
    ASSERT_EQ(::mkdir(util::tempPathFor(testFile_).c_str(), 0755), 0);
    EXPECT_FALSE(store->save(ec));
    EXPECT_EQ(ec, std::errc::is_a_directory);

    auto onDisk = RwLock<Map>::init(testFile_, ec);
    ASSERT_TRUE(onDisk);
    EXPECT_EQ(onDisk->read()->at("v"), 1);
    EXPECT_EQ(store->read()->at("v"), 2);

    ASSERT_EQ(::rmdir(util::tempPathFor(testFile_).c_str()), 0);
    ASSERT_TRUE(store->save(ec));
    EXPECT_EQ(RwLock<Map>::init(testFile_, ec)->read()->at("v"), 2);
}

TEST_F(FilePermissionTest, AtomicReplaceSucceedsOverReadOnlyFile) {
    Options options;
    options.writePolicy = WritePolicy::ReplaceAtomically;

    std::error_code ec;
    auto store = Mutex<Map>::initWith({{"v", 1}}, testFile_, ec, options);
    ASSERT_TRUE(store);
    ASSERT_EQ(::chmod(testFile_.c_str(), 0444), 0);

    store->lock()->at("v") = 3;
    EXPECT_TRUE(store->save(ec)) << ec.message();
    EXPECT_EQ(Mutex<Map>::init(testFile_, ec)->lock()->at("v"), 3);
}

TEST_F(FilePermissionTest, SaveToReadOnlyFileFails) {
    if (isRoot())
        GTEST_SKIP() << "root ignores file permission bits";

    std::error_code ec;
    auto store = Mutex<Map>::initWith({}, testFile_, ec);
    ASSERT_TRUE(store);
    ASSERT_EQ(::chmod(testFile_.c_str(), 0444), 0);

    store->lock()->emplace("x", 1);
    EXPECT_FALSE(store->save(ec));
    EXPECT_EQ(ec, std::errc::permission_denied);
    EXPECT_EQ(store->lock()->size(), 1u);
}

TEST_F(FilePermissionTest, InitUnreadableFileFails) {
    if (isRoot())
        GTEST_SKIP() << "root ignores file permission bits";

    std::error_code ec;
    ASSERT_TRUE(Mutex<Map>::initWith({}, testFile_, ec));
    ASSERT_EQ(::chmod(testFile_.c_str(), 0200), 0);

    EXPECT_EQ(Mutex<Map>::init(testFile_, ec), nullptr);
    EXPECT_EQ(ec, std::errc::permission_denied);
}
