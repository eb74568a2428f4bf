/**
 * @file ErrorTest.cpp
 * @brief Unit tests for jsave error codes and their classification (Error.hpp)
 */

#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <system_error>

#include <jsave/Error.hpp>

using namespace JSave;

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, ErrcConvertsToJsaveCategory) {
    std::error_code ec = Errc::DecodeFailed;

    EXPECT_EQ(&ec.category(), &errorCategory());
    EXPECT_STREQ(ec.category().name(), "jsave");
    EXPECT_FALSE(ec.message().empty());
}

TEST_F(ErrorTest, DecodeFailedIsNotEinval) {
    std::error_code decode = Errc::DecodeFailed;
    std::error_code einval(EINVAL, std::generic_category());

    EXPECT_NE(decode, einval);
    EXPECT_NE(decode, std::errc::invalid_argument);
    EXPECT_TRUE(isDecodeError(decode));
    EXPECT_FALSE(isDecodeError(einval));
}

// errno 값은 그 값이 무엇이든 I/O 오류로만 분류되어야 한다.
TEST_F(ErrorTest, ErrnoValuesAreIoErrors) {
    for (int err : {EINVAL, ENOTSUP, EILSEQ, ENOENT, EISDIR, ENOSPC}) {
        std::error_code ec(err, std::generic_category());
        EXPECT_TRUE(isIoError(ec)) << ec.message();
        EXPECT_FALSE(isDecodeError(ec)) << ec.message();
        EXPECT_FALSE(isEncodeError(ec)) << ec.message();
    }
}

TEST_F(ErrorTest, EncodeCodes) {
    EXPECT_TRUE(isEncodeError(Errc::EncodeFailed));
    EXPECT_TRUE(isEncodeError(Errc::InvalidUtf8));
    EXPECT_FALSE(isEncodeError(Errc::DecodeFailed));
    EXPECT_FALSE(isIoError(Errc::InvalidUtf8));
}

TEST_F(ErrorTest, LockUnavailable) {
    std::error_code busy = std::make_error_code(std::errc::resource_unavailable_try_again);
    std::error_code late = std::make_error_code(std::errc::timed_out);

    EXPECT_TRUE(isLockUnavailable(busy));
    EXPECT_TRUE(isLockUnavailable(late));
    EXPECT_FALSE(isIoError(busy));
    EXPECT_FALSE(isIoError(std::error_code()));
}
