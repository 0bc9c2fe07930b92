#include "errors.hpp"
#include <gtest/gtest.h>

TEST(ErrorsTest, NamesAreStable)
{
    EXPECT_STREQ(errorCodeName(ErrorCode::None), "OK");
    EXPECT_STREQ(errorCodeName(ErrorCode::NotFound), "THEME_NOT_FOUND");
    EXPECT_STREQ(errorCodeName(ErrorCode::InvalidBundle), "THEME_INVALID");
    EXPECT_STREQ(errorCodeName(ErrorCode::InvalidThemeId), "INVALID_THEME_ID");
    EXPECT_STREQ(errorCodeName(ErrorCode::PointerWriteFailure), "SYMLINK_ERROR");
    EXPECT_STREQ(errorCodeName(ErrorCode::BrokenPointer), "BROKEN_POINTER");
    EXPECT_STREQ(errorCodeName(ErrorCode::HookTimeout), "HOOK_TIMEOUT");
    EXPECT_STREQ(errorCodeName(ErrorCode::Cancelled), "CANCELLED");
}

TEST(ErrorsTest, FormatPrefixesCode)
{
    EXPECT_EQ(formatError(ErrorCode::NotFound, "Theme \"x\" not found"), "THEME_NOT_FOUND: Theme \"x\" not found");
    EXPECT_EQ(formatError(ErrorCode::HookFailure, ""), "HOOK_ERROR");
}
