// test_version.cpp — тест версии библиотеки и общих функций C API

#include <gtest/gtest.h>
#include "innerocket/innerocket_c.h"
#include "innerocket/core.h"

TEST(VersionTest, ReturnsCorrectVersion) {
    const char* version = ir_version();
    ASSERT_NE(version, nullptr);
    EXPECT_STREQ(version, "0.1.0");
}

TEST(VersionTest, VersionMatchesCoreHeader) {
    EXPECT_STREQ(ir_version(), Innerocket::VERSION);
}

TEST(ErrorMessageTest, ReturnsCorrectMessages) {
    EXPECT_STREQ(ir_error_message(IR_OK), "Success");
    EXPECT_STREQ(ir_error_message(IR_ERROR_INVALID_ARGUMENT), "Invalid argument");
    EXPECT_STREQ(ir_error_message(IR_ERROR_NOT_FOUND), "Not found");
    EXPECT_STREQ(ir_error_message(IR_ERROR_IO), "I/O error");
    EXPECT_STREQ(ir_error_message(IR_ERROR_NETWORK), "Network error");
    EXPECT_STREQ(ir_error_message(IR_ERROR_CAPACITY), "Capacity exceeded");
    EXPECT_STREQ(ir_error_message(IR_ERROR_INTERNAL), "Internal error");
}

TEST(FreeStringTest, HandlesNull) {
    // Не должен падать при передаче nullptr
    ir_free_string(nullptr);
}

TEST(LogLevelTest, AcceptsKnownLevels) {
    EXPECT_EQ(ir_set_log_level("debug"), IR_OK);
    EXPECT_EQ(ir_set_log_level("off"), IR_OK);
    EXPECT_EQ(ir_set_log_level("warn"), IR_OK);
}

TEST(LogLevelTest, RejectsUnknownLevel) {
    EXPECT_EQ(ir_set_log_level("chatty"), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_last_error(), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_set_log_level(nullptr), IR_ERROR_INVALID_ARGUMENT);

    ir_clear_error();
    EXPECT_EQ(ir_last_error(), IR_OK);
    EXPECT_STREQ(ir_last_error_message(), "");
}
