#include "core/nec_decode.h"
#include "test_support.h"
#include <gtest/gtest.h>

using necir::DecodeError;
using necir_test::burstOf;

TEST(RepeatHandler, SuppressedRepeatSetsSentinel)
{
    uint32_t code = 0x00FF9867;
    EXPECT_EQ(DecodeError::None, necir::applyRepeat(burstOf({9000, 2250}), false, code));
    EXPECT_EQ(necir::kRepeatCode, code);
    EXPECT_EQ(0xFFFFFFFFu, code);
}

TEST(RepeatHandler, CommandRepeatKeepsPreviousCode)
{
    uint32_t code = 0x00FF9867;
    EXPECT_EQ(DecodeError::None, necir::applyRepeat(burstOf({9000, 2250}), true, code));
    EXPECT_EQ(0x00FF9867u, code);
}

TEST(RepeatHandler, AcceptsJitter)
{
    uint32_t code = 0;
    EXPECT_EQ(DecodeError::None, necir::applyRepeat(burstOf({8400, 2400}), false, code));
    EXPECT_EQ(necir::kRepeatCode, code);
}

TEST(RepeatHandler, InvalidTimingLeavesCode)
{
    uint32_t code = 0x1234;
    EXPECT_EQ(DecodeError::InvalidRepeatFrame, necir::applyRepeat(burstOf({9000, 4500}), false, code));
    EXPECT_EQ(DecodeError::InvalidRepeatFrame, necir::applyRepeat(burstOf({560, 2250}), false, code));
    EXPECT_EQ(0x1234u, code);
}

TEST(RepeatHandler, ShortBurstIsInsufficientData)
{
    uint32_t code = 0x1234;
    EXPECT_EQ(DecodeError::InsufficientData, necir::applyRepeat(burstOf({9000}), false, code));
    EXPECT_EQ(DecodeError::InsufficientData, necir::applyRepeat(burstOf({}), false, code));
    EXPECT_EQ(0x1234u, code);
}
