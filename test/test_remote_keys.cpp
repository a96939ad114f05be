#include "core/nec_decode.h"
#include "core/remote_keys.h"
#include "test_support.h"
#include <gtest/gtest.h>

namespace keys = necir::keys;

TEST(RemoteKeys, EveryKeyDecodesToItsCode)
{
    const uint32_t all[] = {
        keys::kKey0, keys::kKey1, keys::kKey2, keys::kKey3, keys::kKey4, keys::kKey5,
        keys::kKey6, keys::kKey7, keys::kKey8, keys::kKey9, keys::kKeyAsterisk, keys::kKeyPound,
        keys::kKeyUp, keys::kKeyDown, keys::kKeyLeft, keys::kKeyRight, keys::kKeyOk};
    for (uint32_t key : all)
    {
        uint32_t code = 0;
        EXPECT_EQ(necir::DecodeError::None, necir::decodeFrame(necir_test::commandBurst(key), code));
        EXPECT_EQ(key, code);
        EXPECT_NE(nullptr, keys::keyName(code));
    }
}

TEST(RemoteKeys, Names)
{
    EXPECT_STREQ("0", keys::keyName(0xFF9867));
    EXPECT_STREQ("OK", keys::keyName(keys::kKeyOk));
    EXPECT_STREQ("LEFT", keys::keyName(keys::kKeyLeft));
    EXPECT_STREQ("REPEAT", keys::keyName(necir::kRepeatCode));
    EXPECT_EQ(nullptr, keys::keyName(0));
    EXPECT_EQ(nullptr, keys::keyName(0x12345678));
}
