#include <gtest/gtest.h>

#include "../lora_errors.hpp"
#include "../session_config.hpp"


TEST(SessionConfig, ParsesHexInConsoleFormats) {
    const dev_addr_t expected = { 0x26, 0x01, 0x1B, 0xDA };

    EXPECT_EQ(parse_hex_bytes<4>("26011BDA", "devaddr"), expected);
    EXPECT_EQ(parse_hex_bytes<4>("26011bda", "devaddr"), expected);
    EXPECT_EQ(parse_hex_bytes<4>("26:01:1B:DA", "devaddr"), expected);
    EXPECT_EQ(parse_hex_bytes<4>("0x26, 0x01, 0x1B, 0xDA", "devaddr"), expected);
}

TEST(SessionConfig, RejectsMalformedHex) {
    EXPECT_THROW(parse_hex_bytes<4>("26011BD", "devaddr"), invalid_configuration);
    EXPECT_THROW(parse_hex_bytes<4>("26011BDA00", "devaddr"), invalid_configuration);
    EXPECT_THROW(parse_hex_bytes<4>("26011BDG", "devaddr"), invalid_configuration);
    EXPECT_THROW(parse_hex_bytes<16>("", "nwkskey"), invalid_configuration);
}

TEST(SessionConfig, BuildsSession) {
    session_config config = make_session_config("AABBCCDD",
                                                "2B7E151628AED2A6ABF7158809CF4F3C",
                                                "000102030405060708090A0B0C0D0E0F",
                                                "AU");

    EXPECT_EQ(config.device_address, (dev_addr_t{ 0xAA, 0xBB, 0xCC, 0xDD }));
    EXPECT_EQ(config.network_session_key[0], 0x2B);
    EXPECT_EQ(config.network_session_key[15], 0x3C);
    EXPECT_EQ(config.app_session_key[15], 0x0F);
    EXPECT_EQ(config.country, region::AU);
}

TEST(SessionConfig, RejectsUnknownRegion) {
    EXPECT_THROW(make_session_config("AABBCCDD",
                                     "2B7E151628AED2A6ABF7158809CF4F3C",
                                     "000102030405060708090A0B0C0D0E0F",
                                     "XX"),
                 invalid_configuration);
}
