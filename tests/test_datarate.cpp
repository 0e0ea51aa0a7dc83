#include <gtest/gtest.h>

#include "../datarate.hpp"
#include "../lora_errors.hpp"


TEST(Datarate, TableMatchesModemEncodings) {
    struct expected_t { const char *name; uint8_t sf, bw, cfg; };
    const expected_t expected[] = {
        { "SF7BW125",  0x74, 0x72, 0x04 },
        { "SF7BW250",  0x74, 0x82, 0x04 },
        { "SF8BW125",  0x84, 0x72, 0x04 },
        { "SF9BW125",  0x94, 0x72, 0x04 },
        { "SF10BW125", 0xA4, 0x72, 0x04 },
        { "SF11BW125", 0xB4, 0x72, 0x0C },
        { "SF12BW125", 0xC4, 0x72, 0x0C },
    };

    for (const auto &e : expected) {
        const datarate_profile_t &p = lookup_datarate(e.name);
        EXPECT_STREQ(p.name, e.name);
        EXPECT_EQ(p.sf, e.sf) << e.name;
        EXPECT_EQ(p.bw, e.bw) << e.name;
        EXPECT_EQ(p.modem_config, e.cfg) << e.name;
    }
}

TEST(Datarate, UnknownNamesAreRejected) {
    EXPECT_THROW(lookup_datarate("SF6BW125"), invalid_configuration);
    EXPECT_THROW(lookup_datarate("sf7bw125"), invalid_configuration);
    EXPECT_THROW(lookup_datarate("SF12BW500"), invalid_configuration);
    EXPECT_THROW(lookup_datarate(""), invalid_configuration);
}
