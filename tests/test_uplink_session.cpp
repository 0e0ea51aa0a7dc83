#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "../UplinkSession.hpp"
#include "mock_transport.hpp"


class UplinkSessionTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        session.device_address = { 0xAA, 0xBB, 0xCC, 0xDD };
        session.network_session_key.fill(0x11);
        session.app_session_key.fill(0x22);
        session.country = region::EU;

        radio = std::make_unique<lora_radio>(bus, cs, dio0, session, crypto, uint8_t(0));
        radio->set_sleep_function(sleeps);
        bus.transfers.clear();
    }

    mock_gpio_output cs;
    mock_spi_bus bus{&cs};
    mock_gpio_input dio0;
    fake_crypto crypto;
    recorded_sleeps sleeps;
    session_config session;
    std::unique_ptr<lora_radio> radio;
};


TEST_F(UplinkSessionTest, CounterAdvancesAfterEachUplink) {
    UplinkSession uplinks(*radio, 41);

    TransmitReport first = uplinks.transmit("one");
    EXPECT_TRUE(first.sent);
    EXPECT_TRUE(first.tx_done);
    EXPECT_EQ(first.fcnt, 41u);
    EXPECT_EQ(radio->get_frame_counter(), 41);

    TransmitReport second = uplinks.transmit("two");
    EXPECT_EQ(second.fcnt, 42u);
    EXPECT_EQ(uplinks.nextFrameCounter(), 43u);
}

TEST_F(UplinkSessionTest, TimeoutStillUsesTheCounter) {
    UplinkSession uplinks(*radio, 7);
    dio0.assert_on_read = 0;

    TransmitReport report = uplinks.transmit("x");
    EXPECT_TRUE(report.sent);
    EXPECT_FALSE(report.tx_done);
    // the frame went on air, the network may have seen 7
    EXPECT_EQ(uplinks.nextFrameCounter(), 8u);
}

TEST_F(UplinkSessionTest, FailedUplinkKeepsCounter) {
    UplinkSession uplinks(*radio, 100);

    std::string too_large(MAX_PAYLOAD_SIZE_LORAWAN + 1, 'x');
    TransmitReport report = uplinks.transmit(too_large);

    EXPECT_FALSE(report.sent);
    EXPECT_FALSE(report.error.empty());
    EXPECT_EQ(uplinks.nextFrameCounter(), 100u);
    EXPECT_TRUE(bus.transfers.empty());

    bus.fail_at_transfer = 1;
    report = uplinks.transmit("ok");
    EXPECT_FALSE(report.sent);
    EXPECT_EQ(uplinks.nextFrameCounter(), 100u);

    bus.fail_at_transfer = 0;
    report = uplinks.transmit("ok");
    EXPECT_TRUE(report.sent);
    EXPECT_EQ(report.fcnt, 100u);
}

TEST_F(UplinkSessionTest, CounterNeverWraps) {
    UplinkSession uplinks(*radio, 0xFFFF);

    TransmitReport last = uplinks.transmit("last");
    EXPECT_TRUE(last.sent);
    EXPECT_EQ(last.fcnt, 0xFFFFu);
    EXPECT_TRUE(uplinks.exhausted());

    bus.transfers.clear();
    TransmitReport refused = uplinks.transmit("wrapped");
    EXPECT_FALSE(refused.sent);
    EXPECT_NE(refused.error.find("exhausted"), std::string::npos);
    EXPECT_TRUE(bus.transfers.empty());
    EXPECT_EQ(radio->get_frame_counter(), 0xFFFF);
    EXPECT_EQ(uplinks.nextFrameCounter(), 0x10000u);
}

TEST(TransmitReport, Json) {
    TransmitReport report;
    report.fcnt = 12;
    report.size = 5;
    report.sent = true;
    report.tx_done = true;
    report.dropped = 3;
    EXPECT_EQ(report.toJson(), "{\"fcnt\":12,\"size\":5,\"tx_done\":true,\"dropped\":3}");

    report.sent = false;
    report.error = "bad \"frame\"";
    report.dropped = 0;
    EXPECT_EQ(report.toJson(), "{\"fcnt\":12,\"size\":5,\"error\":\"bad \\\"frame\\\"\",\"dropped\":0}");
}
