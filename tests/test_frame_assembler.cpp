#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "../frame_assembler.hpp"
#include "mock_transport.hpp"


namespace {

session_config test_session()
{
    session_config config;
    config.device_address = { 0xAA, 0xBB, 0xCC, 0xDD };
    config.network_session_key.fill(0x11);
    config.app_session_key.fill(0x22);
    config.country = region::EU;
    return config;
}

}


TEST(FrameAssembler, HeaderLayout) {
    session_config session = test_session();
    fake_crypto crypto;
    frame_assembler assembler(session, crypto);

    const uint8_t payload[] = { 0x01, 0x02, 0x03 };
    lorawan_frame frame = assembler.assemble(payload, sizeof(payload), 300);

    ASSERT_EQ((std::size_t)frame.size, LORAWAN_FRAME_OVERHEAD + sizeof(payload));
    EXPECT_EQ(frame.data[0], 0x40);
    EXPECT_EQ(frame.data[1], 0xDD);
    EXPECT_EQ(frame.data[2], 0xCC);
    EXPECT_EQ(frame.data[3], 0xBB);
    EXPECT_EQ(frame.data[4], 0xAA);
    EXPECT_EQ(frame.data[5], 0x00);
    EXPECT_EQ(frame.data[6], 0x2C);
    EXPECT_EQ(frame.data[7], 0x01);
    EXPECT_EQ(frame.data[8], 0x01);
}

TEST(FrameAssembler, EncryptedPayloadThenMic) {
    session_config session = test_session();
    fake_crypto crypto;
    frame_assembler assembler(session, crypto);

    const uint8_t payload[] = { 0x01, 0x02, 0x03 };
    lorawan_frame frame = assembler.assemble(payload, sizeof(payload), 7);

    EXPECT_EQ(frame.data[9], 0xFE);
    EXPECT_EQ(frame.data[10], 0xFD);
    EXPECT_EQ(frame.data[11], 0xFC);
    EXPECT_EQ(frame.data[12], 0xDE);
    EXPECT_EQ(frame.data[13], 0xAD);
    EXPECT_EQ(frame.data[14], 0xBE);
    EXPECT_EQ(frame.data[15], 0xEF);

    EXPECT_EQ(crypto.encrypt_calls, 1u);
    EXPECT_EQ(crypto.last_counter, 7);
    EXPECT_EQ(crypto.last_device_address, session.device_address);

    // MIC is taken over header and ciphertext
    ASSERT_EQ(crypto.mic_input.size(), 12u);
    EXPECT_TRUE(std::equal(crypto.mic_input.begin(), crypto.mic_input.end(),
                           frame.data.begin()));
}

TEST(FrameAssembler, SameInputsGiveSameFrame) {
    session_config session = test_session();
    fake_crypto crypto;
    frame_assembler assembler(session, crypto);

    const uint8_t payload[] = { 'h', 'e', 'l', 'l', 'o' };
    lorawan_frame a = assembler.assemble(payload, sizeof(payload), 42);
    lorawan_frame b = assembler.assemble(payload, sizeof(payload), 42);

    ASSERT_EQ(a.size, b.size);
    EXPECT_EQ(a.data, b.data);
}

TEST(FrameAssembler, FifoCapacityLimit) {
    session_config session = test_session();
    fake_crypto crypto;
    frame_assembler assembler(session, crypto);

    std::vector<uint8_t> largest(MAX_FRAME_SIZE_LORAWAN - 13, 0x55);
    lorawan_frame frame = assembler.assemble(largest.data(), largest.size(), 1);
    EXPECT_EQ(frame.size, MAX_FRAME_SIZE_LORAWAN);

    std::vector<uint8_t> too_large(MAX_FRAME_SIZE_LORAWAN - 12, 0x55);
    crypto.encrypt_calls = 0;
    EXPECT_THROW(assembler.assemble(too_large.data(), too_large.size(), 1), payload_too_large);
    EXPECT_EQ(crypto.encrypt_calls, 0u);
}

TEST(FrameAssembler, EmptyPayload) {
    session_config session = test_session();
    fake_crypto crypto;
    frame_assembler assembler(session, crypto);

    lorawan_frame frame = assembler.assemble(nullptr, 0, 0);
    EXPECT_EQ(frame.size, LORAWAN_FRAME_OVERHEAD);
    EXPECT_EQ(frame.data[9], 0xDE);
}

TEST(FrameAssembler, CipherMustKeepLength) {
    session_config session = test_session();
    fake_crypto crypto;
    crypto.truncate_output = true;
    frame_assembler assembler(session, crypto);

    const uint8_t payload[] = { 0x01, 0x02 };
    EXPECT_THROW(assembler.assemble(payload, sizeof(payload), 1), crypto_error);
}
