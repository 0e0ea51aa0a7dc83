#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../frame_assembler.hpp"
#include "../lorawan_crypto.hpp"
#include "../session_config.hpp"


namespace {

std::vector<uint8_t> hex(const std::string &text)
{
    std::vector<uint8_t> bytes;
    for (std::size_t i = 0; i + 1 < text.size(); i += 2) {
        bytes.push_back((uint8_t)std::stoul(text.substr(i, 2), nullptr, 16));
    }
    return bytes;
}

session_config ttn_session()
{
    return make_session_config("26011BDA",
                               "2B7E151628AED2A6ABF7158809CF4F3C",
                               "000102030405060708090A0B0C0D0E0F",
                               "EU");
}

}


TEST(LorawanCrypto, AesBlockKnownAnswer) {
    session_key_t key = parse_hex_bytes<16>("2b7e151628aed2a6abf7158809cf4f3c", "key");
    auto plain = hex("6bc1bee22e409f96e93d7e117393172a");

    uint8_t out[16];
    lorawan_crypto::aes_encrypt(plain.data(), key, out);

    EXPECT_EQ(std::vector<uint8_t>(out, out + 16), hex("3ad77bb40d7a3660a89ecaf32466ef97"));
}

TEST(LorawanCrypto, CmacKnownAnswers) {
    session_key_t key = parse_hex_bytes<16>("2b7e151628aed2a6abf7158809cf4f3c", "key");

    auto empty = lorawan_crypto::aes_cmac(key, nullptr, 0);
    EXPECT_EQ(std::vector<uint8_t>(empty.begin(), empty.end()),
              hex("bb1d6929e95937287fa37d129b756746"));

    auto block = hex("6bc1bee22e409f96e93d7e117393172a");
    auto one = lorawan_crypto::aes_cmac(key, block.data(), block.size());
    EXPECT_EQ(std::vector<uint8_t>(one.begin(), one.end()),
              hex("070a16b46b4d4144f79bdd9dd04a287c"));
}

TEST(LorawanCrypto, EncryptionIsItsOwnInverse) {
    session_config session = ttn_session();
    lorawan_crypto crypto;

    std::vector<uint8_t> plain(37);
    for (std::size_t i = 0; i < plain.size(); i++) {
        plain[i] = (uint8_t)i;
    }

    auto cipher = crypto.encrypt_payload(session, 12, plain.data(), plain.size());
    ASSERT_EQ(cipher.size(), plain.size());
    EXPECT_NE(cipher, plain);

    auto again = crypto.encrypt_payload(session, 12, cipher.data(), cipher.size());
    EXPECT_EQ(again, plain);

    // the keystream depends on the frame counter
    EXPECT_NE(crypto.encrypt_payload(session, 13, plain.data(), plain.size()), cipher);
}

TEST(LorawanCrypto, MultiBlockPayload) {
    session_config session = ttn_session();
    lorawan_crypto crypto;

    std::vector<uint8_t> plain(20);
    for (std::size_t i = 0; i < plain.size(); i++) {
        plain[i] = (uint8_t)i;
    }

    EXPECT_EQ(crypto.encrypt_payload(session, 300, plain.data(), plain.size()),
              hex("2f6fe7f57d22213b7eb9a1d3a5673e62347abefa"));
}

TEST(LorawanCrypto, CompleteUplinkFrame) {
    session_config session = ttn_session();
    lorawan_crypto crypto;
    frame_assembler assembler(session, crypto);

    const std::string text = "hello";
    lorawan_frame frame = assembler.assemble(reinterpret_cast<const uint8_t*>(text.data()),
                                             text.size(), 1);

    EXPECT_EQ(std::vector<uint8_t>(frame.data.begin(), frame.data.begin() + frame.size),
              hex("40da1b012600010001ba96c8f0fced382804"));
}

TEST(LorawanCrypto, MicOverMultiBlockFrame) {
    session_config session = ttn_session();
    lorawan_crypto crypto;

    auto msg = hex("40da1b0126002c01012f6fe7f57d22213b7eb9a1d3a5673e62347abefa");
    mic_t mic = crypto.compute_mic(session, 300, msg.data(), msg.size());

    EXPECT_EQ(std::vector<uint8_t>(mic.begin(), mic.end()), hex("87b79517"));
}
