/**
 * @file lorawan_crypto.cpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <algorithm>
#include <memory>

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include "lorawan_crypto.hpp"
#include "lora_errors.hpp"


#define LORAWAN_DIR_UPLINK      0x00
#define LORAWAN_BLOCK_A         0x01
#define LORAWAN_BLOCK_B0        0x49


namespace {

struct cipher_ctx_deleter {
    void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

struct mac_deleter {
    void operator()(EVP_MAC *mac) const { EVP_MAC_free(mac); }
};

struct mac_ctx_deleter {
    void operator()(EVP_MAC_CTX *ctx) const { EVP_MAC_CTX_free(ctx); }
};

/**
 * Common part of the A_i and B0 blocks:
 * type | 4 x 0x00 | dir | DevAddr (LE) | FCnt (LE, 32 bit) | 0x00 | last
 */
std::array<uint8_t, 16> make_block(uint8_t type, const session_config &session,
                                   uint16_t frame_counter, uint8_t last)
{
    std::array<uint8_t, 16> block{};

    block[0]  = type;
    block[5]  = LORAWAN_DIR_UPLINK;
    block[6]  = session.device_address[3];
    block[7]  = session.device_address[2];
    block[8]  = session.device_address[1];
    block[9]  = session.device_address[0];
    block[10] = frame_counter & 0xFF;
    block[11] = (frame_counter >> 8) & 0xFF;
    block[15] = last;

    return block;
}

}


void lorawan_crypto::aes_encrypt(const uint8_t *in, const session_key_t &key, uint8_t *out)
{
    std::unique_ptr<EVP_CIPHER_CTX, cipher_ctx_deleter> ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw crypto_error("EVP_CIPHER_CTX_new failed");
    }

    int outl = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_ecb(), nullptr, key.data(), nullptr) != 1
        || EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != 1
        || EVP_EncryptUpdate(ctx.get(), out, &outl, in, 16) != 1
        || outl != 16) {
        throw crypto_error("AES-128 block encryption failed");
    }
}

std::array<uint8_t, 16> lorawan_crypto::aes_cmac(const session_key_t &key,
                                                 const uint8_t *data,
                                                 std::size_t size)
{
    std::unique_ptr<EVP_MAC, mac_deleter> mac(EVP_MAC_fetch(nullptr, "CMAC", nullptr));
    if (!mac) {
        throw crypto_error("CMAC not available in OpenSSL");
    }

    std::unique_ptr<EVP_MAC_CTX, mac_ctx_deleter> ctx(EVP_MAC_CTX_new(mac.get()));
    if (!ctx) {
        throw crypto_error("EVP_MAC_CTX_new failed");
    }

    char cipher_name[] = "AES-128-CBC";
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_CIPHER, cipher_name, 0),
        OSSL_PARAM_construct_end()
    };

    std::array<uint8_t, 16> cmac{};
    std::size_t outl = 0;

    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != 1
        || EVP_MAC_update(ctx.get(), data, size) != 1
        || EVP_MAC_final(ctx.get(), cmac.data(), &outl, cmac.size()) != 1
        || outl != cmac.size()) {
        throw crypto_error("AES-CMAC computation failed");
    }

    return cmac;
}

/**
 * FRMPayload = payload XOR (AES(AppSKey, A_1) | AES(AppSKey, A_2) | ...)
 */
std::vector<uint8_t> lorawan_crypto::encrypt_payload(const session_config &session,
                                                     uint16_t frame_counter,
                                                     const uint8_t *payload,
                                                     std::size_t size)
{
    std::vector<uint8_t> encrypted(size);

    uint8_t block_counter = 1;
    for (std::size_t i = 0; i < size; i += 16) {
        auto block_a = make_block(LORAWAN_BLOCK_A, session, frame_counter, block_counter++);

        std::array<uint8_t, 16> s;
        aes_encrypt(block_a.data(), session.app_session_key, s.data());

        for (std::size_t j = 0; j < 16 && i + j < size; j++) {
            encrypted[i + j] = payload[i + j] ^ s[j];
        }
    }

    return encrypted;
}

/**
 * MIC = AES-CMAC(NwkSKey, B0 | msg)[0..3]
 */
mic_t lorawan_crypto::compute_mic(const session_config &session,
                                  uint16_t frame_counter,
                                  const uint8_t *frame,
                                  std::size_t size)
{
    auto b0 = make_block(LORAWAN_BLOCK_B0, session, frame_counter, (uint8_t)size);

    std::vector<uint8_t> cmac_data(b0.begin(), b0.end());
    cmac_data.insert(cmac_data.end(), frame, frame + size);

    auto cmac = aes_cmac(session.network_session_key, cmac_data.data(), cmac_data.size());

    mic_t mic;
    std::copy(cmac.begin(), cmac.begin() + mic.size(), mic.begin());

    return mic;
}
