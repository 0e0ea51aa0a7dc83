/**
 * @file lorawan_crypto.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief LoRaWAN 1.0 uplink encryption (AES-128) and MIC (AES-CMAC) on top of OpenSSL
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef __LORAWAN_CRYPTO_H__
#define __LORAWAN_CRYPTO_H__

#include "session_crypto.hpp"


class lorawan_crypto : public session_crypto {

    public:

        std::vector<uint8_t> encrypt_payload(const session_config &session,
                                             uint16_t frame_counter,
                                             const uint8_t *payload,
                                             std::size_t size) override;

        mic_t compute_mic(const session_config &session,
                          uint16_t frame_counter,
                          const uint8_t *frame,
                          std::size_t size) override;

        /**
         * Single block AES-128 encryption
         */
        static void aes_encrypt(const uint8_t *in, const session_key_t &key, uint8_t *out);

        static std::array<uint8_t, 16> aes_cmac(const session_key_t &key,
                                                const uint8_t *data,
                                                std::size_t size);
};

#endif
