/**
 * @file session_crypto.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief Payload encryption and MIC service used by the frame assembler
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef __SESSION_CRYPTO_H__
#define __SESSION_CRYPTO_H__

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "session_config.hpp"


typedef std::array<uint8_t, 4> mic_t;

class session_crypto {

    public:

        virtual ~session_crypto() = default;

        /**
         * Encrypts an uplink FRMPayload. The result has the same length as
         * the plaintext.
         */
        virtual std::vector<uint8_t> encrypt_payload(const session_config &session,
                                                     uint16_t frame_counter,
                                                     const uint8_t *payload,
                                                     std::size_t size) = 0;

        /**
         * Message integrity code over the frame assembled so far
         * (header and encrypted payload)
         */
        virtual mic_t compute_mic(const session_config &session,
                                  uint16_t frame_counter,
                                  const uint8_t *frame,
                                  std::size_t size) = 0;
};

#endif
