/**
 * @file frame_assembler.cpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <algorithm>
#include <string>

#include "frame_assembler.hpp"
#include "lora_errors.hpp"


frame_assembler::frame_assembler(const session_config &session, session_crypto &crypto)
    : session(session), crypto(crypto)
{
}

lorawan_frame frame_assembler::assemble(const uint8_t *payload, std::size_t size,
                                        uint16_t frame_counter) const
{
    if (size > MAX_PAYLOAD_SIZE_LORAWAN) {
        throw payload_too_large("Payload of " + std::to_string(size)
                                + " bytes exceeds the maximum of "
                                + std::to_string(MAX_PAYLOAD_SIZE_LORAWAN));
    }

    std::vector<uint8_t> encrypted = crypto.encrypt_payload(session, frame_counter, payload, size);
    if (encrypted.size() != size) {
        throw crypto_error("Encrypted payload length " + std::to_string(encrypted.size())
                           + " does not match plaintext length " + std::to_string(size));
    }

    lorawan_frame frame;
    frame.data.fill(0);

    frame.data[0] = LORAWAN_MHDR_UNCONFIRMED_UP;
    // DevAddr goes out LSB first
    frame.data[1] = session.device_address[3];
    frame.data[2] = session.device_address[2];
    frame.data[3] = session.device_address[1];
    frame.data[4] = session.device_address[0];
    frame.data[5] = LORAWAN_FCTRL_DEFAULT;
    frame.data[6] = frame_counter & 0x00FF;
    frame.data[7] = (frame_counter >> 8) & 0x00FF;
    frame.data[8] = LORAWAN_FPORT_DEFAULT;

    uint8_t len = LORAWAN_HEADER_SIZE;
    std::copy(encrypted.begin(), encrypted.end(), frame.data.begin() + len);
    len += (uint8_t)size;

    mic_t mic = crypto.compute_mic(session, frame_counter, frame.data.data(), len);
    std::copy(mic.begin(), mic.end(), frame.data.begin() + len);
    len += LORAWAN_MIC_SIZE;

    frame.size = len;

    return frame;
}
