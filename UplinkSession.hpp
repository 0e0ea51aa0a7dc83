/**
 * @file UplinkSession.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief Frame counter bookkeeping and transmit reports of the uplink bridge
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef MQTTUplinkBridge_UPLINKSESSION_H
#define MQTTUplinkBridge_UPLINKSESSION_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "lora_radio.hpp"

#define FRAME_COUNTER_LIMIT     0x10000


struct TransmitReport {
    uint32_t fcnt = 0;
    std::size_t size = 0;
    bool sent = false;
    bool tx_done = false;
    std::string error;
    std::size_t dropped = 0;

    std::string toJson() const;
};


/*
 * Hands payloads to the radio with a frame counter that only goes up.
 * The counter advances when the radio accepted the frame, a lora_error
 * leaves it unchanged. Once 0xFFFF has been used the session is
 * exhausted and nothing more is transmitted, the network server would
 * drop a wrapped counter.
 */
class UplinkSession {
    lora_radio& radio;
    uint32_t frame_counter;

public:
    UplinkSession(lora_radio& radio_, uint16_t first_frame_counter) :
        radio(radio_), frame_counter(first_frame_counter) {}

    TransmitReport transmit(const std::string& payload);

    bool exhausted() const { return frame_counter >= FRAME_COUNTER_LIMIT; }

    uint32_t nextFrameCounter() const { return frame_counter; }
};

#endif
