/**
 * @file frame_assembler.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief Builds unconfirmed data up frames
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef __FRAME_ASSEMBLER_H__
#define __FRAME_ASSEMBLER_H__

#include <array>
#include <cstddef>
#include <cstdint>

#include "session_config.hpp"
#include "session_crypto.hpp"


// RFM95 FIFO space available for one uplink
#define MAX_FRAME_SIZE_LORAWAN      64

// MHDR(1) DevAddr(4) FCtrl(1) FCnt(2) FPort(1)
#define LORAWAN_HEADER_SIZE         9
#define LORAWAN_MIC_SIZE            4
#define LORAWAN_FRAME_OVERHEAD      (LORAWAN_HEADER_SIZE + LORAWAN_MIC_SIZE)
#define MAX_PAYLOAD_SIZE_LORAWAN    (MAX_FRAME_SIZE_LORAWAN - LORAWAN_FRAME_OVERHEAD)

#define LORAWAN_MHDR_UNCONFIRMED_UP 0x40
#define LORAWAN_FCTRL_DEFAULT       0x00
#define LORAWAN_FPORT_DEFAULT       0x01


struct lorawan_frame {
    std::array<uint8_t, MAX_FRAME_SIZE_LORAWAN> data;
    uint8_t size;
};


/**
 * Frame layout on air:
 * [MHDR][DevAddr reversed (4)][FCtrl][FCnt lo][FCnt hi][FPort][FRMPayload (N)][MIC (4)]
 *
 * Touches no radio registers.
 */
class frame_assembler {

    public:

        frame_assembler(const session_config &session, session_crypto &crypto);

        /**
         * Throws payload_too_large if size > MAX_PAYLOAD_SIZE_LORAWAN. Errors of
         * the crypto service are passed through.
         */
        lorawan_frame assemble(const uint8_t *payload, std::size_t size,
                               uint16_t frame_counter) const;

    private:

        const session_config &session;

        session_crypto &crypto;
};

#endif
