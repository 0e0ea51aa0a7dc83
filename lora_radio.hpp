/**
 * @file lora_radio.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief SX1276 / RFM95 driver sending LoRaWAN ABP uplinks
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef __LORA_RADIO_H__
#define __LORA_RADIO_H__

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>

#include "datarate.hpp"
#include "frame_assembler.hpp"
#include "region.hpp"
#include "register_protocol.hpp"
#include "session_config.hpp"
#include "session_crypto.hpp"
#include "spi_transport.hpp"


/*!
 * Timing of one transmission. DIO0 is sampled right after the transmit
 * command and once more after each of the max_poll_attempts sleeps, which
 * gives the 15 s TxDone budget with the defaults.
 */
struct tx_timing {
    std::chrono::milliseconds standby_settle{10};
    std::chrono::milliseconds poll_interval{1000};
    unsigned int              max_poll_attempts = 15;
};

typedef std::function<void(std::chrono::milliseconds)> sleep_function_t;

// returns the channel index used by the next transmission in hopping mode
typedef std::function<uint8_t(void)> channel_picker_t;


class lora_radio {

    public:

        /**
         * Resolves the channel plan of the session region, selects SF7BW125,
         * checks the chip version and sets up the modem registers.
         *
         * Without a channel the radio hops over the 8 channels of the plan,
         * picking one at random for every transmission.
         *
         * Throws invalid_configuration for an unknown region (before any
         * register access) and transport_fault if the bus fails.
         */
        lora_radio(spi_bus &bus, gpio_output &chip_select, gpio_input &dio0,
                   const session_config &session, session_crypto &crypto,
                   std::optional<uint8_t> channel = std::nullopt,
                   tx_timing timing = tx_timing());

        lora_radio(const lora_radio&) = delete;
        lora_radio& operator=(const lora_radio&) = delete;

        /**
         * Assembles and transmits one uplink.
         *
         * @return true if TxDone was seen, false if the poll budget ran out.
         * The radio is put to sleep in both cases.
         */
        bool send(const uint8_t *payload, std::size_t size, uint16_t frame_counter);

        /**
         * Drives the chip through standby, FIFO load, transmit and sleep
         */
        bool send_packet(const lorawan_frame &frame);

        void set_datarate(const std::string &name);

        /**
         * Only valid when constructed with a fixed channel, index 0..7
         */
        void set_channel(uint8_t channel);

        void set_sleep_function(sleep_function_t fn);

        void set_channel_picker(channel_picker_t picker);

        const datarate_profile_t& get_datarate(void) const { return *datarate; }

        frequency_word_t get_frequency(void) const { return frequency; }

        bool is_hopping(void) const { return hopping; }

        uint16_t get_frame_counter(void) const { return frame_counter; }

        uint8_t get_version(void) const { return version; }

    private:

        void init_radio(void);

        void set_operation_mode(uint8_t mode);

        bool wait_tx_done(void);

        uint8_t random_channel(void);

        register_protocol regs;

        gpio_input &dio0;

        const session_config session;

        frame_assembler assembler;

        tx_timing timing;

        const frequency_table_t &channels;

        const datarate_profile_t *datarate;

        bool hopping;

        frequency_word_t frequency;

        uint16_t frame_counter;

        uint8_t version;

        sleep_function_t sleep_for;

        channel_picker_t channel_picker;

        std::mt19937 rng;
};

#endif
