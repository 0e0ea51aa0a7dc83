/**
 * @file register_protocol.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief Single byte register access to the SX1276 over a chip-select gated SPI bus
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef __REGISTER_PROTOCOL_H__
#define __REGISTER_PROTOCOL_H__

#include <cstdint>

#include "spi_transport.hpp"


class register_protocol {

    public:

        register_protocol(spi_bus &bus, gpio_output &chip_select);

        uint8_t read_register(uint8_t addr);

        void write_to_register(uint8_t addr, uint8_t value);

        /**
         * Streams the buffer into RegFifo, one write transaction per byte
         */
        void write_fifo(const uint8_t *buffer, uint8_t size);

    private:

        spi_bus &bus;

        gpio_output &chip_select;
};

#endif
