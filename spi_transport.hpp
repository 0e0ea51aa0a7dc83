/**
 * @file spi_transport.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief Abstract SPI bus and GPIO pins the radio is wired to
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef __SPI_TRANSPORT_H__
#define __SPI_TRANSPORT_H__

#include <cstddef>
#include <cstdint>


/**
 * Full duplex byte exchange channel.
 *
 * Satisfies BasicLockable so a register transaction can hold the bus with
 * std::lock_guard for its whole duration. transfer() sends size bytes from
 * buffer and overwrites them with the bytes clocked in; it throws
 * transport_fault if the exchange fails.
 */
class spi_bus {

    public:

        virtual ~spi_bus() = default;

        virtual void lock(void) = 0;

        virtual void unlock(void) = 0;

        virtual void transfer(uint8_t *buffer, std::size_t size) = 0;
};


class gpio_output {

    public:

        virtual ~gpio_output() = default;

        virtual void write(bool high) = 0;
};


class gpio_input {

    public:

        virtual ~gpio_input() = default;

        virtual bool read(void) = 0;
};

#endif
