/**
 * @file wiringpi_transport.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief SPI bus and GPIO pins of the Raspberry Pi through wiringPi
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef __WIRINGPI_TRANSPORT_H__
#define __WIRINGPI_TRANSPORT_H__

#include <mutex>

#include "spi_transport.hpp"


// SX127X - Raspberry connections (wiringPi numbering)
#define DEFAULT_SPI_CHANNEL     0
#define DEFAULT_SPI_SPEED       500000
#define DEFAULT_SS_PIN          6
#define DEFAULT_DIO0_PIN        7
#define DEFAULT_RST_PIN         0


/**
 * Initializes wiringPi, throws transport_fault on failure
 */
void wiringpi_setup(void);


class wiringpi_spi_bus : public spi_bus {

    public:

        wiringpi_spi_bus(int channel, int speed);

        void lock(void) override;

        void unlock(void) override;

        void transfer(uint8_t *buffer, std::size_t size) override;

    private:

        const int channel;

        std::mutex mutex;
};


class wiringpi_output_pin : public gpio_output {

    public:

        explicit wiringpi_output_pin(int pin);

        void write(bool high) override;

    private:

        const int pin;
};


class wiringpi_input_pin : public gpio_input {

    public:

        explicit wiringpi_input_pin(int pin);

        bool read(void) override;

    private:

        const int pin;
};


/**
 * Pulses the reset line of the module
 */
void radio_reset(gpio_output &rst);

#endif
