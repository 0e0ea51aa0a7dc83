/**
 * @file register_protocol.cpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <mutex>

#include "register_protocol.hpp"
#include "sx1276_RegsLoRa.hpp"


namespace {

/**
 * Keeps chip select asserted for the lifetime of one transaction
 */
class chip_select_guard {

    public:

        explicit chip_select_guard(gpio_output &pin) : pin(pin)
        {
            pin.write(false);
        }

        ~chip_select_guard()
        {
            pin.write(true);
        }

        chip_select_guard(const chip_select_guard&) = delete;
        chip_select_guard& operator=(const chip_select_guard&) = delete;

    private:

        gpio_output &pin;
};

}


register_protocol::register_protocol(spi_bus &bus, gpio_output &chip_select)
    : bus(bus), chip_select(chip_select)
{
    // idle level, the radio is deselected between transactions
    chip_select.write(true);
}

/**
 * Reads the value of a single register
 */
uint8_t register_protocol::read_register(uint8_t addr)
{
    uint8_t spibuf[2];

    spibuf[0] = addr & 0x7F;
    spibuf[1] = 0x00;

    const std::lock_guard<spi_bus> lock(bus);
    chip_select_guard cs(chip_select);

    bus.transfer(spibuf, 2);

    return spibuf[1];
}

/**
 * Writes a single byte to a given register
 */
void register_protocol::write_to_register(uint8_t addr, uint8_t value)
{
    uint8_t spibuf[2];

    spibuf[0] = addr | 0x80;
    spibuf[1] = value;

    const std::lock_guard<spi_bus> lock(bus);
    chip_select_guard cs(chip_select);

    bus.transfer(spibuf, 2);
}

void register_protocol::write_fifo(const uint8_t *buffer, uint8_t size)
{
    for (uint8_t i = 0; i < size; i++) {
        write_to_register(REG_LR_FIFO, buffer[i]);
    }
}
