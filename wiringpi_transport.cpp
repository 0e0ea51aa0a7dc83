/**
 * @file wiringpi_transport.cpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <chrono>
#include <string>
#include <thread>

extern "C" {
    #include <wiringPi.h>
    #include <wiringPiSPI.h>
}

#include "wiringpi_transport.hpp"
#include "lora_errors.hpp"


void wiringpi_setup(void)
{
    if (wiringPiSetup() < 0) {
        throw transport_fault("wiringPiSetup failed");
    }
}


wiringpi_spi_bus::wiringpi_spi_bus(int channel, int speed)
    : channel(channel)
{
    if (wiringPiSPISetup(channel, speed) < 0) {
        throw transport_fault("wiringPiSPISetup failed on channel " + std::to_string(channel));
    }
}

/**
 * Acquire lock
 */
void wiringpi_spi_bus::lock(void)
{
    mutex.lock();
}

/**
 * Release lock
 */
void wiringpi_spi_bus::unlock(void)
{
    mutex.unlock();
}

void wiringpi_spi_bus::transfer(uint8_t *buffer, std::size_t size)
{
    if (wiringPiSPIDataRW(channel, buffer, (int)size) < 0) {
        throw transport_fault("SPI transfer of " + std::to_string(size)
                              + " bytes failed on channel " + std::to_string(channel));
    }
}


wiringpi_output_pin::wiringpi_output_pin(int pin)
    : pin(pin)
{
    pinMode(pin, OUTPUT);
}

void wiringpi_output_pin::write(bool high)
{
    digitalWrite(pin, high ? HIGH : LOW);
}


wiringpi_input_pin::wiringpi_input_pin(int pin)
    : pin(pin)
{
    pinMode(pin, INPUT);
}

bool wiringpi_input_pin::read(void)
{
    return digitalRead(pin) == HIGH;
}


void radio_reset(gpio_output &rst)
{
    rst.write(false);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    rst.write(true);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
}
