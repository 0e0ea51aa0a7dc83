/**
 * @file lora_radio.cpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <cstdio>
#include <iostream>
#include <thread>

#include <boost/timer/timer.hpp>

#include "lora_radio.hpp"
#include "lora_errors.hpp"
#include "sx1276_RegsLoRa.hpp"


/*!
 * Radio hardware registers initialization, written in this order after the
 * chip has been put to sleep
 */
typedef struct {
    uint8_t addr;
    uint8_t value;
} radio_registers_t;

static const radio_registers_t radio_reg_init[] = {
    { REG_OPMODE,              RFLR_OPMODE_SLEEP },
    { REG_OPMODE,              RFLR_OPMODE_LONGRANGEMODE_ON },
    { REG_PACONFIG,            RF_PACONFIG_MAX_POWER },
    { REG_LR_SYMBTIMEOUTLSB,   RFLR_SYMBTIMEOUTLSB_VALUE },
    { REG_LR_PREAMBLEMSB,      RFLR_PREAMBLEMSB_VALUE },
    { REG_LR_PREAMBLELSB,      RFLR_PREAMBLELSB_VALUE },
    { REG_LR_MODEMCONFIG3,     RFLR_MODEMCONFIG3_INIT },
    { REG_LR_SYNCWORD,         LORA_MAC_PUBLIC_SYNCWORD },
    { REG_LR_INVERTIQ,         RFLR_INVERTIQ_NORMAL },
    { REG_LR_INVERTIQ2,        RFLR_INVERTIQ2_NORMAL },
    { REG_LR_FIFOTXBASEADDR,   RFLR_FIFOTXBASEADDR_VALUE },
    { REG_LR_FIFORXBASEADDR,   RFLR_FIFORXBASEADDR_VALUE },
};


lora_radio::lora_radio(spi_bus &bus, gpio_output &chip_select, gpio_input &dio0,
                       const session_config &session, session_crypto &crypto,
                       std::optional<uint8_t> channel, tx_timing timing)
    : regs(bus, chip_select),
      dio0(dio0),
      session(session),
      assembler(this->session, crypto),
      timing(timing),
      channels(frequency_table_for(session.country)),
      datarate(&lookup_datarate("SF7BW125")),
      hopping(!channel.has_value()),
      frequency{0, 0, 0},
      frame_counter(0),
      version(0),
      sleep_for([](std::chrono::milliseconds duration) {
          std::this_thread::sleep_for(duration);
      }),
      rng(std::random_device{}())
{
    if (!hopping) {
        set_channel(*channel);
    }

    init_radio();
}

/**
 * Checks the chip and loads the modem registers
 */
void lora_radio::init_radio(void)
{
    version = regs.read_register(REG_LR_VERSION);
    if (version != RFLR_VERSION_SX1276) {
        std::cerr << "Error detecting RFM95W (version 0x" << std::hex << (int)version
                  << std::dec << "), check your wiring." << std::endl;
    }

    for (const auto &reg : radio_reg_init) {
        regs.write_to_register(reg.addr, reg.value);
    }
}

void lora_radio::set_datarate(const std::string &name)
{
    datarate = &lookup_datarate(name);
}

void lora_radio::set_channel(uint8_t channel)
{
    if (hopping) {
        throw invalid_operation("Can not set the channel of a multi-channel radio");
    }
    if (channel >= NB_UPLINK_CHANNELS) {
        throw invalid_operation("Channel " + std::to_string(channel) + " out of range [0,"
                                + std::to_string(NB_UPLINK_CHANNELS - 1) + "]");
    }

    frequency = channels[channel].word;
}

void lora_radio::set_sleep_function(sleep_function_t fn)
{
    sleep_for = std::move(fn);
}

void lora_radio::set_channel_picker(channel_picker_t picker)
{
    channel_picker = std::move(picker);
}

uint8_t lora_radio::random_channel(void)
{
    if (channel_picker) {
        return channel_picker() % NB_UPLINK_CHANNELS;
    }

    std::uniform_int_distribution<int> dist(0, NB_UPLINK_CHANNELS - 1);
    return (uint8_t)dist(rng);
}

void lora_radio::set_operation_mode(uint8_t mode)
{
    regs.write_to_register(REG_OPMODE, mode);
}

bool lora_radio::send(const uint8_t *payload, std::size_t size, uint16_t counter)
{
    lorawan_frame frame = assembler.assemble(payload, size, counter);

    if (counter < frame_counter) {
        std::cerr << "Warning: frame counter went back from " << frame_counter
                  << " to " << counter << ", the network will drop this uplink" << std::endl;
    }
    frame_counter = counter;

    return send_packet(frame);
}

bool lora_radio::send_packet(const lorawan_frame &frame)
{
    // enter standby mode (required for FIFO loading)
    set_operation_mode(RFLR_OPMODE_STANDBY);
    sleep_for(timing.standby_settle);

    // DIO0 = TxDone
    regs.write_to_register(REG_DIOMAPPING1, RFLR_DIOMAPPING1_DIO0_TXDONE);

    if (hopping) {
        frequency = channels[random_channel()].word;
    }

    regs.write_to_register(REG_FRFMSB, frequency.msb);
    regs.write_to_register(REG_FRFMID, frequency.mid);
    regs.write_to_register(REG_FRFLSB, frequency.lsb);

    regs.write_to_register(REG_LR_MODEMCONFIG2, datarate->sf);
    regs.write_to_register(REG_LR_MODEMCONFIG1, datarate->bw);
    regs.write_to_register(REG_LR_MODEMCONFIG3, datarate->modem_config);

    regs.write_to_register(REG_LR_PAYLOADLENGTH, frame.size);

    // FIFO pointer to the TX base address
    regs.write_to_register(REG_LR_FIFOADDRPTR, RFLR_FIFOTXBASEADDR_VALUE);

    regs.write_fifo(frame.data.data(), frame.size);

    set_operation_mode(RFLR_OPMODE_TRANSMITTER);

    std::printf("Sending packet (%u bytes, %s, FRF %02X%02X%02X) ...\n",
                (unsigned)frame.size, datarate->name,
                frequency.msb, frequency.mid, frequency.lsb);

    bool tx_done = wait_tx_done();

    // the chip can not abort a running transmission, sleep in any case
    set_operation_mode(RFLR_OPMODE_SLEEP);

    return tx_done;
}

/**
 * Samples DIO0, then again after each poll_interval, max_poll_attempts times
 */
bool lora_radio::wait_tx_done(void)
{
    boost::timer::cpu_timer timer;
    unsigned int attempt = 0;

    while (!dio0.read()) {
        if (attempt == timing.max_poll_attempts) {
            std::cerr << "No TxDone after " << timing.max_poll_attempts
                      << " polls, putting the radio to sleep anyway" << std::endl;
            return false;
        }
        sleep_for(timing.poll_interval);
        attempt++;
    }

    std::printf("Packet sent! (%.3f s)\n", timer.elapsed().wall / 1e9);
    return true;
}
