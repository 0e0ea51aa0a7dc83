/**
 * @file region.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief Regional uplink channel plans
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef __REGION_H__
#define __REGION_H__

#include <array>
#include <cstdint>
#include <string>


#define NB_UPLINK_CHANNELS  8

enum class region : uint8_t {
    US,
    EU,
    AU,
    AS,
};

/*!
 * Carrier frequency as written to REG_FRFMSB / REG_FRFMID / REG_FRFLSB
 */
typedef struct {
    uint8_t msb;
    uint8_t mid;
    uint8_t lsb;
} frequency_word_t;

typedef struct {
    uint32_t         freq;  // in Hz
    frequency_word_t word;
} channel_t;

typedef std::array<channel_t, NB_UPLINK_CHANNELS> frequency_table_t;


/**
 * Returns the uplink channel plan of a region.
 * Throws invalid_configuration if the value is not a known region.
 */
const frequency_table_t& frequency_table_for(region reg);

/**
 * Parses "US", "EU", "AU" or "AS". Like the TTN plan names, anything that
 * contains "US" (e.g. "US915") selects the US plan.
 */
region region_from_string(const std::string &name);

const char* region_name(region reg);

/**
 * Frf = freq * 2^19 / XTAL_FREQ, truncated
 */
frequency_word_t frequency_to_word(uint32_t freq);

#endif
