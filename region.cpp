/**
 * @file region.cpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "region.hpp"
#include "lora_errors.hpp"
#include "sx1276_RegsLoRa.hpp"


/*!
 * TTN US915 sub-band 2
 */
static const frequency_table_t us_channels = {{
    { 903900000, { 0xE1, 0xF9, 0x99 } },
    { 904100000, { 0xE2, 0x06, 0x66 } },
    { 904300000, { 0xE2, 0x13, 0x33 } },
    { 904500000, { 0xE2, 0x20, 0x00 } },
    { 904700000, { 0xE2, 0x2C, 0xCC } },
    { 904900000, { 0xE2, 0x39, 0x99 } },
    { 905100000, { 0xE2, 0x46, 0x66 } },
    { 905300000, { 0xE2, 0x53, 0x33 } },
}};

/*!
 * EU868, the three mandatory channels first
 */
static const frequency_table_t eu_channels = {{
    { 868100000, { 0xD9, 0x06, 0x66 } },
    { 868300000, { 0xD9, 0x13, 0x33 } },
    { 868500000, { 0xD9, 0x20, 0x00 } },
    { 867100000, { 0xD8, 0xC6, 0x66 } },
    { 867300000, { 0xD8, 0xD3, 0x33 } },
    { 867500000, { 0xD8, 0xE0, 0x00 } },
    { 867700000, { 0xD8, 0xEC, 0xCC } },
    { 867900000, { 0xD8, 0xF9, 0x99 } },
}};

/*!
 * AU915 sub-band 2
 */
static const frequency_table_t au_channels = {{
    { 916800000, { 0xE5, 0x33, 0x33 } },
    { 917000000, { 0xE5, 0x40, 0x00 } },
    { 917200000, { 0xE5, 0x4C, 0xCC } },
    { 917400000, { 0xE5, 0x59, 0x99 } },
    { 917600000, { 0xE5, 0x66, 0x66 } },
    { 917800000, { 0xE5, 0x73, 0x33 } },
    { 918000000, { 0xE5, 0x80, 0x00 } },
    { 918200000, { 0xE5, 0x8C, 0xCC } },
}};

/*!
 * AS923
 */
static const frequency_table_t as_channels = {{
    { 923200000, { 0xE6, 0xCC, 0xCC } },
    { 923400000, { 0xE6, 0xD9, 0x99 } },
    { 922200000, { 0xE6, 0x8C, 0xCC } },
    { 922400000, { 0xE6, 0x99, 0x99 } },
    { 922600000, { 0xE6, 0xA6, 0x66 } },
    { 922800000, { 0xE6, 0xB3, 0x33 } },
    { 923000000, { 0xE6, 0xC0, 0x00 } },
    { 922000000, { 0xE6, 0x80, 0x00 } },
}};


const frequency_table_t& frequency_table_for(region reg)
{
    switch (reg) {
        case region::US:
            return us_channels;
        case region::EU:
            return eu_channels;
        case region::AU:
            return au_channels;
        case region::AS:
            return as_channels;
    }

    throw invalid_configuration("Country code incorrect/unsupported: "
                                + std::to_string(static_cast<int>(reg)));
}

region region_from_string(const std::string &name)
{
    if (name.find("US") != std::string::npos) {
        return region::US;
    } else if (name == "EU") {
        return region::EU;
    } else if (name == "AU") {
        return region::AU;
    } else if (name == "AS") {
        return region::AS;
    }

    throw invalid_configuration("Country code incorrect/unsupported: '" + name + "'");
}

const char* region_name(region reg)
{
    switch (reg) {
        case region::US:
            return "US";
        case region::EU:
            return "EU";
        case region::AU:
            return "AU";
        case region::AS:
            return "AS";
    }

    return "unknown";
}

frequency_word_t frequency_to_word(uint32_t freq)
{
    uint64_t frf = ((uint64_t)freq << 19) / XTAL_FREQ;

    return { (uint8_t)((frf >> 16) & 0xFF),
             (uint8_t)((frf >> 8) & 0xFF),
             (uint8_t)(frf & 0xFF) };
}
