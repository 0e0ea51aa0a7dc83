/**
 * @file datarate.cpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "datarate.hpp"
#include "lora_errors.hpp"


/*!
 * Datarate table
 */
static const datarate_profile_t datarates[] = {
    { "SF7BW125",  0x74, 0x72, 0x04 },
    { "SF7BW250",  0x74, 0x82, 0x04 },
    { "SF8BW125",  0x84, 0x72, 0x04 },
    { "SF9BW125",  0x94, 0x72, 0x04 },
    { "SF10BW125", 0xA4, 0x72, 0x04 },
    { "SF11BW125", 0xB4, 0x72, 0x0C },
    { "SF12BW125", 0xC4, 0x72, 0x0C },
};


const datarate_profile_t& lookup_datarate(const std::string &name)
{
    for (const auto &profile : datarates) {
        if (name == profile.name) {
            return profile;
        }
    }

    throw invalid_configuration("Invalid datarate: '" + name + "'");
}
