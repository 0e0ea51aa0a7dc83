/**
 * @file datarate.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief LoRa datarate profiles (spreading factor / bandwidth)
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef __DATARATE_H__
#define __DATARATE_H__

#include <cstdint>
#include <string>


/*!
 * Register triplet written for one datarate. The values are the literal
 * encodings the modem expects and are only ever taken as a whole from the
 * datarate table.
 */
typedef struct {
    const char *name;
    uint8_t     sf;          // written to REG_LR_MODEMCONFIG2
    uint8_t     bw;          // written to REG_LR_MODEMCONFIG1
    uint8_t     modem_config; // written to REG_LR_MODEMCONFIG3
} datarate_profile_t;


/**
 * Looks up a profile by name (SF7BW125 ... SF12BW125).
 * Throws invalid_configuration for unknown names.
 */
const datarate_profile_t& lookup_datarate(const std::string &name);

#endif
