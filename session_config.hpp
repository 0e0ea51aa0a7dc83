/**
 * @file session_config.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief ABP session parameters
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef __SESSION_CONFIG_H__
#define __SESSION_CONFIG_H__

#include <array>
#include <cstdint>
#include <string>

#include "region.hpp"


typedef std::array<uint8_t, 4>  dev_addr_t;
typedef std::array<uint8_t, 16> session_key_t;

/*!
 * Pre-provisioned ABP session. The device address is stored MSB first,
 * as shown by the network console.
 */
struct session_config {
    dev_addr_t    device_address;
    session_key_t network_session_key;
    session_key_t app_session_key;
    region        country;
};


/**
 * Parses a hex string ("26011BDA", "26:01:1b:da" or "0x26, 0x01, ...")
 * into exactly N bytes. Throws invalid_configuration on bad digits or length.
 */
template <std::size_t N>
std::array<uint8_t, N> parse_hex_bytes(const std::string &text, const char *what);

session_config make_session_config(const std::string &devaddr,
                                   const std::string &nwkskey,
                                   const std::string &appskey,
                                   const std::string &country);

#endif
