/**
 * @file session_config.cpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <cctype>
#include <vector>

#include "session_config.hpp"
#include "lora_errors.hpp"


static int hex_value(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    c = (char)std::tolower((unsigned char)c);
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

template <std::size_t N>
std::array<uint8_t, N> parse_hex_bytes(const std::string &text, const char *what)
{
    std::vector<int> nibbles;

    for (std::size_t i = 0; i < text.size(); i++) {
        char c = text[i];

        // separators as copied from the TTN console
        if (c == ' ' || c == ':' || c == ',' || c == '-') {
            continue;
        }
        if (c == '0' && i + 1 < text.size() && (text[i+1] == 'x' || text[i+1] == 'X')) {
            i++;
            continue;
        }

        int v = hex_value(c);
        if (v < 0) {
            throw invalid_configuration(std::string(what) + ": invalid hex digit '"
                                        + std::string(1, c) + "'");
        }
        nibbles.push_back(v);
    }

    if (nibbles.size() != 2 * N) {
        throw invalid_configuration(std::string(what) + ": expected " + std::to_string(2 * N)
                                    + " hex digits, got " + std::to_string(nibbles.size()));
    }

    std::array<uint8_t, N> bytes;
    for (std::size_t i = 0; i < N; i++) {
        bytes[i] = (uint8_t)((nibbles[2*i] << 4) | nibbles[2*i + 1]);
    }

    return bytes;
}

template std::array<uint8_t, 4>  parse_hex_bytes<4>(const std::string&, const char*);
template std::array<uint8_t, 16> parse_hex_bytes<16>(const std::string&, const char*);


session_config make_session_config(const std::string &devaddr,
                                   const std::string &nwkskey,
                                   const std::string &appskey,
                                   const std::string &country)
{
    session_config config;

    config.device_address      = parse_hex_bytes<4>(devaddr, "devaddr");
    config.network_session_key = parse_hex_bytes<16>(nwkskey, "nwkskey");
    config.app_session_key     = parse_hex_bytes<16>(appskey, "appskey");
    config.country             = region_from_string(country);

    return config;
}
