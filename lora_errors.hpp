/**
 * @file lora_errors.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief Exceptions raised by the uplink driver
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef __LORA_ERRORS_H__
#define __LORA_ERRORS_H__

#include <stdexcept>
#include <string>


class lora_error : public std::runtime_error {
    public:
        explicit lora_error(const std::string& what) : std::runtime_error(what) {}
};

// Byte exchange on the SPI bus failed, the current send is aborted
class transport_fault : public lora_error {
    public:
        explicit transport_fault(const std::string& what) : lora_error(what) {}
};

// Unsupported region, datarate name or malformed session parameter
class invalid_configuration : public lora_error {
    public:
        explicit invalid_configuration(const std::string& what) : lora_error(what) {}
};

// Operation not allowed in the current channel mode
class invalid_operation : public lora_error {
    public:
        explicit invalid_operation(const std::string& what) : lora_error(what) {}
};

// Frame would not fit into the radio FIFO
class payload_too_large : public lora_error {
    public:
        explicit payload_too_large(const std::string& what) : lora_error(what) {}
};

class crypto_error : public lora_error {
    public:
        explicit crypto_error(const std::string& what) : lora_error(what) {}
};

#endif
