/**
 * @file MQTTUplinkBridge.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief Transmits every message of an MQTT topic as one LoRaWAN uplink
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef MQTTUplinkBridge_MQTTUPLINKBRIDGE_HH
#define MQTTUplinkBridge_MQTTUPLINKBRIDGE_HH

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <tuple>

#include "mqtt/async_client.h"
#include "HelperClasses.hpp"
#include "UplinkSession.hpp"
#include "lora_radio.hpp"

/*
 * Client and its callback, see MqttCallback in HelperClasses.hpp
 */
using MqttAsyncTuple = std::tuple<mqtt::async_client_ptr,
      mqtt::callback_ptr>;

class MQTTUplinkBridge {
    MqttAsyncTuple mqtt_async_tuple;
    UplinkSession session;
    UplinkQueue& queue;
    std::string report_topic;
    std::chrono::milliseconds timeout;

    mqtt::message_ptr createMessage(const void* payload,
            std::size_t len, const std::string& topic,
            uint8_t QoS, bool retain_msg = false);
    mqtt::connect_options buildConnectOptions();

    void transmit(const std::string& payload);

    public:
    MQTTUplinkBridge() = delete;
    MQTTUplinkBridge(
        MqttAsyncTuple mqtt_async_tuple_,
        lora_radio& radio_,
        UplinkQueue& queue_,
        const std::string& report_topic_,
        uint16_t first_frame_counter,
        std::chrono::milliseconds timeout_ = std::chrono::milliseconds(500));
    ~MQTTUplinkBridge();

    /*
     * Sends queued payloads until running turns false or the frame
     * counter is exhausted. Must be the only thread using the radio.
     */
    void run(const std::atomic<bool>& running);

    void publishMessage(
            const void* payload,
            std::size_t len,
            const std::string& topic,
            uint8_t QoS,
            const std::string& debug_info);

    uint32_t nextFrameCounter() const { return session.nextFrameCounter(); }
};

#endif
