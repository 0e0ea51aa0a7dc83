#include <thread>

#include "MQTTUplinkBridge.hpp"
#include "HelperClasses.hpp"

MQTTUplinkBridge::MQTTUplinkBridge(
        MqttAsyncTuple mqtt_async_tuple_,
        lora_radio& radio_,
        UplinkQueue& queue_,
        const std::string& report_topic_,
        uint16_t first_frame_counter,
        std::chrono::milliseconds timeout_) :
    mqtt_async_tuple(mqtt_async_tuple_),
    session(radio_, first_frame_counter), queue(queue_),
    report_topic(report_topic_), timeout(timeout_) {

    auto [mqtt_async_client, callback] = mqtt_async_tuple;

    mqtt_async_client->set_callback(*callback);
    mqtt::connect_options connection_options = buildConnectOptions();

    try {
        std::cout << "Connecting ... ";
        mqtt_async_client->connect(connection_options)->wait();
        std::cout << "OK!\n";
    }
    catch(const mqtt::exception& exc) {
        std::cerr << exc.what() << "\n";
    }
}

MQTTUplinkBridge::~MQTTUplinkBridge() {
    try {
        std::cout << "Disconnecting ... ";
        std::get<0>(mqtt_async_tuple)->disconnect()->wait();
        std::cout << "OK!\n";
    }
    catch(const mqtt::exception& exc) {
        std::cerr << exc.what() << "\n";
    }
}

mqtt::connect_options MQTTUplinkBridge::buildConnectOptions() {
    mqtt::connect_options opt;
    opt.set_clean_session(true);
    opt.set_keep_alive_interval(std::chrono::seconds(10));
    // reconnects resubscribe through MqttCallback::connected()
    opt.set_automatic_reconnect(true);
    std::string lwt_payload = "UPLINK_BRIDGE_OFFLINE";
    opt.set_will(mqtt::message(report_topic, lwt_payload, 1, false));
    return(opt);
}

mqtt::message_ptr MQTTUplinkBridge::createMessage(
        const void* payload,
        std::size_t len,
        const std::string& topic,
        uint8_t QoS,
        bool retain_msg) {
    return mqtt::make_message(topic, payload, len, QoS, retain_msg);
}

void MQTTUplinkBridge::publishMessage(
        const void* payload,
        std::size_t len,
        const std::string& topic,
        uint8_t QoS,
        const std::string& debug_info) {
    mqtt::message_ptr msg = createMessage(payload, len, topic, QoS);
    ActionListener listener("publish");

    try {
        std::cout << "\t" << debug_info << "\n";
        mqtt::delivery_token_ptr publish_tok = std::get<0>(mqtt_async_tuple)->publish(
                msg, nullptr, listener);
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while(not listener.isDone() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        if(not listener.isDone()) {
            // listener lives on this stack, the token must finish before we return
            std::cerr << "	Publish slower than " << timeout.count() << " ms, waiting\n";
            publish_tok->wait();
        }
    }
    catch(const mqtt::exception& exc) {
        std::cerr << exc.what() << "\n";
    }
}

void MQTTUplinkBridge::transmit(const std::string& payload) {
    TransmitReport report = session.transmit(payload);
    report.dropped = queue.dropped();

    const std::string text = report.toJson();
    publishMessage(text.data(), text.size(), report_topic, 1,
            "Publishing transmit report ...");
}

void MQTTUplinkBridge::run(const std::atomic<bool>& running) {
    std::string payload;

    while(running) {
        if(session.exhausted()) {
            std::cerr << "Frame counter exhausted, stopping the bridge\n";
            return;
        }
        if(queue.pop(payload, std::chrono::milliseconds(500)))
            transmit(payload);
    }
}
