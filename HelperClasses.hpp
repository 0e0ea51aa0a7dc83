/**
 * @file HelperClasses.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief paho.mqtt.cpp callbacks feeding uplink payloads to the radio thread
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef MQTTUplinkBridge_HELPERCLASSES_H
#define MQTTUplinkBridge_HELPERCLASSES_H

#include <atomic>
#include <iostream>
#include <string>
#include <vector>

#include "mqtt/async_client.h"
#include "UplinkQueue.hpp"


class TopicsToHandle {
public:
    std::string name;
    uint8_t QoS;

    TopicsToHandle(const std::string& name_,
            uint8_t QoS_) : name(name_), QoS(QoS_) {}
    virtual ~TopicsToHandle() = default;
    virtual void processMessage(mqtt::const_message_ptr msg_) = 0;
};

class UplinkTopic : public virtual TopicsToHandle {
    UplinkQueue& queue;

public:
    UplinkTopic(const std::string& name, UplinkQueue& queue_,
            uint8_t QoS = 1) :
        TopicsToHandle(name, QoS), queue(queue_) {}
    void processMessage(mqtt::const_message_ptr msg_) override {
        if(!queue.push(msg_->to_string()))
            std::cerr << "\tUplink queue full, dropping message from "
                << msg_->get_topic() << "\n";
    }
};

/**
 * A base action listener.
 */
class ActionListener : public virtual mqtt::iaction_listener {
    std::string name;
    std::atomic<bool> done;

	void on_failure(const mqtt::token& tok) override {
        auto topics = tok.get_topics();
        if(topics && !topics->empty())
            std::cerr << "\t" << name << " failure for " <<
                (*topics)[0] << '\n';
        else
            std::cerr << "\t" << name << " failure\n";
        done = true;
	}
	void on_success(const mqtt::token& tok) override {
        auto topics = tok.get_topics();
        if(topics && !topics->empty())
            std::cout << "\t" << name << " success for " <<
                (*topics)[0] << '\n';
        done = true;
	}

public:
    ActionListener(const std::string& name_) :
        name(name_), done(false) {}
    bool isDone() const { return done; };
};


class MqttCallback : public virtual mqtt::callback {
    std::shared_ptr<mqtt::async_client> mqtt_async_client;
    std::vector<std::shared_ptr<TopicsToHandle>> topics_to_handle;

    ActionListener listener{"subscribe"};

    void connected(const std::string& cause) override {
        std::cout << "\tConnected!\n";
        for(const auto& topic : topics_to_handle) {
            std::cout << "\t\tSubscribing to '" <<
                topic->name << "' using QoS '" << (int)topic->QoS << "'\n";
            mqtt_async_client->subscribe(topic->name,
                    topic->QoS, nullptr, listener);
        }
    }
	void connection_lost(const std::string& cause) override {
		std::cerr << "\tConnection lost ... ";
		if (!cause.empty())
			std::cerr << cause << "\n";
        else
            std::cerr << "no cause found!\n";
	}
    void message_arrived(mqtt::const_message_ptr msg) override {
        std::cout << "\tMessage arrived on " <<
            msg->get_topic() << "\n";
        for(const auto& topic : topics_to_handle) {
            if(topic->name == msg->get_topic())
                topic->processMessage(msg);
        }
    }

public:
    MqttCallback(std::shared_ptr<mqtt::async_client> mqtt_async_client_,
            const std::vector<std::shared_ptr<TopicsToHandle>>& topics_to_handle_) :
        mqtt_async_client(mqtt_async_client_),
        topics_to_handle(topics_to_handle_) {}
};

#endif
