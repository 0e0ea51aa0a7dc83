/**
 * @file UplinkQueue.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief Bounded hand-over of MQTT payloads to the radio thread
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#ifndef MQTTUplinkBridge_UPLINKQUEUE_H
#define MQTTUplinkBridge_UPLINKQUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

#define DEFAULT_UPLINK_QUEUE_CAPACITY   16


/*
 * Payloads received over MQTT wait here until the radio thread
 * picks them up. The radio is only ever touched by that one thread.
 * One uplink can take 15 s of airtime and polling, so the queue is
 * bounded: a payload arriving while it is full is dropped and counted.
 */
class UplinkQueue {
    std::mutex mutex;
    std::condition_variable cond;
    std::deque<std::string> payloads;
    const std::size_t capacity;
    std::size_t dropped_count;

public:
    explicit UplinkQueue(std::size_t capacity_ = DEFAULT_UPLINK_QUEUE_CAPACITY) :
        capacity(capacity_), dropped_count(0) {}

    UplinkQueue(const UplinkQueue&) = delete;
    UplinkQueue& operator=(const UplinkQueue&) = delete;

    bool push(std::string payload) {
        {
            const std::lock_guard<std::mutex> lock(mutex);
            if(payloads.size() >= capacity) {
                dropped_count++;
                return false;
            }
            payloads.push_back(std::move(payload));
        }
        cond.notify_one();
        return true;
    }

    bool pop(std::string& payload, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        if(!cond.wait_for(lock, timeout, [this] { return !payloads.empty(); }))
            return false;
        payload = std::move(payloads.front());
        payloads.pop_front();
        return true;
    }

    std::size_t size() {
        const std::lock_guard<std::mutex> lock(mutex);
        return payloads.size();
    }

    std::size_t dropped() {
        const std::lock_guard<std::mutex> lock(mutex);
        return dropped_count;
    }
};

#endif
