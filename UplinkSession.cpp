#include <iostream>
#include <sstream>

#include "UplinkSession.hpp"
#include "lora_errors.hpp"

namespace {

std::string escapeJson(const std::string& text) {
    std::string out;
    for(char c : text) {
        if(c == '"' || c == '\\')
            out += '\\';
        if(c == '\n')
            out += "\\n";
        else
            out += c;
    }
    return out;
}

}

std::string TransmitReport::toJson() const {
    std::ostringstream json;

    json << "{\"fcnt\":" << fcnt
         << ",\"size\":" << size;
    if(sent)
        json << ",\"tx_done\":" << (tx_done ? "true" : "false");
    else
        json << ",\"error\":\"" << escapeJson(error) << "\"";
    json << ",\"dropped\":" << dropped << "}";

    return json.str();
}

TransmitReport UplinkSession::transmit(const std::string& payload) {
    TransmitReport report;
    report.fcnt = frame_counter;
    report.size = payload.size();

    if(exhausted()) {
        report.error = "frame counter exhausted, the device needs new session keys";
        std::cerr << "\tUplink dropped: " << report.error << "\n";
        return report;
    }

    try {
        report.tx_done = radio.send(
                reinterpret_cast<const uint8_t*>(payload.data()),
                payload.size(), (uint16_t)frame_counter);
        report.sent = true;
        frame_counter++;
    }
    catch(const lora_error& exc) {
        std::cerr << "\tUplink dropped: " << exc.what() << "\n";
        report.error = exc.what();
    }

    return report;
}
