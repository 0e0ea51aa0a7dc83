/**
 * @file main.cpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief LoRaWAN ABP uplink sender for the Raspberry Pi
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include "MQTTUplinkBridge.hpp"
#include "lora_errors.hpp"
#include "lora_radio.hpp"
#include "lorawan_crypto.hpp"
#include "session_config.hpp"
#include "wiringpi_transport.hpp"


const std::string DFLT_SERVER_ADDRESS   { "tcp://localhost:1883" };
const std::string CLIENT_ID             { "rpi_lorawan_abp" };
const std::string DFLT_TOPIC            { "LoRa_test/transmitPacket/" };
const std::string DFLT_REPORT_TOPIC     { "LoRa_test/transmitReport/" };

static std::atomic<bool> running{true};

extern "C" void stop_handler(int)
{
    running = false;
}


int main (int argc, char *argv[]) {

    po::options_description generic("Generic options");
    generic.add_options()
        ("help", "produce help message")
        ("config", po::value<std::string>(), "read options from an INI style file")
    ;

    po::options_description session("Session and radio");
    session.add_options()
        ("devaddr", po::value<std::string>(), "device address, hex MSB first (e.g. 26011BDA)")
        ("nwkskey", po::value<std::string>(), "network session key, 16 bytes hex")
        ("appskey", po::value<std::string>(), "application session key, 16 bytes hex")
        ("region", po::value<std::string>()->default_value("EU"), "US, EU, AU or AS")
        ("channel", po::value<int>(), "fixed channel 0..7, hop over all 8 channels if omitted")
        ("datarate", po::value<std::string>()->default_value("SF7BW125"), "SF7BW125 ... SF12BW125")
        ("fcnt", po::value<unsigned int>()->default_value(0), "frame counter of the first uplink")
        ("max-polls", po::value<unsigned int>()->default_value(15), "TxDone polls before giving up")
        ("poll-interval-ms", po::value<unsigned int>()->default_value(1000), "time between TxDone polls")
    ;

    po::options_description board("Board wiring (wiringPi numbering)");
    board.add_options()
        ("spi-channel", po::value<int>()->default_value(DEFAULT_SPI_CHANNEL), "SPI channel")
        ("spi-speed", po::value<int>()->default_value(DEFAULT_SPI_SPEED), "SPI clock in Hz")
        ("cs-pin", po::value<int>()->default_value(DEFAULT_SS_PIN), "chip select pin")
        ("dio0-pin", po::value<int>()->default_value(DEFAULT_DIO0_PIN), "DIO0 pin")
        ("rst-pin", po::value<int>()->default_value(DEFAULT_RST_PIN), "reset pin")
    ;

    po::options_description mode("Mode");
    mode.add_options()
        ("send", po::value<std::string>(), "send one uplink with this text")
        ("bridge", "send every message of the MQTT topic as an uplink")
        ("server", po::value<std::string>()->default_value(DFLT_SERVER_ADDRESS), "MQTT broker")
        ("topic", po::value<std::string>()->default_value(DFLT_TOPIC), "topic to transmit")
        ("report-topic", po::value<std::string>()->default_value(DFLT_REPORT_TOPIC), "topic for transmit reports")
        ("queue-size", po::value<unsigned int>()->default_value(DEFAULT_UPLINK_QUEUE_CAPACITY), "payloads waiting for the radio before new ones are dropped")
    ;

    po::options_description desc("Allowed options");
    desc.add(generic).add(session).add(board).add(mode);

    po::variables_map vm;

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("config")) {
            std::ifstream config_file(vm["config"].as<std::string>());
            if (!config_file) {
                std::cerr << "Can not open config file '" << vm["config"].as<std::string>() << "'" << std::endl;
                return 1;
            }
            po::store(po::parse_config_file(config_file, desc), vm);
        }

        po::notify(vm);
    }
    catch (const po::error& exc) {
        std::cerr << exc.what() << std::endl << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    if (!vm.count("send") && !vm.count("bridge")) {
        std::cout << "nothing setup, use --send or --bridge" << std::endl;
        return 1;
    }

    if (!vm.count("devaddr") || !vm.count("nwkskey") || !vm.count("appskey")) {
        std::cerr << "--devaddr, --nwkskey and --appskey are required" << std::endl;
        return 1;
    }

    try {
        session_config config = make_session_config(vm["devaddr"].as<std::string>(),
                                                    vm["nwkskey"].as<std::string>(),
                                                    vm["appskey"].as<std::string>(),
                                                    vm["region"].as<std::string>());

        std::optional<uint8_t> channel;
        if (vm.count("channel")) {
            int ch = vm["channel"].as<int>();
            if (ch < 0 || ch >= NB_UPLINK_CHANNELS) {
                throw invalid_configuration("--channel must be in [0,7]");
            }
            channel = (uint8_t)ch;
        }

        tx_timing timing;
        timing.max_poll_attempts = vm["max-polls"].as<unsigned int>();
        timing.poll_interval = std::chrono::milliseconds(vm["poll-interval-ms"].as<unsigned int>());

        // reject a bad name before the radio is touched
        const std::string datarate = lookup_datarate(vm["datarate"].as<std::string>()).name;

        if (vm["queue-size"].as<unsigned int>() == 0) {
            throw invalid_configuration("--queue-size must be at least 1");
        }

        unsigned int fcnt = vm["fcnt"].as<unsigned int>();
        if (fcnt > 0xFFFF) {
            throw invalid_configuration("--fcnt must fit into 16 bit");
        }

        wiringpi_setup();

        wiringpi_output_pin rst(vm["rst-pin"].as<int>());
        wiringpi_output_pin chip_select(vm["cs-pin"].as<int>());
        wiringpi_input_pin dio0(vm["dio0-pin"].as<int>());
        wiringpi_spi_bus bus(vm["spi-channel"].as<int>(), vm["spi-speed"].as<int>());

        radio_reset(rst);

        lorawan_crypto crypto;
        lora_radio radio(bus, chip_select, dio0, config, crypto, channel, timing);
        radio.set_datarate(datarate);

        std::printf("LORA chip with version %x found.\n", radio.get_version());
        std::printf("Region %s, %s, %s.\n", region_name(config.country),
                    radio.get_datarate().name,
                    radio.is_hopping() ? "channel hopping" : "single channel");
        std::cout << "------------------" << std::endl;

        if (vm.count("send")) {
            const std::string text = vm["send"].as<std::string>();
            bool tx_done = radio.send(reinterpret_cast<const uint8_t*>(text.data()),
                                      text.size(), (uint16_t)fcnt);
            return tx_done ? 0 : 2;
        }

        std::signal(SIGINT, stop_handler);
        std::signal(SIGTERM, stop_handler);

        std::cout << "Initializing and connecting for server '"
                  << vm["server"].as<std::string>() << "'..." << std::endl;

        UplinkQueue queue(vm["queue-size"].as<unsigned int>());
        std::vector<std::shared_ptr<TopicsToHandle>> topics_to_handle;
        topics_to_handle.push_back(std::make_shared<UplinkTopic>(
                    vm["topic"].as<std::string>(), queue));

        auto mqtt_async_client = std::make_shared<mqtt::async_client>(
                vm["server"].as<std::string>(), CLIENT_ID);

        auto callback = std::make_shared<MqttCallback>
                (mqtt_async_client, topics_to_handle);

        MQTTUplinkBridge bridge(std::make_tuple(mqtt_async_client, callback),
                                radio, queue, vm["report-topic"].as<std::string>(),
                                (uint16_t)fcnt);

        bridge.run(running);

        std::cout << "Stopped, next frame counter is " << bridge.nextFrameCounter() << std::endl;
    }
    catch (const lora_error& exc) {
        std::cerr << exc.what() << std::endl;
        return 1;
    }
    catch (const mqtt::exception& exc) {
        std::cerr << exc.what() << std::endl;
        return 1;
    }

    return 0;
}
