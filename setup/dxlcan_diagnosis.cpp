// Copyright 2025 Enactic, Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <cstdlib>
#include <dxlcan/diagnostics/frame_tracer.hpp>
#include <dxlcan/exceptions.hpp>
#include <dxlcan/transport/can_transport.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "diagnosis_args.hpp"

using dxlcan::diagnostics::FrameTracer;

// Protocol 1.0 PING, the smallest request every Dynamixel answers with a status packet.
static std::vector<uint8_t> build_ping_probe(uint8_t dxl_id) {
    std::vector<uint8_t> packet = {0xFF, 0xFF, dxl_id, 0x02, 0x01, 0x00};
    uint8_t sum = 0;
    for (size_t i = 2; i < packet.size() - 1; ++i) sum += packet[i];
    packet.back() = static_cast<uint8_t>(~sum);
    return packet;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " <serial_port> [-b serial_baud] [-i can_id] [-x] [-c can_baud]"
                 " [-t timeout_ms] [-n dxl_id] [-d]\n"
              << "  -x  use a 29-bit extended CAN identifier\n"
              << "  -d  trace every CAN-sized chunk\n";
}

int main(int argc, char* argv[]) {
    std::cout << "dxl_can bridge diagnostics\n";

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    dxlcan::transport::ChannelConfig config;
    config.port_name = argv[1];
    uint32_t can_id = dxlcan::transport::DEFAULT_CAN_ID;
    uint32_t dxl_id = 1;
    bool extended = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        bool takes_value = (arg == "-b" || arg == "-i" || arg == "-c" || arg == "-t" ||
                            arg == "-n");
        uint32_t value = 0;
        if (takes_value) {
            if (i + 1 >= argc || !dxlcan::setup::parse_uint32(argv[i + 1], value)) {
                std::cerr << "Error: '" << arg << "' needs a numeric value.\n";
                return 1;
            }
            ++i;
        }

        if (arg == "-b") {
            config.serial_baud_rate = value;
        } else if (arg == "-i") {
            can_id = value;
        } else if (arg == "-c") {
            config.can_baud_rate = value;
        } else if (arg == "-t") {
            config.timeout_ms = value;
        } else if (arg == "-n") {
            dxl_id = value;
        } else if (arg == "-x") {
            extended = true;
        } else if (arg == "-d") {
            config.debug = true;
        } else {
            std::cerr << "Error: Unknown argument '" << arg << "'.\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (dxl_id > 0xFD) {
        std::cerr << "Error: Dynamixel ID must be 0..253\n";
        return 1;
    }

    try {
        config.identifier = dxlcan::canbus::CanIdentifier::validate(can_id, extended);
    } catch (const dxlcan::InvalidIdentifier& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    dxlcan::diagnostics::print_bridge_setup_instructions(
        config.identifier, config.can_baud_rate, config.serial_baud_rate, std::cout);

    auto transport = dxlcan::transport::make_waveshare_transport(config);
    try {
        transport->open();
    } catch (const dxlcan::DxlCanException& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Opened " << transport->get_port_name() << " at " << transport->get_baud_rate()
              << " bps" << std::endl;

    auto probe = build_ping_probe(static_cast<uint8_t>(dxl_id));
    // Status packet for PING: FF FF ID 02 ERR CHK
    const size_t expected = 6;

    std::vector<uint8_t> reply;
    try {
        transport->clear_port();
        size_t written = transport->write_bytes(probe);
        std::cout << "Sent " << written
                  << " bytes: " << FrameTracer::to_hex(probe.data(), probe.size()) << std::endl;

        reply = transport->read_bytes(expected);
    } catch (const dxlcan::DxlCanException& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        transport->close();
        return 1;
    }
    transport->close();

    if (reply.empty()) {
        std::cout << "NG: no response from ID " << dxl_id << "\n";
        std::cout << "Hints:\n";
        std::cout << "  • Both bridges must be in transparent mode with matching CAN ID\n";
        std::cout << "  • Serial baud on the bridge must match the Dynamixel baud\n";
        std::cout << "  • CAN wiring/termination or CAN bitrate mismatch\n";
        return 2;
    }

    std::cout << "Received " << reply.size() << " bytes: "
              << FrameTracer::to_hex(reply.data(), reply.size()) << "\n";
    if (reply.size() < expected) {
        std::cout << "NG: short status packet (frame loss on the CAN segment?)\n";
        return 2;
    }
    std::cout << "OK: ID " << dxl_id << " responded through the bridge\n";
    return 0;
}
