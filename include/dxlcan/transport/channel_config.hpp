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

#ifndef DXLCAN_TRANSPORT_CHANNEL_CONFIG_HPP_
#define DXLCAN_TRANSPORT_CHANNEL_CONFIG_HPP_

#include <cstdint>
#include <string>

#include "dxlcan/canbus/can_identifier.hpp"

namespace dxlcan::transport {

// Factory defaults of the Waveshare TTL-CAN bridge in transparent mode.
constexpr uint32_t DEFAULT_CAN_ID = 0x60;
constexpr uint32_t DEFAULT_SERIAL_BAUDRATE = 1000000;
constexpr uint32_t DEFAULT_CAN_BAUDRATE = 1000000;
constexpr uint32_t DEFAULT_TIMEOUT_MS = 50;

// Settings for one bridge link. Copied into CanTransport at construction and never changed
// there. can_baud_rate is informational: it is set on the bridge with the vendor tool.
struct ChannelConfig {
    std::string port_name;
    uint32_t serial_baud_rate = DEFAULT_SERIAL_BAUDRATE;
    uint32_t can_baud_rate = DEFAULT_CAN_BAUDRATE;
    canbus::CanIdentifier identifier = canbus::CanIdentifier::validate(DEFAULT_CAN_ID, false);
    uint32_t timeout_ms = DEFAULT_TIMEOUT_MS;
    bool debug = false;
};

}  // namespace dxlcan::transport

#endif  // DXLCAN_TRANSPORT_CHANNEL_CONFIG_HPP_
