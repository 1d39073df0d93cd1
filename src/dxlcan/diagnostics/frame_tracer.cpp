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

#include <dxlcan/diagnostics/frame_tracer.hpp>
#include <iomanip>
#include <sstream>

namespace dxlcan::diagnostics {

namespace {

const char* direction_label(Direction direction) {
    return direction == Direction::TX ? "TX" : "RX";
}

}  // namespace

std::string FrameTracer::to_hex(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
        if (i + 1 < len) oss << ' ';
    }
    return oss.str();
}

void FrameTracer::trace_chunk(Direction direction, const canbus::FrameChunk& chunk) {
    *out_ << "[DEBUG] " << direction_label(direction) << " id=" << chunk.identifier.to_string()
          << " seq=" << chunk.sequence_index << " len=" << static_cast<int>(chunk.len) << " : "
          << to_hex(chunk.data.data(), chunk.len) << '\n';
}

void FrameTracer::trace_chunks(Direction direction,
                               const std::vector<canbus::FrameChunk>& chunks) {
    for (const auto& chunk : chunks) {
        trace_chunk(direction, chunk);
    }
}

void FrameTracer::trace_segmentation(Direction direction, size_t total_bytes,
                                     size_t chunk_count) {
    *out_ << "[DEBUG] " << direction_label(direction) << ' ' << total_bytes << " bytes -> "
          << chunk_count << " CAN frame(s)\n";
}

void FrameTracer::trace_short_read(size_t requested, size_t received, uint32_t timeout_ms) {
    *out_ << "[DEBUG] RX timeout after " << timeout_ms << " ms: " << received << " of "
          << requested << " bytes\n";
}

void FrameTracer::trace_port_configuration(const std::string& port_name,
                                           uint32_t serial_baud_rate,
                                           const canbus::CanIdentifier& identifier,
                                           uint32_t can_baud_rate, uint32_t timeout_ms) {
    *out_ << "[DEBUG] Port Configuration:\n"
          << "  - Serial Port: " << port_name << '\n'
          << "  - Serial Baudrate: " << serial_baud_rate << '\n'
          << "  - CAN ID: " << identifier.to_string() << '\n'
          << "  - CAN Baudrate: " << can_baud_rate << '\n'
          << "  - Timeout: " << timeout_ms << " ms\n"
          << "Note: Make sure the bridge converter is configured with these settings\n";
}

void print_bridge_setup_instructions(const canbus::CanIdentifier& identifier,
                                     uint32_t can_baud_rate, uint32_t serial_baud_rate,
                                     std::ostream& out) {
    std::ostringstream id;
    id << "0x" << std::uppercase << std::hex << identifier.value();

    out << "=== TTL-CAN bridge configuration ===\n"
        << "1. Open the converter's vendor configuration tool (WS-CAN-TOOL)\n"
        << "2. Connect each converter to the host through a USB-to-TTL adapter\n"
        << "3. Configure the following settings on both converters:\n"
        << "   - Working Mode: Transparent Conversion\n"
        << "   - CAN Baudrate: " << can_baud_rate << " bps\n"
        << "   - Serial Baudrate: " << serial_baud_rate << " bps\n"
        << "   - Serial Data Bit: 8\n"
        << "   - Serial Stop Bit: 1\n"
        << "   - Serial Parity Bit: None\n"
        << "   - CAN ID: " << id.str() << '\n'
        << "   - Frame Type: "
        << (identifier.is_extended() ? "Extended Frame" : "Standard Frame") << '\n'
        << "4. Save Device Parameters\n"
        << "5. Restart Device\n"
        << "A mismatch in any of these settings shows up only as missing responses.\n";
}

}  // namespace dxlcan::diagnostics
