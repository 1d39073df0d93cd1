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

#ifndef DXLCAN_DIAGNOSTICS_FRAME_TRACER_HPP_
#define DXLCAN_DIAGNOSTICS_FRAME_TRACER_HPP_

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "dxlcan/canbus/can_identifier.hpp"
#include "dxlcan/canbus/frame_codec.hpp"

namespace dxlcan::diagnostics {

enum class Direction { TX, RX };

// Human-readable trace of chunk boundaries. Observational only; the format is not stable.
class FrameTracer {
public:
    explicit FrameTracer(std::ostream& out = std::cerr) : out_(&out) {}

    void trace_chunk(Direction direction, const canbus::FrameChunk& chunk);
    void trace_chunks(Direction direction, const std::vector<canbus::FrameChunk>& chunks);

    // How a transfer of total_bytes was split.
    void trace_segmentation(Direction direction, size_t total_bytes, size_t chunk_count);

    void trace_short_read(size_t requested, size_t received, uint32_t timeout_ms);

    void trace_port_configuration(const std::string& port_name, uint32_t serial_baud_rate,
                                  const canbus::CanIdentifier& identifier,
                                  uint32_t can_baud_rate, uint32_t timeout_ms);

    // "FF FF 01 02"
    static std::string to_hex(const uint8_t* data, size_t len);

private:
    std::ostream* out_;
};

// Step list for setting the bridge converter up with the vendor tool so it matches the link.
void print_bridge_setup_instructions(const canbus::CanIdentifier& identifier,
                                     uint32_t can_baud_rate, uint32_t serial_baud_rate,
                                     std::ostream& out = std::cout);

}  // namespace dxlcan::diagnostics

#endif  // DXLCAN_DIAGNOSTICS_FRAME_TRACER_HPP_
