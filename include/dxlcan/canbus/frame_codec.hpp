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

#ifndef DXLCAN_CANBUS_FRAME_CODEC_HPP_
#define DXLCAN_CANBUS_FRAME_CODEC_HPP_

#include <linux/can.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "dxlcan/canbus/can_identifier.hpp"

namespace dxlcan::canbus {

// One classical CAN frame worth of payload. sequence_index is host-side bookkeeping only,
// it never reaches the wire.
struct FrameChunk {
    CanIdentifier identifier;
    std::array<uint8_t, CAN_MAX_DLEN> data;
    uint8_t len;
    size_t sequence_index;

    const uint8_t* begin() const { return data.data(); }
    const uint8_t* end() const { return data.data() + len; }

    // View as a linux/can.h frame (for tracing and for anything that speaks SocketCAN).
    can_frame to_can_frame() const;
};

// Splits byte streams into <=8 byte chunks and joins them back. Pure, no I/O.
class FrameCodec {
public:
    static constexpr size_t MAX_PAYLOAD_SIZE = CAN_MAX_DLEN;

    // Consecutive chunks of MAX_PAYLOAD_SIZE bytes, the last one possibly shorter and never
    // padded. Empty input yields no chunks. Indices start at @p first_index.
    static std::vector<FrameChunk> segment(const uint8_t* data, size_t size,
                                           const CanIdentifier& identifier,
                                           size_t first_index = 0);
    static std::vector<FrameChunk> segment(const std::vector<uint8_t>& buffer,
                                           const CanIdentifier& identifier);

    // Concatenates payloads in the order given. Content is not inspected.
    static std::vector<uint8_t> reassemble(const std::vector<FrameChunk>& chunks);
    static std::vector<uint8_t> reassemble(const std::vector<std::vector<uint8_t>>& chunks);

    // Number of chunks segment() would produce for @p size bytes.
    static size_t chunk_count(size_t size) {
        return (size + MAX_PAYLOAD_SIZE - 1) / MAX_PAYLOAD_SIZE;
    }
};

}  // namespace dxlcan::canbus

#endif  // DXLCAN_CANBUS_FRAME_CODEC_HPP_
