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

#include <algorithm>
#include <cstring>
#include <dxlcan/canbus/frame_codec.hpp>

namespace dxlcan::canbus {

can_frame FrameChunk::to_can_frame() const {
    can_frame frame;
    std::memset(&frame, 0, sizeof(frame));
    frame.can_id = identifier.to_can_id();
    frame.can_dlc = len;
    std::memcpy(frame.data, data.data(), len);
    return frame;
}

std::vector<FrameChunk> FrameCodec::segment(const uint8_t* data, size_t size,
                                            const CanIdentifier& identifier, size_t first_index) {
    std::vector<FrameChunk> chunks;
    if (!data || size == 0) {
        return chunks;
    }

    chunks.reserve(chunk_count(size));
    size_t offset = 0;
    while (offset < size) {
        size_t n = std::min(MAX_PAYLOAD_SIZE, size - offset);
        FrameChunk chunk{identifier, {}, static_cast<uint8_t>(n), first_index + chunks.size()};
        std::memcpy(chunk.data.data(), data + offset, n);
        chunks.push_back(chunk);
        offset += n;
    }
    return chunks;
}

std::vector<FrameChunk> FrameCodec::segment(const std::vector<uint8_t>& buffer,
                                            const CanIdentifier& identifier) {
    return segment(buffer.data(), buffer.size(), identifier);
}

std::vector<uint8_t> FrameCodec::reassemble(const std::vector<FrameChunk>& chunks) {
    std::vector<uint8_t> out;
    out.reserve(chunks.size() * MAX_PAYLOAD_SIZE);
    for (const auto& chunk : chunks) {
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    return out;
}

std::vector<uint8_t> FrameCodec::reassemble(const std::vector<std::vector<uint8_t>>& chunks) {
    std::vector<uint8_t> out;
    for (const auto& chunk : chunks) {
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    return out;
}

}  // namespace dxlcan::canbus
