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

#ifndef DXLCAN_CANBUS_CAN_IDENTIFIER_HPP_
#define DXLCAN_CANBUS_CAN_IDENTIFIER_HPP_

#include <linux/can.h>

#include <cstdint>
#include <string>

namespace dxlcan::canbus {

/**
 * @brief Validated CAN identifier, standard (11-bit) or extended (29-bit)
 *
 * Immutable value type. The only way to build one is validate(), so every
 * instance in the program is within range for its frame format.
 */
class CanIdentifier {
public:
    static constexpr uint32_t MAX_STANDARD_ID = CAN_SFF_MASK;  // 0x7FF
    static constexpr uint32_t MAX_EXTENDED_ID = CAN_EFF_MASK;  // 0x1FFFFFFF

    /**
     * @brief Check @p value against the range of the declared frame format
     * @param value Raw identifier, without any frame-format flag bits
     * @param extended true for a 29-bit identifier, false for 11-bit
     * @throws InvalidIdentifier if @p value does not fit
     */
    static CanIdentifier validate(uint32_t value, bool extended);

    uint32_t value() const { return value_; }
    bool is_extended() const { return extended_; }

    // Identifier in linux/can.h encoding, CAN_EFF_FLAG set for extended frames.
    canid_t to_can_id() const;

    // "0x060 (Standard)" / "0x00000060 (Extended)"
    std::string to_string() const;

    bool operator==(const CanIdentifier& other) const {
        return value_ == other.value_ && extended_ == other.extended_;
    }
    bool operator!=(const CanIdentifier& other) const { return !(*this == other); }

private:
    CanIdentifier(uint32_t value, bool extended) : value_(value), extended_(extended) {}

    uint32_t value_;
    bool extended_;
};

}  // namespace dxlcan::canbus

#endif  // DXLCAN_CANBUS_CAN_IDENTIFIER_HPP_
