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

#include <dxlcan/canbus/can_identifier.hpp>
#include <dxlcan/exceptions.hpp>
#include <iomanip>
#include <sstream>

namespace dxlcan::canbus {

CanIdentifier CanIdentifier::validate(uint32_t value, bool extended) {
    const uint32_t limit = extended ? MAX_EXTENDED_ID : MAX_STANDARD_ID;
    if (value > limit) {
        std::ostringstream oss;
        oss << "CAN identifier 0x" << std::uppercase << std::hex << value << " exceeds the "
            << (extended ? "29-bit extended" : "11-bit standard") << " range (max 0x" << limit
            << ")";
        throw InvalidIdentifier(oss.str());
    }
    return CanIdentifier(value, extended);
}

canid_t CanIdentifier::to_can_id() const {
    return extended_ ? (value_ | CAN_EFF_FLAG) : value_;
}

std::string CanIdentifier::to_string() const {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setfill('0') << std::setw(extended_ ? 8 : 3)
        << value_ << (extended_ ? " (Extended)" : " (Standard)");
    return oss.str();
}

}  // namespace dxlcan::canbus
