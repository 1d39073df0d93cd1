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


#ifndef DXLCAN_SETUP_DIAGNOSIS_ARGS_HPP_
#define DXLCAN_SETUP_DIAGNOSIS_ARGS_HPP_

#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace dxlcan::setup {

// Parse a decimal or 0x-prefixed command line value into @p out.
// Signs, trailing text and anything wider than 32 bits are rejected.
inline bool parse_uint32(const std::string& text, uint32_t& out) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(text, &pos, 0);
        if (pos != text.size() || value > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
        out = static_cast<uint32_t>(value);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

}  // namespace dxlcan::setup

#endif  // DXLCAN_SETUP_DIAGNOSIS_ARGS_HPP_
