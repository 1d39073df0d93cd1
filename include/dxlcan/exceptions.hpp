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

#ifndef DXLCAN_EXCEPTIONS_HPP_
#define DXLCAN_EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>

namespace dxlcan {

// Base class for every error raised by the CAN adapter.
class DxlCanException : public std::runtime_error {
public:
    explicit DxlCanException(const std::string& message) : std::runtime_error(message) {}
};

// Serial device could not be opened, is held by another process, or vanished mid-session.
class PortUnavailable : public DxlCanException {
public:
    using DxlCanException::DxlCanException;
};

// Line rate rejected by the serial driver.
class UnsupportedBaudRate : public DxlCanException {
public:
    using DxlCanException::DxlCanException;
};

// CAN identifier out of range for its 11-bit or 29-bit frame format.
class InvalidIdentifier : public DxlCanException {
public:
    using DxlCanException::DxlCanException;
};

// Hardware write could not complete.
class WriteFailure : public DxlCanException {
public:
    using DxlCanException::DxlCanException;
};

// Operation attempted on a channel that is not open, or a blocked read was cut short by close().
class ChannelClosed : public DxlCanException {
public:
    using DxlCanException::DxlCanException;
};

}  // namespace dxlcan

#endif  // DXLCAN_EXCEPTIONS_HPP_
