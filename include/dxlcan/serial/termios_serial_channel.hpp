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

#ifndef DXLCAN_SERIAL_TERMIOS_SERIAL_CHANNEL_HPP_
#define DXLCAN_SERIAL_TERMIOS_SERIAL_CHANNEL_HPP_

#include <termios.h>

#include <optional>
#include <string>

#include "dxlcan/serial/serial_channel.hpp"

namespace dxlcan::serial {

/**
 * @brief ISerialChannel backed by a POSIX tty (USB-serial adapter in front of the bridge)
 *
 * Raw 8N1, no flow control, non-blocking descriptor with ppoll-bounded reads.
 * The device is flock()ed for the lifetime of the handle so a second process
 * (or a second channel in this one) cannot interleave bytes on the same port.
 *
 * RAII: destructor closes the device.
 */
class TermiosSerialChannel : public ISerialChannel {
public:
    // Upper bound on waiting for the driver to drain its TX queue during one write.
    static constexpr int WRITE_TIMEOUT_MS = 1000;

    TermiosSerialChannel() = default;
    ~TermiosSerialChannel() override;

    // Delete copy/move to prevent descriptor confusion
    TermiosSerialChannel(const TermiosSerialChannel&) = delete;
    TermiosSerialChannel& operator=(const TermiosSerialChannel&) = delete;
    TermiosSerialChannel(TermiosSerialChannel&&) = delete;
    TermiosSerialChannel& operator=(TermiosSerialChannel&&) = delete;

    void open(const std::string& port_name, uint32_t baud_rate) override;
    void set_baud_rate(uint32_t baud_rate) override;
    size_t read_raw(uint8_t* buffer, size_t max_bytes, int timeout_ms) override;
    size_t write_raw(const uint8_t* data, size_t size) override;
    void clear_input() override;
    size_t bytes_available() override;
    void interrupt() override;
    void close() override;
    bool is_open() const override { return fd_ >= 0; }

    // termios speed constant for a numeric rate, nullopt if the table has none.
    static std::optional<speed_t> baud_to_speed(uint32_t baud_rate);

private:
    int fd_ = -1;
    int wake_fd_ = -1;
    std::string port_name_;

    void configure_port(speed_t speed);
    bool wait_writable(int timeout_ms);
};

}  // namespace dxlcan::serial

#endif  // DXLCAN_SERIAL_TERMIOS_SERIAL_CHANNEL_HPP_
