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

#ifndef DXLCAN_SERIAL_SERIAL_CHANNEL_HPP_
#define DXLCAN_SERIAL_SERIAL_CHANNEL_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace dxlcan::serial {

/**
 * @brief Abstract interface for the raw byte channel under the CAN transport
 *
 * Allows the real termios port to be swapped for a scripted channel in tests
 * while the CAN transport keeps the same code path.
 */
class ISerialChannel {
public:
    virtual ~ISerialChannel() = default;

    /**
     * @brief Open the device and configure it for raw 8N1 I/O
     * @param port_name Device path, e.g. "/dev/ttyUSB0"
     * @param baud_rate Initial line rate
     * @throws PortUnavailable if the device cannot be opened or is in use
     * @throws UnsupportedBaudRate if the driver rejects @p baud_rate
     */
    virtual void open(const std::string& port_name, uint32_t baud_rate) = 0;

    /**
     * @brief Change the line rate of an open channel
     * @throws UnsupportedBaudRate if the driver rejects @p baud_rate
     */
    virtual void set_baud_rate(uint32_t baud_rate) = 0;

    /**
     * @brief Read whatever arrives within the timeout
     * @param buffer Destination, at least @p max_bytes long
     * @param max_bytes Upper bound on bytes returned
     * @param timeout_ms Time to wait for the first byte
     * @return Number of bytes stored, 0 when the timeout elapsed with nothing received
     * @throws ChannelClosed if interrupted by close()
     * @throws PortUnavailable if the device went away
     */
    virtual size_t read_raw(uint8_t* buffer, size_t max_bytes, int timeout_ms) = 0;

    /**
     * @brief Write all of @p size bytes, retrying partial writes
     * @return @p size on success
     * @throws WriteFailure on a hard I/O error
     */
    virtual size_t write_raw(const uint8_t* data, size_t size) = 0;

    // Discard anything pending in the input queue.
    virtual void clear_input() = 0;

    // Bytes waiting in the input queue.
    virtual size_t bytes_available() = 0;

    /**
     * @brief Wake a reader blocked in read_raw() so it fails with ChannelClosed
     *
     * Safe from any thread. Terminal for the current session: every later
     * read_raw() also fails until close(), and the next open() starts clean.
     */
    virtual void interrupt() = 0;

    // Release the device. Idempotent.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

}  // namespace dxlcan::serial

#endif  // DXLCAN_SERIAL_SERIAL_CHANNEL_HPP_
