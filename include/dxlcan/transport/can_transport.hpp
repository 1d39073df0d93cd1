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

#ifndef DXLCAN_TRANSPORT_CAN_TRANSPORT_HPP_
#define DXLCAN_TRANSPORT_CAN_TRANSPORT_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "dxlcan/diagnostics/frame_tracer.hpp"
#include "dxlcan/serial/serial_channel.hpp"
#include "dxlcan/transport/channel_config.hpp"

namespace dxlcan::transport {

/**
 * @brief Byte-stream port carried over a pair of transparent serial-to-CAN bridges
 *
 * Looks like a plain serial port to the Dynamixel packet layer above it.
 * Writes are cut into classical CAN payloads (8 bytes) and handed to the serial
 * channel one chunk per write; the bridge forwards the raw bytes, so chunking
 * does not change what reaches the wire, only how it is traced. Reads collect
 * bytes until the requested count arrives or the timeout budget runs out.
 *
 * Every public call is serialized on one lock so concurrent writers never
 * interleave inside the byte stream. close() may be called from another thread
 * to abort a blocked read, which then fails with ChannelClosed.
 *
 * RAII: destructor closes the channel.
 */
class CanTransport {
public:
    // USB-serial latency timer assumed by the packet timeout, in ms.
    static constexpr double LATENCY_TIMER_MS = 16.0;

    /**
     * @param config Link settings, fixed for the life of this instance
     * @param channel Raw byte channel, owned exclusively by this transport
     * @param trace_out Destination of diagnostic lines when config.debug is set
     */
    CanTransport(const ChannelConfig& config, std::unique_ptr<serial::ISerialChannel> channel,
                 std::ostream& trace_out = std::cerr);
    ~CanTransport();

    // Delete copy/move, the channel belongs to exactly one transport
    CanTransport(const CanTransport&) = delete;
    CanTransport& operator=(const CanTransport&) = delete;
    CanTransport(CanTransport&&) = delete;
    CanTransport& operator=(CanTransport&&) = delete;

    /**
     * @brief Open the serial channel at config.serial_baud_rate and flush stale input
     * @throws PortUnavailable, UnsupportedBaudRate
     */
    void open();

    // Release the channel and wake any blocked reader. Idempotent.
    void close();

    bool is_open() const { return open_.load(); }

    /**
     * @brief Change the serial line rate
     * @throws UnsupportedBaudRate, ChannelClosed
     */
    void set_baud_rate(uint32_t baud_rate);
    uint32_t get_baud_rate() const;

    const std::string& get_port_name() const { return config_.port_name; }
    const ChannelConfig& get_config() const { return config_; }

    /**
     * @brief Send @p size bytes as consecutive CAN-sized chunks
     * @return Bytes accepted by the channel (0 for empty input, nothing is sent)
     * @throws WriteFailure, ChannelClosed
     */
    size_t write_bytes(const uint8_t* data, size_t size);
    size_t write_bytes(const std::vector<uint8_t>& buffer);

    /**
     * @brief Collect up to @p count bytes within @p timeout_ms
     *
     * A result shorter than @p count means the timeout elapsed; it is never
     * padded. The whole call, including every internal sub-read, stays within
     * @p timeout_ms.
     *
     * @throws ChannelClosed if closed before or during the read
     * @throws PortUnavailable if the device went away
     */
    std::vector<uint8_t> read_bytes(size_t count, uint32_t timeout_ms);

    // read_bytes() with config.timeout_ms.
    std::vector<uint8_t> read_bytes(size_t count);

    // Discard pending input.
    void clear_port();

    size_t get_bytes_available();

    // Packet timeout bookkeeping for the protocol layer above.
    void set_packet_timeout(size_t packet_length);
    void set_packet_timeout_millis(double msec);
    bool is_packet_timeout();
    double get_tx_time_per_byte() const;

    // Busy flag the Dynamixel packet layer raises around a transaction. Not used internally.
    bool is_using() const { return in_use_.load(); }
    void set_using(bool in_use) { in_use_.store(in_use); }

    // Monotonic clock in milliseconds.
    static double get_current_time_ms();

private:
    const ChannelConfig config_;
    std::unique_ptr<serial::ISerialChannel> channel_;
    diagnostics::FrameTracer tracer_;

    std::atomic<bool> open_{false};
    std::atomic<bool> in_use_{false};

    // lifecycle_mutex_ orders open/close against each other, io_mutex_ guards the stream.
    // Lock order: lifecycle_mutex_ then io_mutex_.
    std::mutex lifecycle_mutex_;
    mutable std::mutex io_mutex_;

    uint32_t baud_rate_;
    double tx_time_per_byte_ms_;
    double packet_start_time_ms_ = 0.0;
    double packet_timeout_ms_ = 0.0;

    // Running chunk indices, reset on open
    size_t tx_sequence_ = 0;
    size_t rx_sequence_ = 0;

    void ensure_open(const char* operation) const;
    void update_baud_rate(uint32_t baud_rate);
    double time_since_packet_start_ms();
};

// Transport bound to a termios serial port, defaults matching the bridge factory settings.
std::unique_ptr<CanTransport> make_waveshare_transport(const ChannelConfig& config);
std::unique_ptr<CanTransport> make_waveshare_transport(const std::string& port_name,
                                                       uint32_t can_id = DEFAULT_CAN_ID,
                                                       bool extended_id = false,
                                                       uint32_t can_baud_rate = DEFAULT_CAN_BAUDRATE,
                                                       bool debug = false);

}  // namespace dxlcan::transport

#endif  // DXLCAN_TRANSPORT_CAN_TRANSPORT_HPP_
