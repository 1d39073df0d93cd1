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
#include <chrono>
#include <dxlcan/canbus/frame_codec.hpp>
#include <dxlcan/exceptions.hpp>
#include <dxlcan/serial/termios_serial_channel.hpp>
#include <dxlcan/transport/can_transport.hpp>
#include <limits>
#include <stdexcept>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace dxlcan::transport {

using canbus::FrameCodec;
using diagnostics::Direction;

CanTransport::CanTransport(const ChannelConfig& config,
                           std::unique_ptr<serial::ISerialChannel> channel, std::ostream& trace_out)
    : config_(config), channel_(std::move(channel)), tracer_(trace_out) {
    if (!channel_) {
        throw std::runtime_error("Invalid serial channel provided to CanTransport");
    }
    update_baud_rate(config_.serial_baud_rate);
}

CanTransport::~CanTransport() { close(); }

void CanTransport::open() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::lock_guard<std::mutex> lock(io_mutex_);

    // Reopening starts from a clean channel
    if (open_.exchange(false)) {
        channel_->close();
    }

    channel_->open(config_.port_name, config_.serial_baud_rate);
    update_baud_rate(config_.serial_baud_rate);
    tx_sequence_ = 0;
    rx_sequence_ = 0;
    packet_timeout_ms_ = 0.0;
    in_use_.store(false);
    open_.store(true);

    if (config_.debug) {
        tracer_.trace_port_configuration(config_.port_name, baud_rate_, config_.identifier,
                                         config_.can_baud_rate, config_.timeout_ms);
    }
}

void CanTransport::close() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!open_.exchange(false)) {
        return;
    }

    // Wake a reader parked in read_raw() so it releases io_mutex_
    channel_->interrupt();

    std::lock_guard<std::mutex> lock(io_mutex_);
    channel_->close();
}

void CanTransport::ensure_open(const char* operation) const {
    if (!open_.load()) {
        throw ChannelClosed(std::string("Cannot ") + operation + " on " + config_.port_name +
                            ": channel is closed");
    }
}

void CanTransport::update_baud_rate(uint32_t baud_rate) {
    baud_rate_ = baud_rate;
    tx_time_per_byte_ms_ = baud_rate > 0 ? (1000.0 / baud_rate) * 10.0 : 0.0;
}

void CanTransport::set_baud_rate(uint32_t baud_rate) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    ensure_open("set baud rate");
    channel_->set_baud_rate(baud_rate);
    update_baud_rate(baud_rate);
}

uint32_t CanTransport::get_baud_rate() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return baud_rate_;
}

size_t CanTransport::write_bytes(const uint8_t* data, size_t size) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    ensure_open("write");

    if (!data || size == 0) {
        return 0;
    }

    auto chunks = FrameCodec::segment(data, size, config_.identifier, tx_sequence_);
    if (config_.debug) {
        tracer_.trace_segmentation(Direction::TX, size, chunks.size());
    }

    size_t written = 0;
    for (const auto& chunk : chunks) {
        if (config_.debug) {
            tracer_.trace_chunk(Direction::TX, chunk);
        }
        written += channel_->write_raw(chunk.data.data(), chunk.len);
    }

    tx_sequence_ += chunks.size();
    return written;
}

size_t CanTransport::write_bytes(const std::vector<uint8_t>& buffer) {
    return write_bytes(buffer.data(), buffer.size());
}

std::vector<uint8_t> CanTransport::read_bytes(size_t count, uint32_t timeout_ms) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    ensure_open("read");

    std::vector<uint8_t> buffer(count);
    if (count == 0) {
        return buffer;
    }

    const auto deadline = steady_clock::now() + milliseconds(timeout_ms);
    size_t received = 0;

    while (received < count) {
        auto remaining_ms = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
        remaining_ms = std::max<decltype(remaining_ms)>(remaining_ms, 0);
        // Budgets past INT_MAX are served in INT_MAX slices
        const int slice_ms = static_cast<int>(std::min<decltype(remaining_ms)>(
            remaining_ms, std::numeric_limits<int>::max()));

        // close() from another thread must win over a fresh sub-read
        ensure_open("read");

        size_t n = channel_->read_raw(buffer.data() + received, count - received, slice_ms);
        if (n > 0 && config_.debug) {
            auto chunks =
                FrameCodec::segment(buffer.data() + received, n, config_.identifier, rx_sequence_);
            tracer_.trace_chunks(Direction::RX, chunks);
            rx_sequence_ += chunks.size();
        }
        received += n;

        // The last sub-read ran with a zero budget: nothing left to wait for
        if (remaining_ms == 0) {
            break;
        }
    }

    buffer.resize(received);
    if (received < count && config_.debug) {
        tracer_.trace_short_read(count, received, timeout_ms);
    }
    return buffer;
}

std::vector<uint8_t> CanTransport::read_bytes(size_t count) {
    return read_bytes(count, config_.timeout_ms);
}

void CanTransport::clear_port() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    ensure_open("clear port");
    channel_->clear_input();
}

size_t CanTransport::get_bytes_available() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    ensure_open("query available bytes");
    return channel_->bytes_available();
}

double CanTransport::get_current_time_ms() {
    return duration_cast<std::chrono::duration<double, std::milli>>(
               steady_clock::now().time_since_epoch())
        .count();
}

double CanTransport::get_tx_time_per_byte() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return tx_time_per_byte_ms_;
}

void CanTransport::set_packet_timeout(size_t packet_length) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    packet_start_time_ms_ = get_current_time_ms();
    packet_timeout_ms_ =
        (tx_time_per_byte_ms_ * packet_length) + (LATENCY_TIMER_MS * 2.0) + 2.0;
}

void CanTransport::set_packet_timeout_millis(double msec) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    packet_start_time_ms_ = get_current_time_ms();
    packet_timeout_ms_ = msec;
}

double CanTransport::time_since_packet_start_ms() {
    double elapsed = get_current_time_ms() - packet_start_time_ms_;
    if (elapsed < 0.0) {
        packet_start_time_ms_ = get_current_time_ms();
        elapsed = 0.0;
    }
    return elapsed;
}

bool CanTransport::is_packet_timeout() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (time_since_packet_start_ms() > packet_timeout_ms_) {
        packet_timeout_ms_ = 0.0;
        return true;
    }
    return false;
}

std::unique_ptr<CanTransport> make_waveshare_transport(const ChannelConfig& config) {
    return std::make_unique<CanTransport>(config,
                                          std::make_unique<serial::TermiosSerialChannel>());
}

std::unique_ptr<CanTransport> make_waveshare_transport(const std::string& port_name,
                                                       uint32_t can_id, bool extended_id,
                                                       uint32_t can_baud_rate, bool debug) {
    ChannelConfig config;
    config.port_name = port_name;
    config.identifier = canbus::CanIdentifier::validate(can_id, extended_id);
    config.can_baud_rate = can_baud_rate;
    config.debug = debug;
    return make_waveshare_transport(config);
}

}  // namespace dxlcan::transport
