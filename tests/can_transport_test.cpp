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

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <dxlcan/exceptions.hpp>
#include <dxlcan/transport/can_transport.hpp>
#include <limits>
#include <sstream>
#include <thread>

#include "mock_serial_channel.hpp"

using namespace dxlcan;
using dxlcan::testing::MockSerialChannel;
using dxlcan::transport::CanTransport;
using dxlcan::transport::ChannelConfig;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

class CanTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.port_name = "/dev/ttyMOCK0";
        config_.serial_baud_rate = 57600;
        config_.timeout_ms = 50;
        make_transport();
    }

    void make_transport() {
        auto channel = std::make_unique<MockSerialChannel>();
        mock_ = channel.get();
        transport_ = std::make_unique<CanTransport>(config_, std::move(channel), trace_);
    }

    ChannelConfig config_;
    std::ostringstream trace_;
    MockSerialChannel* mock_ = nullptr;
    std::unique_ptr<CanTransport> transport_;
};

TEST_F(CanTransportTest, RejectsNullChannel) {
    EXPECT_THROW(CanTransport transport(config_, nullptr), std::runtime_error);
}

TEST_F(CanTransportTest, OpenUsesConfiguredPortAndBaud) {
    EXPECT_FALSE(transport_->is_open());
    transport_->open();
    EXPECT_TRUE(transport_->is_open());
    EXPECT_EQ(mock_->port_name(), "/dev/ttyMOCK0");
    EXPECT_EQ(mock_->baud_rate(), 57600u);
    EXPECT_EQ(transport_->get_baud_rate(), 57600u);
    EXPECT_EQ(transport_->get_port_name(), "/dev/ttyMOCK0");
}

TEST_F(CanTransportTest, OpenFailureSurfacesPortUnavailable) {
    mock_->set_open_fails(true);
    EXPECT_THROW(transport_->open(), PortUnavailable);
    EXPECT_FALSE(transport_->is_open());
    EXPECT_THROW(transport_->write_bytes({1, 2, 3}), ChannelClosed);
}

TEST_F(CanTransportTest, OperationsBeforeOpenFailWithChannelClosed) {
    EXPECT_THROW(transport_->write_bytes({1}), ChannelClosed);
    EXPECT_THROW(transport_->read_bytes(1), ChannelClosed);
    EXPECT_THROW(transport_->set_baud_rate(115200), ChannelClosed);
}

TEST_F(CanTransportTest, WriteAccountingReportsAllBytes) {
    transport_->open();
    std::vector<uint8_t> buffer(20);
    for (size_t i = 0; i < buffer.size(); ++i) buffer[i] = static_cast<uint8_t>(i);

    EXPECT_EQ(transport_->write_bytes(buffer), 20u);
    EXPECT_EQ(mock_->written_stream(), buffer);
}

TEST_F(CanTransportTest, WriteEmitsOneChannelWritePerChunk) {
    transport_->open();
    std::vector<uint8_t> buffer(20, 0x11);
    transport_->write_bytes(buffer);

    auto writes = mock_->writes();
    ASSERT_EQ(writes.size(), 3u);
    EXPECT_EQ(writes[0].size(), 8u);
    EXPECT_EQ(writes[1].size(), 8u);
    EXPECT_EQ(writes[2].size(), 4u);
}

TEST_F(CanTransportTest, EmptyWriteSendsNothing) {
    transport_->open();
    EXPECT_EQ(transport_->write_bytes(std::vector<uint8_t>{}), 0u);
    EXPECT_TRUE(mock_->writes().empty());
}

TEST_F(CanTransportTest, WriteFailurePropagates) {
    transport_->open();
    mock_->set_write_fails(true);
    EXPECT_THROW(transport_->write_bytes({1, 2, 3}), WriteFailure);
}

TEST_F(CanTransportTest, ReadReturnsRequestedBytesInOrder) {
    transport_->open();
    mock_->feed({0xFF, 0xFF, 0x01, 0x02, 0x00, 0xFC});
    auto reply = transport_->read_bytes(6, 100);
    EXPECT_EQ(reply, (std::vector<uint8_t>{0xFF, 0xFF, 0x01, 0x02, 0x00, 0xFC}));
}

TEST_F(CanTransportTest, ReadAccumulatesAcrossSubReads) {
    transport_->open();
    std::thread feeder([this] {
        for (uint8_t i = 0; i < 4; ++i) {
            std::this_thread::sleep_for(milliseconds(5));
            mock_->feed({static_cast<uint8_t>(i * 2), static_cast<uint8_t>(i * 2 + 1)});
        }
    });
    auto reply = transport_->read_bytes(8, 500);
    feeder.join();

    EXPECT_EQ(reply, (std::vector<uint8_t>{0, 1, 2, 3, 4, 5, 6, 7}));
    EXPECT_GE(mock_->read_calls(), 2);
}

TEST_F(CanTransportTest, ReadDoesNotConsumeBeyondCount) {
    transport_->open();
    mock_->feed({1, 2, 3, 4, 5});
    EXPECT_EQ(transport_->read_bytes(3, 50), (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ(transport_->get_bytes_available(), 2u);
    EXPECT_EQ(transport_->read_bytes(2, 50), (std::vector<uint8_t>{4, 5}));
}

TEST_F(CanTransportTest, ShortReadIsBoundedByTimeout) {
    transport_->open();
    std::vector<uint8_t> ten = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
    mock_->feed(ten);

    auto start = steady_clock::now();
    auto reply = transport_->read_bytes(100, 50);
    auto elapsed = std::chrono::duration_cast<milliseconds>(steady_clock::now() - start);

    EXPECT_EQ(reply, ten);
    EXPECT_GE(elapsed.count(), 40);
    EXPECT_LT(elapsed.count(), 150);
}

TEST_F(CanTransportTest, ReadWithNothingReturnsEmpty) {
    transport_->open();
    auto start = steady_clock::now();
    EXPECT_TRUE(transport_->read_bytes(4, 20).empty());
    EXPECT_LT(std::chrono::duration_cast<milliseconds>(steady_clock::now() - start).count(), 120);
}

TEST_F(CanTransportTest, ZeroTimeoutReturnsWhatIsAlreadyBuffered) {
    transport_->open();
    mock_->feed({7, 8});
    EXPECT_EQ(transport_->read_bytes(4, 0), (std::vector<uint8_t>{7, 8}));
}

TEST_F(CanTransportTest, LargestTimeoutBlocksInsteadOfSpinning) {
    transport_->open();
    std::thread feeder([this] {
        std::this_thread::sleep_for(milliseconds(100));
        mock_->feed({0x5A});
    });
    auto reply = transport_->read_bytes(1, std::numeric_limits<uint32_t>::max());
    feeder.join();

    EXPECT_EQ(reply, (std::vector<uint8_t>{0x5A}));
    EXPECT_LE(mock_->read_calls(), 2);
}

TEST_F(CanTransportTest, DefaultReadTimeoutComesFromConfig) {
    transport_->open();
    auto start = steady_clock::now();
    EXPECT_TRUE(transport_->read_bytes(1).empty());
    auto elapsed = std::chrono::duration_cast<milliseconds>(steady_clock::now() - start);
    EXPECT_GE(elapsed.count(), 40);
    EXPECT_LT(elapsed.count(), 150);
}

TEST_F(CanTransportTest, ConcurrentWritesNeverInterleave) {
    transport_->open();
    mock_->set_write_delay(std::chrono::microseconds(200));

    constexpr int kRounds = 50;
    const std::vector<uint8_t> a(20, 0xAA);
    const std::vector<uint8_t> b(20, 0xBB);

    std::thread ta([&] {
        for (int i = 0; i < kRounds; ++i) transport_->write_bytes(a);
    });
    std::thread tb([&] {
        for (int i = 0; i < kRounds; ++i) transport_->write_bytes(b);
    });
    ta.join();
    tb.join();

    // Every write_bytes() is three consecutive channel writes of the same byte
    auto writes = mock_->writes();
    ASSERT_EQ(writes.size(), static_cast<size_t>(2 * kRounds * 3));
    for (size_t i = 0; i < writes.size(); i += 3) {
        uint8_t marker = writes[i].front();
        for (size_t j = i; j < i + 3; ++j) {
            for (uint8_t byte : writes[j]) {
                ASSERT_EQ(byte, marker) << "interleaved at write " << j;
            }
        }
    }
}

TEST_F(CanTransportTest, SetBaudRateDelegatesAndUpdatesTiming) {
    transport_->open();
    transport_->set_baud_rate(1000000);
    EXPECT_EQ(mock_->baud_rate(), 1000000u);
    EXPECT_EQ(transport_->get_baud_rate(), 1000000u);
    EXPECT_DOUBLE_EQ(transport_->get_tx_time_per_byte(), 0.01);
}

TEST_F(CanTransportTest, RejectedBaudRateLeavesRateUnchanged) {
    transport_->open();
    mock_->reject_baud_rate(12345);
    EXPECT_THROW(transport_->set_baud_rate(12345), UnsupportedBaudRate);
    EXPECT_EQ(transport_->get_baud_rate(), 57600u);
}

TEST_F(CanTransportTest, UnsupportedBaudRateAtOpen) {
    config_.serial_baud_rate = 12345;
    make_transport();
    mock_->reject_baud_rate(12345);
    EXPECT_THROW(transport_->open(), UnsupportedBaudRate);
    EXPECT_FALSE(transport_->is_open());
}

TEST_F(CanTransportTest, OperationsAfterCloseFailWithChannelClosed) {
    transport_->open();
    transport_->close();

    EXPECT_FALSE(transport_->is_open());
    EXPECT_THROW(transport_->write_bytes({1}), ChannelClosed);
    EXPECT_THROW(transport_->read_bytes(1, 10), ChannelClosed);
    EXPECT_THROW(transport_->set_baud_rate(115200), ChannelClosed);
    EXPECT_THROW(transport_->clear_port(), ChannelClosed);
    EXPECT_THROW(transport_->get_bytes_available(), ChannelClosed);
}

TEST_F(CanTransportTest, CloseTwiceIsHarmless) {
    transport_->open();
    transport_->close();
    EXPECT_NO_THROW(transport_->close());
    EXPECT_EQ(mock_->close_count(), 1);
}

TEST_F(CanTransportTest, CloseAbortsBlockedRead) {
    transport_->open();

    std::atomic<bool> got_closed{false};
    auto start = steady_clock::now();
    std::thread reader([&] {
        try {
            transport_->read_bytes(10, 5000);
        } catch (const ChannelClosed&) {
            got_closed = true;
        }
    });

    std::this_thread::sleep_for(milliseconds(50));
    transport_->close();
    reader.join();

    EXPECT_TRUE(got_closed.load());
    EXPECT_LT(std::chrono::duration_cast<milliseconds>(steady_clock::now() - start).count(), 2000);
}

TEST_F(CanTransportTest, ReopenAfterClose) {
    transport_->open();
    transport_->close();
    transport_->open();
    EXPECT_TRUE(transport_->is_open());
    EXPECT_EQ(mock_->open_count(), 2);
    EXPECT_EQ(transport_->write_bytes({1, 2}), 2u);
}

TEST_F(CanTransportTest, ClearPortDropsPendingInput) {
    transport_->open();
    mock_->feed({1, 2, 3});
    EXPECT_EQ(transport_->get_bytes_available(), 3u);
    transport_->clear_port();
    EXPECT_EQ(transport_->get_bytes_available(), 0u);
    EXPECT_EQ(mock_->clear_count(), 1);
}

TEST_F(CanTransportTest, PacketTimeoutFollowsLineRate) {
    transport_->open();
    transport_->set_baud_rate(1000000);

    // 0.01 ms/byte * 6 + 16 * 2 + 2 = 34.06 ms
    transport_->set_packet_timeout(6);
    EXPECT_FALSE(transport_->is_packet_timeout());
    std::this_thread::sleep_for(milliseconds(45));
    EXPECT_TRUE(transport_->is_packet_timeout());
}

TEST_F(CanTransportTest, PacketTimeoutMillis) {
    transport_->open();
    transport_->set_packet_timeout_millis(200);
    EXPECT_FALSE(transport_->is_packet_timeout());
    transport_->set_packet_timeout_millis(0);
    std::this_thread::sleep_for(milliseconds(2));
    EXPECT_TRUE(transport_->is_packet_timeout());
}

TEST_F(CanTransportTest, BusyFlagIsClearedOnOpen) {
    EXPECT_FALSE(transport_->is_using());
    transport_->set_using(true);
    EXPECT_TRUE(transport_->is_using());
    transport_->open();
    EXPECT_FALSE(transport_->is_using());
    transport_->set_using(true);
    EXPECT_TRUE(transport_->is_using());
    transport_->set_using(false);
    EXPECT_FALSE(transport_->is_using());
}

TEST_F(CanTransportTest, CurrentTimeIsMonotonic) {
    double first = CanTransport::get_current_time_ms();
    std::this_thread::sleep_for(milliseconds(5));
    EXPECT_GE(CanTransport::get_current_time_ms() - first, 4.0);
}

TEST_F(CanTransportTest, NoTraceOutputWithoutDebug) {
    transport_->open();
    transport_->write_bytes(std::vector<uint8_t>(20, 0x42));
    mock_->feed({1, 2, 3});
    transport_->read_bytes(3, 20);
    EXPECT_TRUE(trace_.str().empty());
}

TEST_F(CanTransportTest, DebugTracesEveryChunkBoundary) {
    config_.debug = true;
    make_transport();
    transport_->open();

    transport_->write_bytes(std::vector<uint8_t>(20, 0x42));
    mock_->feed(std::vector<uint8_t>(10, 0x24));
    auto reply = transport_->read_bytes(10, 100);
    EXPECT_EQ(reply.size(), 10u);

    const std::string out = trace_.str();
    EXPECT_NE(out.find("Port Configuration"), std::string::npos);
    EXPECT_NE(out.find("TX 20 bytes -> 3 CAN frame(s)"), std::string::npos);
    EXPECT_NE(out.find("TX id=0x060 (Standard) seq=2 len=4"), std::string::npos);
    EXPECT_NE(out.find("RX id=0x060 (Standard) seq=0 len=8"), std::string::npos);
    EXPECT_NE(out.find("RX id=0x060 (Standard) seq=1 len=2"), std::string::npos);

    // Tracing must not change what reaches the channel
    EXPECT_EQ(mock_->written_stream(), std::vector<uint8_t>(20, 0x42));
}

TEST_F(CanTransportTest, DebugReportsShortRead) {
    config_.debug = true;
    make_transport();
    transport_->open();
    mock_->feed({1, 2});
    transport_->read_bytes(5, 20);
    EXPECT_NE(trace_.str().find("RX timeout after 20 ms: 2 of 5 bytes"), std::string::npos);
}

TEST(MakeWaveshareTransportTest, BuildsConfigFromArguments) {
    auto transport = transport::make_waveshare_transport("/dev/ttyUSB7", 0x123, true, 500000, true);
    const auto& config = transport->get_config();
    EXPECT_EQ(config.port_name, "/dev/ttyUSB7");
    EXPECT_EQ(config.identifier.value(), 0x123u);
    EXPECT_TRUE(config.identifier.is_extended());
    EXPECT_EQ(config.can_baud_rate, 500000u);
    EXPECT_EQ(config.serial_baud_rate, transport::DEFAULT_SERIAL_BAUDRATE);
    EXPECT_TRUE(config.debug);
    EXPECT_FALSE(transport->is_open());
}

TEST(MakeWaveshareTransportTest, RejectsOutOfRangeIdentifier) {
    EXPECT_THROW(transport::make_waveshare_transport("/dev/ttyUSB7", 0x800, false),
                 InvalidIdentifier);
}

TEST(MakeWaveshareTransportTest, KeepsEveryConfigField) {
    ChannelConfig config;
    config.port_name = "/dev/ttyUSB3";
    config.serial_baud_rate = 115200;
    config.timeout_ms = 250;
    config.identifier = canbus::CanIdentifier::validate(0x7FF, false);
    auto transport = transport::make_waveshare_transport(config);

    EXPECT_EQ(transport->get_config().serial_baud_rate, 115200u);
    EXPECT_EQ(transport->get_config().timeout_ms, 250u);
    EXPECT_EQ(transport->get_config().identifier.value(), 0x7FFu);
    EXPECT_EQ(transport->get_baud_rate(), 115200u);
}
