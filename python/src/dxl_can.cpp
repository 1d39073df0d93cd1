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

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/unique_ptr.h>
#include <nanobind/stl/vector.h>

#include <dxlcan/canbus/can_identifier.hpp>
#include <dxlcan/canbus/frame_codec.hpp>
#include <dxlcan/diagnostics/frame_tracer.hpp>
#include <dxlcan/exceptions.hpp>
#include <dxlcan/transport/can_transport.hpp>
#include <dxlcan/transport/channel_config.hpp>
#include <iostream>

using namespace dxlcan;
using namespace dxlcan::canbus;
using namespace dxlcan::transport;

namespace nb = nanobind;

NB_MODULE(dxl_can, m) {
    m.doc() = "Dynamixel byte channel over transparent serial-to-CAN bridges";

    // ============================================================================
    // EXCEPTIONS
    // ============================================================================

    auto base = nb::exception<DxlCanException>(m, "DxlCanException");
    nb::exception<PortUnavailable>(m, "PortUnavailable", base);
    nb::exception<UnsupportedBaudRate>(m, "UnsupportedBaudRate", base);
    nb::exception<InvalidIdentifier>(m, "InvalidIdentifier", base);
    nb::exception<WriteFailure>(m, "WriteFailure", base);
    nb::exception<ChannelClosed>(m, "ChannelClosed", base);

    // ============================================================================
    // CANBUS NAMESPACE
    // ============================================================================

    nb::class_<CanIdentifier>(m, "CanIdentifier")
        .def_static("validate", &CanIdentifier::validate, nb::arg("value"),
                    nb::arg("extended") = false)
        .def_prop_ro("value", &CanIdentifier::value)
        .def_prop_ro("extended", &CanIdentifier::is_extended)
        .def("to_can_id", &CanIdentifier::to_can_id)
        .def("__repr__", &CanIdentifier::to_string)
        .def("__eq__", &CanIdentifier::operator==);

    nb::class_<FrameCodec>(m, "FrameCodec")
        .def_static(
            "segment",
            [](const std::vector<uint8_t>& buffer, const CanIdentifier& identifier) {
                std::vector<std::vector<uint8_t>> payloads;
                for (const auto& chunk : FrameCodec::segment(buffer, identifier)) {
                    payloads.emplace_back(chunk.begin(), chunk.end());
                }
                return payloads;
            },
            nb::arg("buffer"), nb::arg("identifier"))
        .def_static(
            "reassemble",
            [](const std::vector<std::vector<uint8_t>>& chunks) {
                return FrameCodec::reassemble(chunks);
            },
            nb::arg("chunks"));

    // ============================================================================
    // TRANSPORT NAMESPACE
    // ============================================================================

    nb::class_<ChannelConfig>(m, "ChannelConfig")
        .def(nb::init<>())
        .def_rw("port_name", &ChannelConfig::port_name)
        .def_rw("serial_baud_rate", &ChannelConfig::serial_baud_rate)
        .def_rw("can_baud_rate", &ChannelConfig::can_baud_rate)
        .def_rw("identifier", &ChannelConfig::identifier)
        .def_rw("timeout_ms", &ChannelConfig::timeout_ms)
        .def_rw("debug", &ChannelConfig::debug);

    // Method names in camelCase mirror the Dynamixel SDK PortHandler so the packet
    // handler can use this object unchanged.
    nb::class_<CanTransport>(m, "CanTransport")
        .def("open", &CanTransport::open)
        .def("close", &CanTransport::close, nb::call_guard<nb::gil_scoped_release>())
        .def("is_open", &CanTransport::is_open)
        .def("set_baud_rate", &CanTransport::set_baud_rate, nb::arg("baud_rate"))
        .def("get_baud_rate", &CanTransport::get_baud_rate)
        .def("get_port_name", &CanTransport::get_port_name)
        .def(
            "write_bytes",
            [](CanTransport& self, const std::vector<uint8_t>& buffer) {
                nb::gil_scoped_release release;
                return self.write_bytes(buffer);
            },
            nb::arg("buffer"))
        .def(
            "read_bytes",
            [](CanTransport& self, size_t count, uint32_t timeout_ms) {
                nb::gil_scoped_release release;
                return self.read_bytes(count, timeout_ms);
            },
            nb::arg("count"), nb::arg("timeout_ms"))
        .def("clear_port", &CanTransport::clear_port)
        .def("get_bytes_available", &CanTransport::get_bytes_available)
        .def(
            "print_bridge_setup_instructions",
            [](const CanTransport& self) {
                const auto& config = self.get_config();
                diagnostics::print_bridge_setup_instructions(
                    config.identifier, config.can_baud_rate, config.serial_baud_rate, std::cout);
            })
        // Dynamixel SDK PortHandler surface
        .def("openPort",
             [](CanTransport& self) {
                 try {
                     self.open();
                     return true;
                 } catch (const DxlCanException& e) {
                     std::cerr << "ERROR: " << e.what() << std::endl;
                     return false;
                 }
             })
        .def("closePort", &CanTransport::close, nb::call_guard<nb::gil_scoped_release>())
        .def("clearPort", &CanTransport::clear_port)
        .def("getPortName", &CanTransport::get_port_name)
        .def("setBaudRate",
             [](CanTransport& self, uint32_t baud_rate) {
                 try {
                     self.set_baud_rate(baud_rate);
                     return true;
                 } catch (const DxlCanException& e) {
                     std::cerr << "ERROR: " << e.what() << std::endl;
                     return false;
                 }
             },
             nb::arg("baudrate"))
        .def("getBaudRate", &CanTransport::get_baud_rate)
        .def("getBytesAvailable", &CanTransport::get_bytes_available)
        .def(
            "readPort",
            [](CanTransport& self, size_t length) {
                nb::gil_scoped_release release;
                // SDK callers poll with their own packet timeout, so never block here
                return self.read_bytes(length, 0);
            },
            nb::arg("length"))
        .def(
            "writePort",
            [](CanTransport& self, const std::vector<uint8_t>& packet) {
                nb::gil_scoped_release release;
                return self.write_bytes(packet);
            },
            nb::arg("packet"))
        .def("setPacketTimeout", &CanTransport::set_packet_timeout, nb::arg("packet_length"))
        .def("setPacketTimeoutMillis", &CanTransport::set_packet_timeout_millis, nb::arg("msec"))
        .def("isPacketTimeout", &CanTransport::is_packet_timeout)
        .def_static("getCurrentTime", &CanTransport::get_current_time_ms)
        .def_prop_rw("is_using", &CanTransport::is_using, &CanTransport::set_using)
        .def_prop_ro("tx_time_per_byte", &CanTransport::get_tx_time_per_byte);

    m.def(
        "make_waveshare_transport",
        [](const ChannelConfig& config) { return make_waveshare_transport(config); },
        nb::arg("config"));
    m.def(
        "make_waveshare_transport",
        [](const std::string& port_name, uint32_t can_id, bool extended_id,
           uint32_t can_baud_rate, bool debug) {
            return make_waveshare_transport(port_name, can_id, extended_id, can_baud_rate, debug);
        },
        nb::arg("port_name"), nb::arg("can_id") = DEFAULT_CAN_ID, nb::arg("extended_id") = false,
        nb::arg("can_baud_rate") = DEFAULT_CAN_BAUDRATE, nb::arg("debug") = false);
}
