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

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <sys/eventfd.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <iostream>

#include <dxlcan/exceptions.hpp>
#include <dxlcan/serial/termios_serial_channel.hpp>

namespace dxlcan::serial {

namespace {

std::string errno_suffix(int err) {
    return " (errno: " + std::to_string(err) + ", " + strerror(err) + ")";
}

timespec to_timespec(int timeout_ms) {
    if (timeout_ms < 0) timeout_ms = 0;
    timespec ts;
    ts.tv_sec = timeout_ms / 1000;
    ts.tv_nsec = static_cast<long>(timeout_ms % 1000) * 1000000L;
    return ts;
}

}  // namespace

TermiosSerialChannel::~TermiosSerialChannel() { close(); }

std::optional<speed_t> TermiosSerialChannel::baud_to_speed(uint32_t baud_rate) {
    switch (baud_rate) {
        case 9600:
            return B9600;
        case 19200:
            return B19200;
        case 38400:
            return B38400;
        case 57600:
            return B57600;
        case 115200:
            return B115200;
        case 230400:
            return B230400;
        case 460800:
            return B460800;
        case 500000:
            return B500000;
        case 576000:
            return B576000;
        case 921600:
            return B921600;
        case 1000000:
            return B1000000;
        case 1152000:
            return B1152000;
        case 1500000:
            return B1500000;
        case 2000000:
            return B2000000;
        case 2500000:
            return B2500000;
        case 3000000:
            return B3000000;
        case 3500000:
            return B3500000;
        case 4000000:
            return B4000000;
        default:
            return std::nullopt;
    }
}

void TermiosSerialChannel::open(const std::string& port_name, uint32_t baud_rate) {
    // Close existing device if open
    if (fd_ >= 0) {
        close();
    }

    auto speed = baud_to_speed(baud_rate);
    if (!speed) {
        throw UnsupportedBaudRate("Baud rate " + std::to_string(baud_rate) +
                                  " is not supported by the serial driver");
    }

    int fd = ::open(port_name.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        throw PortUnavailable("Failed to open serial port " + port_name + errno_suffix(err));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            throw PortUnavailable("Serial port " + port_name + " is already in use");
        }
        throw PortUnavailable("Failed to lock serial port " + port_name + errno_suffix(err));
    }

    int wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd < 0) {
        int err = errno;
        ::close(fd);
        throw PortUnavailable("Failed to create wake-up descriptor for " + port_name +
                              errno_suffix(err));
    }

    fd_ = fd;
    wake_fd_ = wake_fd;
    port_name_ = port_name;

    try {
        configure_port(*speed);
    } catch (...) {
        close();
        throw;
    }

    // Drop whatever the bridge sent before we were listening
    tcflush(fd_, TCIOFLUSH);
}

void TermiosSerialChannel::configure_port(speed_t speed) {
    struct termios tio;
    memset(&tio, 0, sizeof(tio));
    if (tcgetattr(fd_, &tio) != 0) {
        int err = errno;
        throw PortUnavailable("Failed to read attributes of " + port_name_ + errno_suffix(err));
    }

    cfmakeraw(&tio);

    // 8 data bits, 1 stop bit, no parity, no flow control (bridge default)
    tio.c_cflag &= ~(CSIZE | PARENB | CSTOPB | CRTSCTS);
    tio.c_cflag |= CS8 | CLOCAL | CREAD;
    tio.c_iflag &= ~(IXON | IXOFF | IXANY);

    // Timing is handled by ppoll, read() returns immediately
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    if (cfsetispeed(&tio, speed) != 0 || cfsetospeed(&tio, speed) != 0) {
        int err = errno;
        throw UnsupportedBaudRate("Driver rejected baud rate on " + port_name_ + errno_suffix(err));
    }

    if (tcsetattr(fd_, TCSANOW, &tio) != 0) {
        int err = errno;
        throw UnsupportedBaudRate("Failed to apply line settings to " + port_name_ +
                                  errno_suffix(err));
    }
}

void TermiosSerialChannel::set_baud_rate(uint32_t baud_rate) {
    if (fd_ < 0) {
        throw ChannelClosed("Serial port is not open");
    }

    auto speed = baud_to_speed(baud_rate);
    if (!speed) {
        throw UnsupportedBaudRate("Baud rate " + std::to_string(baud_rate) +
                                  " is not supported by the serial driver");
    }
    configure_port(*speed);
}

size_t TermiosSerialChannel::read_raw(uint8_t* buffer, size_t max_bytes, int timeout_ms) {
    if (fd_ < 0) {
        throw ChannelClosed("Serial port is not open");
    }
    if (!buffer || max_bytes == 0) {
        return 0;
    }

    struct pollfd pfds[2];
    pfds[0].fd = fd_;
    pfds[0].events = POLLIN;
    pfds[0].revents = 0;
    pfds[1].fd = wake_fd_;
    pfds[1].events = POLLIN;
    pfds[1].revents = 0;

    struct timespec timeout = to_timespec(timeout_ms);
    int ret = ppoll(pfds, 2, &timeout, nullptr);
    if (ret < 0) {
        if (errno == EINTR) {
            return 0;  // Caller re-checks its deadline
        }
        int err = errno;
        throw PortUnavailable("Polling " + port_name_ + " failed" + errno_suffix(err));
    }
    if (ret == 0) {
        return 0;  // Timeout
    }

    if (pfds[1].revents & POLLIN) {
        throw ChannelClosed("Read on " + port_name_ + " interrupted by close");
    }

    if (!(pfds[0].revents & POLLIN) && (pfds[0].revents & (POLLERR | POLLHUP | POLLNVAL))) {
        throw PortUnavailable("Serial port " + port_name_ + " closed unexpectedly");
    }

    ssize_t n = ::read(fd_, buffer, max_bytes);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return 0;
        }
        int err = errno;
        throw PortUnavailable("Read from " + port_name_ + " failed" + errno_suffix(err));
    }
    return static_cast<size_t>(n);
}

bool TermiosSerialChannel::wait_writable(int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLOUT;
    pfd.revents = 0;

    struct timespec timeout = to_timespec(timeout_ms);
    int ret = ppoll(&pfd, 1, &timeout, nullptr);
    if (ret < 0 && errno == EINTR) {
        return true;  // Retry the write
    }
    return ret > 0 && (pfd.revents & POLLOUT);
}

size_t TermiosSerialChannel::write_raw(const uint8_t* data, size_t size) {
    if (fd_ < 0) {
        throw ChannelClosed("Serial port is not open");
    }
    if (!data || size == 0) {
        return 0;
    }

    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd_, data + written, size - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }

        if (n < 0 && errno == EINTR) {
            continue;
        }

        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // TX queue full - wait for the driver to make room
            if (!wait_writable(WRITE_TIMEOUT_MS)) {
                throw WriteFailure("Timed out writing to " + port_name_ + " after " +
                                   std::to_string(written) + " of " + std::to_string(size) +
                                   " bytes");
            }
            continue;
        }

        int err = (n < 0) ? errno : EIO;
        throw WriteFailure("Write to " + port_name_ + " failed after " + std::to_string(written) +
                           " of " + std::to_string(size) + " bytes" + errno_suffix(err));
    }

    return written;
}

void TermiosSerialChannel::clear_input() {
    if (fd_ < 0) {
        throw ChannelClosed("Serial port is not open");
    }
    tcflush(fd_, TCIFLUSH);
}

size_t TermiosSerialChannel::bytes_available() {
    if (fd_ < 0) {
        throw ChannelClosed("Serial port is not open");
    }
    int pending = 0;
    if (ioctl(fd_, FIONREAD, &pending) < 0) {
        int err = errno;
        throw PortUnavailable("FIONREAD on " + port_name_ + " failed" + errno_suffix(err));
    }
    return pending > 0 ? static_cast<size_t>(pending) : 0;
}

void TermiosSerialChannel::interrupt() {
    if (wake_fd_ < 0) {
        return;
    }
    uint64_t one = 1;
    // EAGAIN means the counter is already signalled
    if (::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        std::cerr << "ERROR: Failed to wake reader on " << port_name_ << ": "
                  << strerror(errno) << std::endl;
    }
}

void TermiosSerialChannel::close() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
        wake_fd_ = -1;
    }
}

}  // namespace dxlcan::serial
