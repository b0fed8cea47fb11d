#include "robstride_driver/serial_transport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "rclcpp/rclcpp.hpp"

namespace robstride_driver
{

namespace serial_framing
{

std::vector<uint8_t> encode(const can_frame & frame)
{
  const uint8_t len = std::min<uint8_t>(frame.can_dlc, 8);
  const uint32_t addr = ((frame.can_id & CAN_EFF_MASK) << 3) | 0x4u;

  std::vector<uint8_t> packet;
  packet.reserve(kHeaderSize + len + kTrailerSize);
  packet.push_back('A');
  packet.push_back('T');
  packet.push_back(static_cast<uint8_t>(addr >> 24));
  packet.push_back(static_cast<uint8_t>(addr >> 16));
  packet.push_back(static_cast<uint8_t>(addr >> 8));
  packet.push_back(static_cast<uint8_t>(addr));
  packet.push_back(len);
  packet.insert(packet.end(), frame.data, frame.data + len);
  packet.push_back('\r');
  packet.push_back('\n');
  return packet;
}

DecodeStatus decode(const uint8_t * data, std::size_t size, can_frame & out, std::size_t & consumed)
{
  consumed = 0;
  if (size < 2) {
    return DecodeStatus::kTooShort;
  }
  if (data[0] != 'A' || data[1] != 'T') {
    consumed = 1;
    return DecodeStatus::kBadFraming;
  }
  if (size < kHeaderSize) {
    return DecodeStatus::kTooShort;
  }

  const uint8_t len = data[6];
  if (len > 8) {
    consumed = 1;
    return DecodeStatus::kBadFraming;
  }
  const std::size_t total = kHeaderSize + len + kTrailerSize;
  if (size < total) {
    return DecodeStatus::kTooShort;
  }
  if (data[total - 2] != '\r' || data[total - 1] != '\n') {
    consumed = 1;
    return DecodeStatus::kBadFraming;
  }

  const uint32_t addr = static_cast<uint32_t>(data[2]) << 24 |
    static_cast<uint32_t>(data[3]) << 16 | static_cast<uint32_t>(data[4]) << 8 |
    static_cast<uint32_t>(data[5]);

  std::memset(&out, 0, sizeof(out));
  out.can_id = ((addr >> 3) & CAN_EFF_MASK) | CAN_EFF_FLAG;
  out.can_dlc = len;
  std::memcpy(out.data, data + kHeaderSize, len);
  consumed = total;
  return DecodeStatus::kOk;
}

}  // namespace serial_framing

namespace
{

bool is_fatal_errno(int err)
{
  return err == EIO || err == ENXIO || err == ENODEV || err == EBADF;
}

}  // namespace

SerialTransport::SerialTransport(const std::string & device)
: device_(device), fd_(-1)
{
  fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    throw ConfigurationError(
      "failed to open serial port " + device + ": " + std::strerror(errno));
  }

  struct termios tty;
  if (::tcgetattr(fd_, &tty) != 0) {
    const int err = errno;
    ::close(fd_);
    fd_ = -1;
    throw ConfigurationError("failed to get termios settings of " + device + ": " +
            std::strerror(err));
  }

  ::cfsetispeed(&tty, B921600);
  ::cfsetospeed(&tty, B921600);

  // 8N1, receiver on, ignore modem control lines
  tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
  tty.c_cflag |= CS8 | CREAD | CLOCAL;
  // Raw input/output
  tty.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG);
  tty.c_iflag = 0;
  tty.c_oflag &= ~OPOST;
  // Reads never block; timeouts are handled with poll()
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
    const int err = errno;
    ::close(fd_);
    fd_ = -1;
    throw ConfigurationError("failed to set termios attributes of " + device + ": " +
            std::strerror(err));
  }
  ::tcflush(fd_, TCIOFLUSH);

  RCLCPP_INFO(rclcpp::get_logger("serial"), "Opened %s at 921600 baud", device_.c_str());
}

SerialTransport::~SerialTransport()
{
  close();
}

void SerialTransport::send(const can_frame & frame)
{
  if (fd_ < 0) {
    throw TransportLostError(device_ + " is closed");
  }

  const std::vector<uint8_t> packet = serial_framing::encode(frame);
  std::size_t offset = 0;
  while (offset < packet.size()) {
    const ssize_t written = ::write(fd_, packet.data() + offset, packet.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN) {
        struct pollfd pfd = {fd_, POLLOUT, 0};
        if (::poll(&pfd, 1, 10) <= 0) {
          throw TimeoutError("write on " + device_);
        }
        continue;
      }
      throw_errno("write", errno);
    }
    offset += static_cast<std::size_t>(written);
  }
}

bool SerialTransport::recv(can_frame & frame, std::chrono::microseconds timeout)
{
  if (fd_ < 0) {
    throw TransportLostError(device_ + " is closed");
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (pop_buffered(frame)) {
      return true;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);

    struct pollfd pfd = {fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("poll", errno);
    }
    if (ready == 0) {
      continue;
    }
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
      throw TransportLostError(device_ + " hung up");
    }

    uint8_t chunk[256];
    const ssize_t received = ::read(fd_, chunk, sizeof(chunk));
    if (received < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      throw_errno("read", errno);
    }
    if (received == 0) {
      // Readable but empty: the USB device went away.
      throw TransportLostError(device_ + " returned end of file");
    }
    rx_buffer_.insert(rx_buffer_.end(), chunk, chunk + received);
  }
}

bool SerialTransport::pop_buffered(can_frame & frame)
{
  std::size_t dropped = 0;
  while (!rx_buffer_.empty()) {
    std::size_t consumed = 0;
    const DecodeStatus status =
      serial_framing::decode(rx_buffer_.data(), rx_buffer_.size(), frame, consumed);
    if (status == DecodeStatus::kBadFraming) {
      rx_buffer_.erase(rx_buffer_.begin(), rx_buffer_.begin() + consumed);
      dropped += consumed;
      continue;
    }
    if (dropped > 0) {
      RCLCPP_DEBUG(
        rclcpp::get_logger("serial"), "Dropped %zu bytes while resynchronizing on %s",
        dropped, device_.c_str());
    }
    if (status == DecodeStatus::kOk) {
      rx_buffer_.erase(rx_buffer_.begin(), rx_buffer_.begin() + consumed);
      return true;
    }
    return false;
  }
  return false;
}

void SerialTransport::close()
{
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
    rx_buffer_.clear();
    RCLCPP_INFO(rclcpp::get_logger("serial"), "Closed %s", device_.c_str());
  }
}

void SerialTransport::throw_errno(const char * operation, int err) const
{
  const std::string what = std::string(operation) + " on " + device_ + ": " + std::strerror(err);
  if (is_fatal_errno(err)) {
    throw TransportLostError(what);
  }
  throw IoError(what);
}

}  // namespace robstride_driver
