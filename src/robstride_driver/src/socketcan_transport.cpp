#include "robstride_driver/socketcan_transport.hpp"

#include <linux/can/raw.h>
#include <net/if.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "rclcpp/rclcpp.hpp"
#include "robstride_driver/errors.hpp"

namespace robstride_driver
{

namespace
{

bool is_fatal_errno(int err)
{
  return err == ENODEV || err == ENETDOWN || err == ENXIO || err == EBADF || err == ENOTCONN;
}

}  // namespace

SocketCanTransport::SocketCanTransport(const std::string & interface_name)
: interface_name_(interface_name), socket_fd_(-1)
{
  if (interface_name.empty() || interface_name.size() >= IFNAMSIZ) {
    throw ConfigurationError("invalid CAN interface name '" + interface_name + "'");
  }

  socket_fd_ = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
  if (socket_fd_ < 0) {
    throw ConfigurationError(
      "failed to create CAN socket: " + std::string(std::strerror(errno)));
  }

  struct ifreq ifr;
  std::memset(&ifr, 0, sizeof(ifr));
  std::strncpy(ifr.ifr_name, interface_name.c_str(), IFNAMSIZ - 1);
  if (::ioctl(socket_fd_, SIOCGIFINDEX, &ifr) < 0) {
    const int err = errno;
    ::close(socket_fd_);
    socket_fd_ = -1;
    throw ConfigurationError(
      "failed to get index of " + interface_name + ": " + std::strerror(err));
  }

  struct sockaddr_can addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.can_family = AF_CAN;
  addr.can_ifindex = ifr.ifr_ifindex;
  if (::bind(socket_fd_, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0) {
    const int err = errno;
    ::close(socket_fd_);
    socket_fd_ = -1;
    throw ConfigurationError("failed to bind CAN socket to " + interface_name + ": " +
            std::strerror(err));
  }

  RCLCPP_INFO(rclcpp::get_logger("socketcan"), "Opened %s", interface_name_.c_str());
}

SocketCanTransport::~SocketCanTransport()
{
  close();
}

void SocketCanTransport::send(const can_frame & frame)
{
  if (socket_fd_ < 0) {
    throw TransportLostError(interface_name_ + " is closed");
  }
  const ssize_t written = ::write(socket_fd_, &frame, sizeof(frame));
  if (written < 0) {
    throw_errno("write", errno);
  }
  if (written != static_cast<ssize_t>(sizeof(frame))) {
    throw IoError("short write on " + interface_name_);
  }
}

bool SocketCanTransport::recv(can_frame & frame, std::chrono::microseconds timeout)
{
  if (socket_fd_ < 0) {
    throw TransportLostError(interface_name_ + " is closed");
  }

  fd_set rdfs;
  FD_ZERO(&rdfs);
  FD_SET(socket_fd_, &rdfs);

  const auto us = timeout.count() > 0 ? timeout.count() : 0;
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(us / 1000000);
  tv.tv_usec = static_cast<suseconds_t>(us % 1000000);

  const int ready = ::select(socket_fd_ + 1, &rdfs, nullptr, nullptr, &tv);
  if (ready < 0) {
    if (errno == EINTR) {
      return false;
    }
    throw_errno("select", errno);
  }
  if (ready == 0) {
    return false;
  }

  const ssize_t received = ::read(socket_fd_, &frame, sizeof(frame));
  if (received < 0) {
    throw_errno("read", errno);
  }
  if (received != static_cast<ssize_t>(sizeof(frame))) {
    throw IoError("incomplete CAN frame on " + interface_name_);
  }
  return true;
}

void SocketCanTransport::close()
{
  if (socket_fd_ >= 0) {
    ::close(socket_fd_);
    socket_fd_ = -1;
    RCLCPP_INFO(rclcpp::get_logger("socketcan"), "Closed %s", interface_name_.c_str());
  }
}

void SocketCanTransport::throw_errno(const char * operation, int err) const
{
  const std::string what =
    std::string(operation) + " on " + interface_name_ + ": " + std::strerror(err);
  if (is_fatal_errno(err)) {
    throw TransportLostError(what);
  }
  // Transmit queue full: the frame was dropped, the bus may recover.
  if (err == ENOBUFS || err == EAGAIN) {
    throw TimeoutError(what);
  }
  throw IoError(what);
}

}  // namespace robstride_driver
