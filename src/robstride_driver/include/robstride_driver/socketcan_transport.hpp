#ifndef ROBSTRIDE_DRIVER__SOCKETCAN_TRANSPORT_HPP_
#define ROBSTRIDE_DRIVER__SOCKETCAN_TRANSPORT_HPP_

#include <string>

#include "robstride_driver/transport.hpp"

namespace robstride_driver
{

// Raw SocketCAN socket bound to one interface. The interface must already be
// up with the right bitrate (1 Mbit/s for Robstride).
class SocketCanTransport : public Transport
{
public:
  explicit SocketCanTransport(const std::string & interface_name);
  ~SocketCanTransport() override;

  SocketCanTransport(const SocketCanTransport &) = delete;
  SocketCanTransport & operator=(const SocketCanTransport &) = delete;

  void send(const can_frame & frame) override;
  bool recv(can_frame & frame, std::chrono::microseconds timeout) override;
  void close() override;
  bool is_open() const override {return socket_fd_ >= 0;}

  const char * kind() const override {return "socketcan";}
  std::string endpoint() const override {return interface_name_;}

private:
  [[noreturn]] void throw_errno(const char * operation, int err) const;

  std::string interface_name_;
  int socket_fd_;
};

}  // namespace robstride_driver

#endif  // ROBSTRIDE_DRIVER__SOCKETCAN_TRANSPORT_HPP_
