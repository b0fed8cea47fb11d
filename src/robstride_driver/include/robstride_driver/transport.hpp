#ifndef ROBSTRIDE_DRIVER__TRANSPORT_HPP_
#define ROBSTRIDE_DRIVER__TRANSPORT_HPP_

#include <linux/can.h>

#include <chrono>
#include <memory>
#include <string>

namespace robstride_driver
{

/**
 * Transport — owns one bus handle and moves raw CAN frames.
 *
 * RAII: the constructor opens the handle, close() or the destructor releases it.
 * Not thread-safe: exactly one thread (the supervisor loop) may use an instance.
 *
 * Errors:
 *  - send()/recv() throw IoError for a failed frame, TransportLostError when
 *    the handle itself is gone.
 *  - recv() returns false when `timeout` elapses without a frame.
 */
class Transport
{
public:
  virtual ~Transport() = default;

  virtual void send(const can_frame & frame) = 0;
  virtual bool recv(can_frame & frame, std::chrono::microseconds timeout) = 0;

  // Idempotent.
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual const char * kind() const = 0;
  virtual std::string endpoint() const = 0;
};

/**
 * Opens the transport named by `endpoint`:
 *  - "ros", "ros:<rx_topic>:<tx_topic>"  → ros2_socketcan topics (can_msgs/Frame)
 *  - "/dev/..."                          → CH341 USB-CAN serial adapter
 *  - anything else                       → SocketCAN interface name (e.g. "can0")
 * Throws ConfigurationError when the endpoint cannot be opened.
 */
std::unique_ptr<Transport> make_transport(const std::string & endpoint);

}  // namespace robstride_driver

#endif  // ROBSTRIDE_DRIVER__TRANSPORT_HPP_
