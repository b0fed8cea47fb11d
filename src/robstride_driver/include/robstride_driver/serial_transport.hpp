#ifndef ROBSTRIDE_DRIVER__SERIAL_TRANSPORT_HPP_
#define ROBSTRIDE_DRIVER__SERIAL_TRANSPORT_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "robstride_driver/errors.hpp"
#include "robstride_driver/transport.hpp"

namespace robstride_driver
{

/**
 * CH341 USB-CAN adapter framing. Each CAN frame is tunnelled as
 *   'A' 'T' | (can_id << 3 | 0x4) as 4 bytes big-endian | len | data[len] | '\r' '\n'
 */
namespace serial_framing
{

constexpr std::size_t kHeaderSize = 7;
constexpr std::size_t kTrailerSize = 2;
constexpr std::size_t kMaxFrameSize = kHeaderSize + 8 + kTrailerSize;

std::vector<uint8_t> encode(const can_frame & frame);

// Parses one frame from the start of `data`.
//  - kOk: `out` filled, `consumed` bytes belong to it.
//  - kTooShort: need more bytes, nothing consumed.
//  - kBadFraming: `data` does not start with a frame; drop `consumed` bytes and retry.
DecodeStatus decode(const uint8_t * data, std::size_t size, can_frame & out, std::size_t & consumed);

}  // namespace serial_framing

// Serial realization of Transport (921600 baud, 8N1, raw).
class SerialTransport : public Transport
{
public:
  explicit SerialTransport(const std::string & device);
  ~SerialTransport() override;

  SerialTransport(const SerialTransport &) = delete;
  SerialTransport & operator=(const SerialTransport &) = delete;

  void send(const can_frame & frame) override;
  bool recv(can_frame & frame, std::chrono::microseconds timeout) override;
  void close() override;
  bool is_open() const override {return fd_ >= 0;}

  const char * kind() const override {return "serial";}
  std::string endpoint() const override {return device_;}

private:
  // Extracts a frame already sitting in rx_buffer_, resynchronizing past garbage.
  bool pop_buffered(can_frame & frame);
  [[noreturn]] void throw_errno(const char * operation, int err) const;

  std::string device_;
  int fd_;
  std::vector<uint8_t> rx_buffer_;
};

}  // namespace robstride_driver

#endif  // ROBSTRIDE_DRIVER__SERIAL_TRANSPORT_HPP_
