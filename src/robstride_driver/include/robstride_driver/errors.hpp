#ifndef ROBSTRIDE_DRIVER__ERRORS_HPP_
#define ROBSTRIDE_DRIVER__ERRORS_HPP_

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace robstride_driver
{

// Result of decoding one received frame. The codec reports malformed input
// through these values and never throws.
enum class DecodeStatus
{
  kOk = 0,
  kTooShort,           // fewer payload bytes than the frame kind requires
  kUnknownCommand,     // communication type not spoken by the firmware
  kUnexpectedCommand,  // known type, but not the reply kind being decoded
  kUnknownMotor,       // motor id not in the configured set
  kBadFraming,         // serial tunnel header/trailer mismatch
};

const char * to_string(DecodeStatus status);
std::ostream & operator<<(std::ostream & os, DecodeStatus status);

// Base of every error raised by this library.
class Error : public std::runtime_error
{
public:
  explicit Error(const std::string & what)
  : std::runtime_error(what) {}
};

// Bad endpoint, duplicate motor id, unknown model. Raised from constructors only.
class ConfigurationError : public Error
{
public:
  explicit ConfigurationError(const std::string & what)
  : Error("configuration error: " + what) {}
};

// Setpoint outside the model's documented range (or not finite).
class ValidationError : public Error
{
public:
  explicit ValidationError(const std::string & what)
  : Error("validation error: " + what) {}
};

class UnknownMotorError : public Error
{
public:
  explicit UnknownMotorError(uint8_t motor_id);

  uint8_t motor_id() const {return motor_id_;}

private:
  uint8_t motor_id_;
};

class DecodeError : public Error
{
public:
  DecodeError(DecodeStatus status, const std::string & what);

  DecodeStatus status() const {return status_;}

private:
  DecodeStatus status_;
};

// Per-frame transport failure. The bus handle is still usable.
class IoError : public Error
{
public:
  explicit IoError(const std::string & what)
  : Error(what) {}
};

class TimeoutError : public IoError
{
public:
  explicit TimeoutError(const std::string & what)
  : IoError("timeout: " + what) {}
};

// The bus handle is gone (device unplugged, interface down). Terminal for the loop.
class TransportLostError : public IoError
{
public:
  explicit TransportLostError(const std::string & what)
  : IoError("transport lost: " + what) {}
};

}  // namespace robstride_driver

#endif  // ROBSTRIDE_DRIVER__ERRORS_HPP_
