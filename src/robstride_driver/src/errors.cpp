#include "robstride_driver/errors.hpp"

namespace robstride_driver
{

const char * to_string(DecodeStatus status)
{
  switch (status) {
    case DecodeStatus::kOk:
      return "ok";
    case DecodeStatus::kTooShort:
      return "frame too short";
    case DecodeStatus::kUnknownCommand:
      return "unknown command byte";
    case DecodeStatus::kUnexpectedCommand:
      return "unexpected command";
    case DecodeStatus::kUnknownMotor:
      return "unknown motor";
    case DecodeStatus::kBadFraming:
      return "bad framing";
  }
  return "invalid status";
}

std::ostream & operator<<(std::ostream & os, DecodeStatus status)
{
  return os << to_string(status);
}

UnknownMotorError::UnknownMotorError(uint8_t motor_id)
: Error("Invalid motor ID: " + std::to_string(motor_id)), motor_id_(motor_id)
{
}

DecodeError::DecodeError(DecodeStatus status, const std::string & what)
: Error(std::string("decode error (") + to_string(status) + "): " + what), status_(status)
{
}

}  // namespace robstride_driver
