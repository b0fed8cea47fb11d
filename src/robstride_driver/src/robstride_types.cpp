#include "robstride_driver/robstride_types.hpp"

#include <iomanip>

namespace robstride_driver
{

bool is_known_comm_type(uint8_t type)
{
  switch (static_cast<CommType>(type)) {
    case CommType::kGetId:
    case CommType::kMotionControl:
    case CommType::kFeedback:
    case CommType::kEnable:
    case CommType::kStop:
    case CommType::kSetZero:
    case CommType::kSetCanId:
    case CommType::kParamRead:
    case CommType::kParamWrite:
    case CommType::kFaultFeedback:
    case CommType::kSetBaudRate:
      return true;
  }
  return false;
}

bool operator==(const MotorControlParams & lhs, const MotorControlParams & rhs)
{
  return lhs.position == rhs.position && lhs.velocity == rhs.velocity && lhs.kp == rhs.kp &&
         lhs.kd == rhs.kd && lhs.torque == rhs.torque;
}

bool operator!=(const MotorControlParams & lhs, const MotorControlParams & rhs)
{
  return !(lhs == rhs);
}

std::ostream & operator<<(std::ostream & os, FirmwareMode mode)
{
  switch (mode) {
    case FirmwareMode::kReset:
      return os << "Reset";
    case FirmwareMode::kCalibration:
      return os << "Calibration";
    case FirmwareMode::kRun:
      return os << "Run";
    case FirmwareMode::kBrake:
      return os << "Brake";
  }
  return os << "FirmwareMode(" << static_cast<int>(mode) << ")";
}

std::ostream & operator<<(std::ostream & os, RunMode mode)
{
  switch (mode) {
    case RunMode::kUnset:
      return os << "Unset";
    case RunMode::kMit:
      return os << "Mit";
    case RunMode::kPosition:
      return os << "Position";
    case RunMode::kSpeed:
      return os << "Speed";
    case RunMode::kCurrent:
      return os << "Current";
    case RunMode::kToZero:
      return os << "ToZero";
    case RunMode::kCspPosition:
      return os << "CspPosition";
  }
  return os << "RunMode(" << static_cast<int>(mode) << ")";
}

std::ostream & operator<<(std::ostream & os, const MotorControlParams & params)
{
  return os << "MotorControlParams { position: " << params.position
            << ", velocity: " << params.velocity << ", kp: " << params.kp
            << ", kd: " << params.kd << ", torque: " << params.torque << " }";
}

std::ostream & operator<<(std::ostream & os, const MotorFeedback & feedback)
{
  const auto flags = os.flags();
  const auto fill = os.fill();
  os << "MotorFeedback { motor_id: " << static_cast<int>(feedback.motor_id)
     << ", position: " << feedback.position << ", velocity: " << feedback.velocity
     << ", torque: " << feedback.torque << ", temperature: " << feedback.temperature
     << ", mode: " << feedback.mode << ", faults: 0x" << std::hex << std::setw(4)
     << std::setfill('0') << feedback.faults << " }";
  os.flags(flags);
  os.fill(fill);
  return os;
}

}  // namespace robstride_driver
