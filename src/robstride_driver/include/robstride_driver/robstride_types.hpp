#ifndef ROBSTRIDE_DRIVER__ROBSTRIDE_TYPES_HPP_
#define ROBSTRIDE_DRIVER__ROBSTRIDE_TYPES_HPP_

#include <cstdint>
#include <ostream>

/**
 * Value types shared by the codec, driver and supervisor.
 * All engineering values are SI: rad, rad/s, Nm, degC.
 */

namespace robstride_driver
{

// ==========================
// Bus addresses
// ==========================
constexpr uint8_t kCanIdMaster = 0x00;
constexpr uint8_t kCanIdMotorDefault = 0x7F;
constexpr uint8_t kCanIdBroadcast = 0xFE;
constexpr uint8_t kCanIdDebugUi = 0xFD;  // default host id

// ==========================
// Communication types (5-bit "type" field -> bits 28..24 of the 29-bit CAN ID)
// ==========================
enum class CommType : uint8_t
{
  kGetId = 0x00,           // Query device ID & 64-bit MCU UID
  kMotionControl = 0x01,   // Motion-control command (5-tuple)
  kFeedback = 0x02,        // Motor feedback/status to host
  kEnable = 0x03,          // Enable motor (enter run state)
  kStop = 0x04,            // Stop motor (byte0 = 1 clears fault bits)
  kSetZero = 0x06,         // Set mechanical zero
  kSetCanId = 0x07,        // Change motor CAN_ID
  kParamRead = 0x11,       // Read single parameter by index
  kParamWrite = 0x12,      // Write single parameter by index
  kFaultFeedback = 0x15,   // Fault/warning feedback frame
  kSetBaudRate = 0x16,     // Change bus baud rate
};

// True for every type the firmware is documented to speak.
bool is_known_comm_type(uint8_t type);

// ==========================
// Parameter indices (type 0x11 / 0x12)
// ==========================
constexpr uint16_t kParamName = 0x0000;       // string, 4 reply frames
constexpr uint16_t kParamBarCode = 0x0001;    // string, 4 reply frames
constexpr uint16_t kParamBuildDate = 0x1001;  // string, 3 reply frames
constexpr uint16_t kParamRunMode = 0x7005;
constexpr uint16_t kParamMechPos = 0x7019;
constexpr uint16_t kParamMechVel = 0x701B;

// Operating state reported by the firmware in bits 23..22 of feedback frames.
enum class FirmwareMode : uint8_t
{
  kReset = 0,
  kCalibration = 1,
  kRun = 2,
  kBrake = 3,
};

// Control law selected through parameter 0x7005.
enum class RunMode : int8_t
{
  kUnset = -1,
  kMit = 0,
  kPosition = 1,
  kSpeed = 2,
  kCurrent = 3,
  kToZero = 4,
  kCspPosition = 5,
};

// ==========================
// Fault bits (bits 21..16 of the feedback ID, shifted down)
// ==========================
constexpr uint16_t kFaultUnderVoltage = 1u << 0;
constexpr uint16_t kFaultOverCurrent = 1u << 1;
constexpr uint16_t kFaultOverTemperature = 1u << 2;
constexpr uint16_t kFaultMagneticEncoder = 1u << 3;
constexpr uint16_t kFaultHallEncoder = 1u << 4;
constexpr uint16_t kFaultNotCalibrated = 1u << 5;
constexpr uint16_t kFirmwareFaultMask = 0x3F;
// Set by the host when a motor stops answering; never sent by firmware.
constexpr uint16_t kFaultCommunicationLost = 1u << 8;

// One actuator's desired operating point (MIT-style 5-tuple).
struct MotorControlParams
{
  float position = 0.0f;  // rad
  float velocity = 0.0f;  // rad/s
  float kp = 0.0f;
  float kd = 0.0f;
  float torque = 0.0f;    // Nm feed-forward
};

// Decoded telemetry.
struct MotorFeedback
{
  uint8_t motor_id = 0;
  float position = 0.0f;     // rad
  float velocity = 0.0f;     // rad/s
  float torque = 0.0f;       // Nm
  float temperature = 0.0f;  // degC
  FirmwareMode mode = FirmwareMode::kReset;
  uint16_t faults = 0;
};

bool operator==(const MotorControlParams & lhs, const MotorControlParams & rhs);
bool operator!=(const MotorControlParams & lhs, const MotorControlParams & rhs);

std::ostream & operator<<(std::ostream & os, FirmwareMode mode);
std::ostream & operator<<(std::ostream & os, RunMode mode);
std::ostream & operator<<(std::ostream & os, const MotorControlParams & params);
std::ostream & operator<<(std::ostream & os, const MotorFeedback & feedback);

}  // namespace robstride_driver

#endif  // ROBSTRIDE_DRIVER__ROBSTRIDE_TYPES_HPP_
