#ifndef ROBSTRIDE_DRIVER__FRAME_CODEC_HPP_
#define ROBSTRIDE_DRIVER__FRAME_CODEC_HPP_

#include <linux/can.h>

#include <array>
#include <cstdint>
#include <map>
#include <variant>

#include "robstride_driver/errors.hpp"
#include "robstride_driver/motor_model.hpp"
#include "robstride_driver/robstride_types.hpp"

/**
 * Frame codec — pure functions mapping commands to CAN frames and CAN frames
 * to telemetry.
 * - 29-bit extended IDs are built as: (comm_type << 24) | (data << 8) | motor_can_id
 * - `data` is the host id for every command except motion control, where it
 *   carries the quantized feed-forward torque.
 * - Replies put the motor id in bits 15..8, fault bits in 21..16 and the
 *   firmware mode in 23..22.
 */

namespace robstride_driver
{
namespace frame_codec
{

constexpr int kFieldBits = 16;

// ==========================
// Command kinds
// ==========================
struct GetMode {};
struct SetZero {};
struct Reset
{
  bool clear_faults = false;
};
struct Start {};
struct SetControls
{
  MotorControlParams params;
};
struct SetTorque
{
  float torque = 0.0f;
};
struct ReadParameter
{
  uint16_t index = 0;
};
struct WriteParameter
{
  uint16_t index = 0;
  uint32_t value = 0;  // little-endian in payload bytes 4..7
  uint8_t value_type = 0;  // payload byte 2; kParamTypeU32 for 32-bit registers
};

constexpr uint8_t kParamTypeU32 = 0x04;

using Command = std::variant<
  GetMode, SetZero, Reset, Start, SetControls, SetTorque, ReadParameter, WriteParameter>;

// Value carried by a parameter read reply (type 0x11).
struct ParameterReply
{
  uint8_t motor_id = 0;
  uint16_t index = 0;
  std::array<uint8_t, 4> value{};
  FirmwareMode mode = FirmwareMode::kReset;
  uint16_t faults = 0;

  float as_float() const;
  uint8_t as_uint8() const {return value[0];}
  uint16_t as_uint16() const;
};

using ModelTable = std::map<uint8_t, MotorModel>;

// ==========================
// Quantization (affine map of a range onto 0 .. 2^bits - 1)
// ==========================
uint16_t quantize(float value, const Range & range, int bits = kFieldBits);
float dequantize(uint16_t value, const Range & range, int bits = kFieldBits);
// Width of one quantization step.
float quantization_step(const Range & range, int bits = kFieldBits);

// ==========================
// ID helpers
// ==========================
constexpr uint32_t build_ext_id(CommType type, uint16_t data, uint8_t motor_id) noexcept
{
  return (static_cast<uint32_t>(static_cast<uint8_t>(type) & 0x1Fu) << 24) |
         (static_cast<uint32_t>(data) << 8) | static_cast<uint32_t>(motor_id);
}

constexpr uint8_t comm_type_of(canid_t can_id) noexcept
{
  return static_cast<uint8_t>((can_id & CAN_EFF_MASK) >> 24) & 0x1Fu;
}

// Motor id carried by a reply frame.
constexpr uint8_t reply_motor_id(canid_t can_id) noexcept
{
  return static_cast<uint8_t>((can_id & 0xFF00u) >> 8);
}

// Motor id a command frame is addressed to.
constexpr uint8_t target_motor_id(canid_t can_id) noexcept
{
  return static_cast<uint8_t>(can_id & 0xFFu);
}

// ==========================
// Encoding
// ==========================

// Throws ValidationError naming the first field outside `model`'s range.
void validate(const MotorControlParams & params, const MotorModel & model);

// Builds the frame for `command` addressed to `motor_id`. Throws ValidationError
// (and builds nothing) when a setpoint is out of range.
can_frame encode_command(
  const Command & command, uint8_t motor_id, const MotorModel & model,
  uint8_t host_id = kCanIdDebugUi);

// Telemetry as the firmware would send it. Used by simulators and tests.
can_frame encode_feedback(
  const MotorFeedback & feedback, const MotorModel & model, uint8_t host_id = kCanIdDebugUi);

can_frame encode_parameter_reply(const ParameterReply & reply, uint8_t host_id = kCanIdDebugUi);

// ==========================
// Decoding
// ==========================
DecodeStatus decode_feedback(const can_frame & frame, const ModelTable & models, MotorFeedback & out);

DecodeStatus decode_parameter_reply(
  const can_frame & frame, const ModelTable & models, ParameterReply & out);

// Inverse of encode_command(SetControls). Used by simulators and tests.
DecodeStatus decode_control_params(
  const can_frame & frame, const MotorModel & model, MotorControlParams & out);

}  // namespace frame_codec
}  // namespace robstride_driver

#endif  // ROBSTRIDE_DRIVER__FRAME_CODEC_HPP_
