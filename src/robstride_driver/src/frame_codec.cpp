#include "robstride_driver/frame_codec.hpp"

#include <cmath>
#include <cstring>
#include <sstream>
#include <string>

namespace robstride_driver
{
namespace frame_codec
{

namespace
{

/*******************************Frame helpers************************************/
can_frame make_frame(CommType type, uint16_t data, uint8_t motor_id)
{
  can_frame frame;
  std::memset(&frame, 0, sizeof(frame));
  frame.can_id = build_ext_id(type, data, motor_id) | CAN_EFF_FLAG;
  frame.can_dlc = 8;
  return frame;
}

void put_u16_be(uint8_t * dst, uint16_t value)
{
  dst[0] = static_cast<uint8_t>(value >> 8);
  dst[1] = static_cast<uint8_t>(value);
}

uint16_t get_u16_be(const uint8_t * src)
{
  return static_cast<uint16_t>(src[0] << 8 | src[1]);
}

void put_u16_le(uint8_t * dst, uint16_t value)
{
  dst[0] = static_cast<uint8_t>(value);
  dst[1] = static_cast<uint8_t>(value >> 8);
}

uint16_t get_u16_le(const uint8_t * src)
{
  return static_cast<uint16_t>(src[1] << 8 | src[0]);
}

// Bits 15..0 of the data field: mode[15:14] | faults[13:8] | motor_id[7:0].
uint16_t status_word(uint8_t motor_id, FirmwareMode mode, uint16_t faults)
{
  return static_cast<uint16_t>(
    (static_cast<uint16_t>(mode) & 0x3u) << 14 | (faults & kFirmwareFaultMask) << 8 | motor_id);
}

void check_field(const char * field, float value, const Range & range)
{
  if (!range.contains(value)) {
    std::ostringstream msg;
    msg << field << " " << value << " outside [" << range.min << ", " << range.max << "]";
    throw ValidationError(msg.str());
  }
}

DecodeStatus check_reply(const can_frame & frame, CommType expected, const ModelTable & models)
{
  if (!(frame.can_id & CAN_EFF_FLAG)) {
    return DecodeStatus::kUnexpectedCommand;
  }
  const uint8_t type = comm_type_of(frame.can_id);
  if (!is_known_comm_type(type)) {
    return DecodeStatus::kUnknownCommand;
  }
  if (type != static_cast<uint8_t>(expected)) {
    return DecodeStatus::kUnexpectedCommand;
  }
  if (frame.can_dlc < 8) {
    return DecodeStatus::kTooShort;
  }
  if (models.find(reply_motor_id(frame.can_id)) == models.end()) {
    return DecodeStatus::kUnknownMotor;
  }
  return DecodeStatus::kOk;
}

// Builds one frame per command kind. Every alternative of Command must have an
// overload here.
struct CommandEncoder
{
  uint8_t motor_id;
  const MotorModel & model;
  uint8_t host_id;

  can_frame operator()(const GetMode &) const
  {
    return (*this)(ReadParameter{kParamRunMode});
  }

  can_frame operator()(const SetZero &) const
  {
    can_frame frame = make_frame(CommType::kSetZero, host_id, motor_id);
    frame.data[0] = 1;
    return frame;
  }

  can_frame operator()(const Reset & reset) const
  {
    can_frame frame = make_frame(CommType::kStop, host_id, motor_id);
    frame.data[0] = reset.clear_faults ? 1 : 0;
    return frame;
  }

  can_frame operator()(const Start &) const
  {
    return make_frame(CommType::kEnable, host_id, motor_id);
  }

  can_frame operator()(const SetControls & controls) const
  {
    const MotorControlParams & p = controls.params;
    validate(p, model);
    can_frame frame =
      make_frame(CommType::kMotionControl, quantize(p.torque, model.torque), motor_id);
    put_u16_be(&frame.data[0], quantize(p.position, model.position));
    put_u16_be(&frame.data[2], quantize(p.velocity, model.velocity));
    put_u16_be(&frame.data[4], quantize(p.kp, model.kp));
    put_u16_be(&frame.data[6], quantize(p.kd, model.kd));
    return frame;
  }

  can_frame operator()(const SetTorque & torque) const
  {
    check_field("torque", torque.torque, model.torque);
    MotorControlParams params;
    params.torque = torque.torque;
    return (*this)(SetControls{params});
  }

  can_frame operator()(const ReadParameter & read) const
  {
    can_frame frame = make_frame(CommType::kParamRead, host_id, motor_id);
    put_u16_le(&frame.data[0], read.index);
    return frame;
  }

  can_frame operator()(const WriteParameter & write) const
  {
    can_frame frame = make_frame(CommType::kParamWrite, host_id, motor_id);
    put_u16_le(&frame.data[0], write.index);
    frame.data[2] = write.value_type;
    frame.data[4] = static_cast<uint8_t>(write.value);
    frame.data[5] = static_cast<uint8_t>(write.value >> 8);
    frame.data[6] = static_cast<uint8_t>(write.value >> 16);
    frame.data[7] = static_cast<uint8_t>(write.value >> 24);
    return frame;
  }
};

}  // namespace

/*******************************Mathematic Function************************************/
uint16_t quantize(float value, const Range & range, int bits)
{
  const float span = range.max - range.min;
  const float levels = static_cast<float>((1u << bits) - 1);
  if (value > range.max) {
    value = range.max;
  } else if (value < range.min) {
    value = range.min;
  }
  return static_cast<uint16_t>(std::lround((value - range.min) / span * levels));
}

float dequantize(uint16_t value, const Range & range, int bits)
{
  const float span = range.max - range.min;
  const float levels = static_cast<float>((1u << bits) - 1);
  return static_cast<float>(value) * span / levels + range.min;
}

float quantization_step(const Range & range, int bits)
{
  return (range.max - range.min) / static_cast<float>((1u << bits) - 1);
}

float ParameterReply::as_float() const
{
  float result;
  std::memcpy(&result, value.data(), sizeof(result));
  return result;
}

uint16_t ParameterReply::as_uint16() const
{
  return get_u16_le(value.data());
}

void validate(const MotorControlParams & params, const MotorModel & model)
{
  check_field("position", params.position, model.position);
  check_field("velocity", params.velocity, model.velocity);
  check_field("kp", params.kp, model.kp);
  check_field("kd", params.kd, model.kd);
  check_field("torque", params.torque, model.torque);
}

can_frame encode_command(
  const Command & command, uint8_t motor_id, const MotorModel & model, uint8_t host_id)
{
  return std::visit(CommandEncoder{motor_id, model, host_id}, command);
}

can_frame encode_feedback(const MotorFeedback & feedback, const MotorModel & model, uint8_t host_id)
{
  can_frame frame = make_frame(
    CommType::kFeedback, status_word(feedback.motor_id, feedback.mode, feedback.faults), host_id);
  put_u16_be(&frame.data[0], quantize(feedback.position, model.position));
  put_u16_be(&frame.data[2], quantize(feedback.velocity, model.velocity));
  put_u16_be(&frame.data[4], quantize(feedback.torque, model.torque));
  put_u16_be(&frame.data[6], static_cast<uint16_t>(std::lround(feedback.temperature * 10.0f)));
  return frame;
}

can_frame encode_parameter_reply(const ParameterReply & reply, uint8_t host_id)
{
  can_frame frame = make_frame(
    CommType::kParamRead, status_word(reply.motor_id, reply.mode, reply.faults), host_id);
  put_u16_le(&frame.data[0], reply.index);
  std::memcpy(&frame.data[4], reply.value.data(), reply.value.size());
  return frame;
}

DecodeStatus decode_feedback(const can_frame & frame, const ModelTable & models, MotorFeedback & out)
{
  const DecodeStatus status = check_reply(frame, CommType::kFeedback, models);
  if (status != DecodeStatus::kOk) {
    return status;
  }

  const uint8_t motor_id = reply_motor_id(frame.can_id);
  const MotorModel & model = models.at(motor_id);

  out.motor_id = motor_id;
  out.position = dequantize(get_u16_be(&frame.data[0]), model.position);
  out.velocity = dequantize(get_u16_be(&frame.data[2]), model.velocity);
  out.torque = dequantize(get_u16_be(&frame.data[4]), model.torque);
  out.temperature = static_cast<float>(get_u16_be(&frame.data[6])) * 0.1f;
  out.faults = static_cast<uint16_t>((frame.can_id & 0x3F0000u) >> 16);
  out.mode = static_cast<FirmwareMode>((frame.can_id & 0xC00000u) >> 22);
  return DecodeStatus::kOk;
}

DecodeStatus decode_parameter_reply(
  const can_frame & frame, const ModelTable & models, ParameterReply & out)
{
  const DecodeStatus status = check_reply(frame, CommType::kParamRead, models);
  if (status != DecodeStatus::kOk) {
    return status;
  }

  out.motor_id = reply_motor_id(frame.can_id);
  out.index = get_u16_le(&frame.data[0]);
  std::memcpy(out.value.data(), &frame.data[4], out.value.size());
  out.faults = static_cast<uint16_t>((frame.can_id & 0x3F0000u) >> 16);
  out.mode = static_cast<FirmwareMode>((frame.can_id & 0xC00000u) >> 22);
  return DecodeStatus::kOk;
}

DecodeStatus decode_control_params(
  const can_frame & frame, const MotorModel & model, MotorControlParams & out)
{
  const uint8_t type = comm_type_of(frame.can_id);
  if (!is_known_comm_type(type)) {
    return DecodeStatus::kUnknownCommand;
  }
  if (type != static_cast<uint8_t>(CommType::kMotionControl)) {
    return DecodeStatus::kUnexpectedCommand;
  }
  if (frame.can_dlc < 8) {
    return DecodeStatus::kTooShort;
  }

  out.torque = dequantize(static_cast<uint16_t>((frame.can_id & 0xFFFF00u) >> 8), model.torque);
  out.position = dequantize(get_u16_be(&frame.data[0]), model.position);
  out.velocity = dequantize(get_u16_be(&frame.data[2]), model.velocity);
  out.kp = dequantize(get_u16_be(&frame.data[4]), model.kp);
  out.kd = dequantize(get_u16_be(&frame.data[6]), model.kd);
  return DecodeStatus::kOk;
}

}  // namespace frame_codec
}  // namespace robstride_driver
