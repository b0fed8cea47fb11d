#include "robstride_driver/motor_session.hpp"

#include <utility>

namespace robstride_driver
{

std::ostream & operator<<(std::ostream & os, SessionState state)
{
  switch (state) {
    case SessionState::kIdle:
      return os << "Idle";
    case SessionState::kDisabled:
      return os << "Disabled";
    case SessionState::kRunning:
      return os << "Running";
    case SessionState::kFault:
      return os << "Fault";
  }
  return os << "SessionState(" << static_cast<int>(state) << ")";
}

MotorSession::MotorSession(
  uint8_t motor_id, std::string name, const MotorModel & model,
  unsigned int fault_after_failures)
: motor_id_(motor_id), name_(std::move(name)), model_(model),
  fault_after_failures_(fault_after_failures)
{
  feedback_.motor_id = motor_id;
}

void MotorSession::on_feedback(const MotorFeedback & feedback)
{
  feedback_ = feedback;
  feedback_.motor_id = motor_id_;
  fresh_ = true;
  consecutive_failures_ = 0;
  last_decode_status_ = DecodeStatus::kOk;
  apply_telemetry(feedback.mode, feedback.faults);
}

void MotorSession::on_status(FirmwareMode mode, uint16_t faults)
{
  feedback_.mode = mode;
  feedback_.faults = faults;
  fresh_ = true;
  consecutive_failures_ = 0;
  last_decode_status_ = DecodeStatus::kOk;
  apply_telemetry(mode, faults);
}

void MotorSession::on_position(float position)
{
  feedback_.position = position;
}

void MotorSession::on_velocity(float velocity)
{
  feedback_.velocity = velocity;
}

void MotorSession::apply_telemetry(FirmwareMode mode, uint16_t faults)
{
  if (faults & kFirmwareFaultMask) {
    faults_ |= faults & kFirmwareFaultMask;
    state_ = SessionState::kFault;
    return;
  }
  if (state_ == SessionState::kFault) {
    return;
  }
  switch (mode) {
    case FirmwareMode::kRun:
      state_ = SessionState::kRunning;
      break;
    case FirmwareMode::kReset:
    case FirmwareMode::kBrake:
      state_ = SessionState::kDisabled;
      break;
    case FirmwareMode::kCalibration:
      break;
  }
}

void MotorSession::on_timeout()
{
  record_failure();
}

void MotorSession::on_io_error()
{
  record_failure();
}

void MotorSession::on_decode_error(DecodeStatus status)
{
  last_decode_status_ = status;
  record_failure();
}

void MotorSession::record_failure()
{
  fresh_ = false;
  ++total_failures_;
  ++consecutive_failures_;
  if (fault_after_failures_ > 0 && consecutive_failures_ >= fault_after_failures_) {
    faults_ |= kFaultCommunicationLost;
    state_ = SessionState::kFault;
  }
}

void MotorSession::on_reset()
{
  state_ = SessionState::kDisabled;
  faults_ = 0;
  consecutive_failures_ = 0;
}

void MotorSession::on_start()
{
  if (state_ == SessionState::kIdle || state_ == SessionState::kDisabled) {
    state_ = SessionState::kRunning;
  }
}

void MotorSession::on_zeroed()
{
  zero_offset_ += feedback_.position;
  feedback_.position = 0.0f;
}

void MotorSession::on_setpoint(const MotorControlParams & params)
{
  setpoint_ = params;
}

bool MotorSession::should_log(std::chrono::steady_clock::time_point now)
{
  if (last_log_ == std::chrono::steady_clock::time_point{} ||
    now - last_log_ >= std::chrono::seconds(5))
  {
    last_log_ = now;
    return true;
  }
  return false;
}

}  // namespace robstride_driver
