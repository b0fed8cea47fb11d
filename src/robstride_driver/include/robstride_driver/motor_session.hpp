#ifndef ROBSTRIDE_DRIVER__MOTOR_SESSION_HPP_
#define ROBSTRIDE_DRIVER__MOTOR_SESSION_HPP_

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

#include "robstride_driver/errors.hpp"
#include "robstride_driver/motor_model.hpp"
#include "robstride_driver/robstride_types.hpp"

namespace robstride_driver
{

// Host-side view of a motor's operating state.
enum class SessionState
{
  kIdle,      // configured, nothing observed or commanded yet
  kDisabled,  // stopped (after reset, or firmware reports Reset/Brake)
  kRunning,   // enabled and accepting setpoints
  kFault,     // firmware fault or lost communication; left only through reset
};

std::ostream & operator<<(std::ostream & os, SessionState state);

/**
 * MotorSession — state machine of one configured actuator.
 *
 *   Idle/Disabled --start--> Running
 *   any --reset--> Disabled
 *   any --feedback with faults != 0--> Fault
 *   any --fault_after_failures consecutive failures--> Fault (kFaultCommunicationLost)
 *
 * Telemetry moves Idle/Disabled/Running according to the reported firmware mode,
 * but never leaves Fault.
 */
class MotorSession
{
public:
  MotorSession(uint8_t motor_id, std::string name, const MotorModel & model,
    unsigned int fault_after_failures = 5);

  uint8_t motor_id() const {return motor_id_;}
  const std::string & name() const {return name_;}
  const MotorModel & model() const {return model_;}

  SessionState state() const {return state_;}
  uint16_t faults() const {return faults_;}
  bool fresh() const {return fresh_;}
  bool accepts_setpoints() const {return state_ != SessionState::kFault;}
  unsigned int consecutive_failures() const {return consecutive_failures_;}
  uint64_t total_failures() const {return total_failures_;}
  DecodeStatus last_decode_status() const {return last_decode_status_;}

  const MotorFeedback & latest_feedback() const {return feedback_;}
  const MotorControlParams & last_setpoint() const {return setpoint_;}
  float zero_offset() const {return zero_offset_;}

  // ----- telemetry -----
  void on_feedback(const MotorFeedback & feedback);
  // Partial telemetry from a parameter read (mode and faults ride in the reply ID).
  void on_status(FirmwareMode mode, uint16_t faults);
  void on_position(float position);
  void on_velocity(float velocity);

  // ----- failures -----
  void on_timeout();
  void on_io_error();
  void on_decode_error(DecodeStatus status);

  // ----- explicit commands -----
  void on_reset();
  void on_start();
  // Position reference moved to the current position. Does not change state.
  void on_zeroed();
  void on_setpoint(const MotorControlParams & params);

  // Start of a tick: everything is stale until a reply arrives.
  void mark_stale() {fresh_ = false;}

  // Rate limiter for per-motor warnings.
  bool should_log(std::chrono::steady_clock::time_point now);

private:
  void apply_telemetry(FirmwareMode mode, uint16_t faults);
  void record_failure();

  uint8_t motor_id_;
  std::string name_;
  MotorModel model_;
  unsigned int fault_after_failures_;

  SessionState state_ = SessionState::kIdle;
  uint16_t faults_ = 0;
  bool fresh_ = false;
  unsigned int consecutive_failures_ = 0;
  uint64_t total_failures_ = 0;
  DecodeStatus last_decode_status_ = DecodeStatus::kOk;

  MotorFeedback feedback_;
  MotorControlParams setpoint_;
  float zero_offset_ = 0.0f;

  std::chrono::steady_clock::time_point last_log_{};
};

}  // namespace robstride_driver

#endif  // ROBSTRIDE_DRIVER__MOTOR_SESSION_HPP_
