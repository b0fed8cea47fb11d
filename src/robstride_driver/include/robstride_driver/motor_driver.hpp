#ifndef ROBSTRIDE_DRIVER__MOTOR_DRIVER_HPP_
#define ROBSTRIDE_DRIVER__MOTOR_DRIVER_HPP_

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "robstride_driver/frame_codec.hpp"
#include "robstride_driver/motor_session.hpp"
#include "robstride_driver/robstride_types.hpp"
#include "robstride_driver/transport.hpp"

namespace robstride_driver
{

// Static description of one managed actuator.
struct MotorConfig
{
  uint8_t id = kCanIdMotorDefault;
  std::string name;
  std::string model = "01";
};

struct DriverOptions
{
  // Bound on the wait for each individual reply.
  std::chrono::microseconds reply_timeout{std::chrono::milliseconds(10)};
  uint8_t host_id = kCanIdDebugUi;
  // Consecutive failed exchanges before a motor is declared faulted (0 disables).
  unsigned int fault_after_failures = 5;
};

using FeedbackMap = std::map<uint8_t, MotorFeedback>;
using MotorIds = std::vector<uint8_t>;

/**
 * MotorDriver — executes commands against one or more motors and correlates replies.
 *
 * - Every command is addressed to a single motor and answered by a single reply;
 *   the driver waits at most reply_timeout for it.
 * - A motor that does not answer (or answers garbage) is recorded as stale in its
 *   session; the rest of the batch proceeds.
 * - Frames from other motors that arrive while waiting are decoded and cached.
 * - Motors in SessionState::kFault are polled instead of commanded until reset.
 *
 * Not thread-safe. Owned and driven by one thread (see Supervisor).
 *
 * Errors: UnknownMotorError / ValidationError before any I/O for bad arguments,
 * TransportLostError when the bus handle dies. Per-motor I/O, timeout and decode
 * failures are recorded in the session, never thrown (read_parameter excepted).
 */
class MotorDriver
{
public:
  MotorDriver(std::unique_ptr<Transport> transport, const std::vector<MotorConfig> & motors,
    const DriverOptions & options = DriverOptions());
  ~MotorDriver();

  MotorDriver(const MotorDriver &) = delete;
  MotorDriver & operator=(const MotorDriver &) = delete;

  // ----- commands -----
  std::map<uint8_t, RunMode> send_get_mode();
  FeedbackMap send_set_zero(const std::optional<MotorIds> & motor_ids = std::nullopt);
  FeedbackMap send_reset(const std::optional<MotorIds> & motor_ids = std::nullopt);
  FeedbackMap send_start(const std::optional<MotorIds> & motor_ids = std::nullopt);
  FeedbackMap send_motor_controls(const std::map<uint8_t, MotorControlParams> & params);
  FeedbackMap send_torque_controls(const std::map<uint8_t, float> & torques);
  // Telemetry without setpoints: reads mechanical position and velocity parameters.
  FeedbackMap poll_feedback(const std::optional<MotorIds> & motor_ids = std::nullopt);
  // Programs the firmware CAN watchdog; the motor stops if no frame arrives for `seconds`.
  // Motors already holding that value are not written.
  FeedbackMap send_can_timeout(float seconds);

  // ----- parameter queries -----
  // Seconds currently programmed in each motor's CAN watchdog register.
  std::map<uint8_t, float> read_can_timeouts();
  std::map<uint8_t, std::string> read_names();
  std::map<uint8_t, std::string> read_bar_codes();
  std::map<uint8_t, std::string> read_build_dates();
  // Single parameter read. Unlike the batch calls this throws: TimeoutError when
  // the motor does not answer, DecodeError when its answer is unusable.
  frame_codec::ParameterReply read_parameter(uint8_t motor_id, uint16_t index);

  // ----- cache (no bus I/O) -----
  FeedbackMap get_latest_feedback() const;
  MotorFeedback get_latest_feedback_for(uint8_t motor_id) const;
  const MotorSession & session(uint8_t motor_id) const;
  MotorIds motor_ids() const;
  bool has_motor(uint8_t motor_id) const {return sessions_.count(motor_id) != 0;}

  // Marks every session stale; called at the start of a tick.
  void mark_all_stale();

  // Releases the transport. Idempotent.
  void close();
  bool is_open() const {return transport_ && transport_->is_open();}

private:
  enum class Exchange
  {
    kReply,    // matching reply in `reply`
    kNoReply,  // sent, but no usable reply (timeout or decode failure, already recorded)
    kNotSent,  // send failed (already recorded)
  };

  MotorSession & session_ref(uint8_t motor_id);
  MotorIds resolve(const std::optional<MotorIds> & requested) const;

  Exchange exchange(MotorSession & session, const frame_codec::Command & command,
    CommType reply_type, can_frame & reply);
  // Returns false (recorded) when the frame could not be sent.
  bool send_request(MotorSession & session, const frame_codec::Command & command);
  Exchange await_reply(MotorSession & session, CommType reply_type, can_frame & reply);
  // Reads parameter `index`. On kNoReply `status` says whether the reply was
  // undecodable (anything but kOk) or simply missing (kOk).
  Exchange read_param(MotorSession & session, uint16_t index,
    frame_codec::ParameterReply & param, DecodeStatus & status);
  // String parameters arrive as `frames` replies of 4 characters each.
  bool read_string_param(MotorSession & session, uint16_t index, int frames, std::string & out);
  std::map<uint8_t, std::string> read_string_params(uint16_t index, int frames);
  // Decodes a type 2 reply into `session`. Returns false (recorded) on decode failure.
  bool apply_feedback(MotorSession & session, const can_frame & reply);
  // Caches a frame that was not the one being waited for.
  void ingest(const can_frame & frame);

  bool poll_one(MotorSession & session);
  bool ensure_mit_mode(MotorSession & session);

  void warn(MotorSession & session, const std::string & what);

  std::unique_ptr<Transport> transport_;
  DriverOptions options_;
  frame_codec::ModelTable models_;
  std::map<uint8_t, MotorSession> sessions_;
  std::map<uint8_t, RunMode> run_modes_;
};

}  // namespace robstride_driver

#endif  // ROBSTRIDE_DRIVER__MOTOR_DRIVER_HPP_
