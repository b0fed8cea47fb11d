#ifndef ROBSTRIDE_DRIVER__SUPERVISOR_HPP_
#define ROBSTRIDE_DRIVER__SUPERVISOR_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "robstride_driver/motor_driver.hpp"

namespace robstride_driver
{

struct SupervisorConfig
{
  // "can0", "/dev/ttyUSB0", "ros" or "ros:<rx_topic>:<tx_topic>"
  std::string endpoint = "can0";
  // (id, descriptor) in configuration order; descriptor is "model", "name" or "name:model".
  std::vector<std::pair<uint8_t, std::string>> motors;
  std::chrono::microseconds period{std::chrono::milliseconds(10)};
  std::chrono::microseconds reply_timeout{std::chrono::milliseconds(10)};
  uint8_t host_id = kCanIdDebugUi;
  float can_timeout_s = 0.0f;  // 0 leaves the firmware value untouched
  unsigned int fault_after_failures = 5;
  bool start_paused = false;
  std::string default_model = "01";
};

// Throws ConfigurationError for an unknown model.
MotorConfig parse_motor_descriptor(
  uint8_t motor_id, const std::string & descriptor, const std::string & default_model = "01");

struct MotorSnapshot
{
  MotorFeedback feedback;
  SessionState state = SessionState::kIdle;
  bool fresh = false;
};

// Everything one completed tick observed. Immutable once published.
struct FeedbackSnapshot
{
  uint64_t tick = 0;
  bool stopped = false;
  std::map<uint8_t, MotorSnapshot> motors;
};

/**
 * Supervisor — fixed-period control loop over one MotorDriver.
 *
 * One loop thread owns the driver (and so the bus). Any number of client threads
 * may update targets and read feedback concurrently:
 *  - the target table is copied once per tick under a single lock, so a set_params()
 *    is never observed half applied;
 *  - feedback is published as a whole FeedbackSnapshot at the end of each tick.
 *
 * While paused the loop only polls telemetry; pending zero and reset requests
 * wait for resume. Resume wakes the loop so targets are re-sent at once.
 */
class Supervisor
{
public:
  explicit Supervisor(const SupervisorConfig & config);
  Supervisor(std::unique_ptr<Transport> transport, const SupervisorConfig & config);
  ~Supervisor();

  Supervisor(const Supervisor &) = delete;
  Supervisor & operator=(const Supervisor &) = delete;

  // ----- targets -----
  void set_position(uint8_t motor_id, float position);
  void set_velocity(uint8_t motor_id, float velocity);
  void set_kp(uint8_t motor_id, float kp);
  void set_kd(uint8_t motor_id, float kd);
  void set_torque(uint8_t motor_id, float torque);
  void set_params(uint8_t motor_id, const MotorControlParams & params);
  MotorControlParams get_params(uint8_t motor_id) const;

  // ----- one-shot requests, consumed by the next running tick -----
  void add_motor_to_zero(uint8_t motor_id);
  // Resets (clearing faults) and restarts one motor, or every motor.
  void request_reset(std::optional<uint8_t> motor_id = std::nullopt);

  // Returns the new paused state.
  bool toggle_pause();
  bool is_paused() const;
  // Pauses and disables every motor (zero torque, then reset). Resuming runs the
  // start-up sequence again. Blocks until the loop has disabled the motors.
  void park();

  void set_sleep_duration(std::chrono::microseconds period);
  std::chrono::microseconds sleep_duration() const;

  // ----- feedback -----
  FeedbackMap get_latest_feedback() const;
  MotorFeedback get_latest_feedback_for(uint8_t motor_id) const;
  std::shared_ptr<const FeedbackSnapshot> get_snapshot() const;

  // ----- statistics -----
  uint64_t get_total_commands() const;
  uint64_t get_failed_commands(uint8_t motor_id) const;
  void reset_command_counters();
  double get_actual_update_rate() const;

  std::vector<uint8_t> motor_ids() const;
  bool is_running() const {return running_;}
  std::string last_error() const;

  // Sends zero torque, resets every motor and releases the bus. Idempotent.
  void stop();

private:
  void run();
  void preflight();
  void tick();
  void shutdown_motors();
  void publish_snapshot(bool stopped);
  // Records a fatal loop error and releases the bus.
  void abandon(const std::string & what);
  // Caller holds state_mutex_.
  void queue_zero(uint8_t motor_id);

  const MotorModel & model_of(uint8_t motor_id) const;
  void check_alive() const;
  void set_field(uint8_t motor_id, float MotorControlParams::* field, float value);

  std::unique_ptr<MotorDriver> driver_;
  SupervisorConfig config_;
  // Copied from the driver at construction; read by client threads without locking.
  std::map<uint8_t, MotorModel> models_;

  mutable std::mutex state_mutex_;
  std::condition_variable wake_cv_;
  std::map<uint8_t, MotorControlParams> targets_;
  std::set<uint8_t> pending_zero_;
  std::set<uint8_t> pending_resets_;
  std::chrono::microseconds period_;
  bool paused_ = false;
  bool wake_ = false;
  bool park_requested_ = false;
  bool stop_requested_ = false;

  // Loop thread only.
  bool zero_on_init_queued_ = false;

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const FeedbackSnapshot> snapshot_;
  std::string last_error_;
  uint64_t tick_ = 0;

  mutable std::mutex stats_mutex_;
  uint64_t total_commands_ = 0;
  std::map<uint8_t, uint64_t> failed_commands_;
  double update_rate_ = 0.0;
  std::chrono::steady_clock::time_point last_tick_{};

  std::atomic<bool> running_{false};
  std::atomic<bool> lost_{false};

  std::mutex join_mutex_;
  std::thread thread_;
};

}  // namespace robstride_driver

#endif  // ROBSTRIDE_DRIVER__SUPERVISOR_HPP_
