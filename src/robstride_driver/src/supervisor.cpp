#include "robstride_driver/supervisor.hpp"

#include <exception>
#include <utility>

#include "rclcpp/rclcpp.hpp"

namespace robstride_driver
{

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("Supervisor");
}

}  // namespace

MotorConfig parse_motor_descriptor(
  uint8_t motor_id, const std::string & descriptor, const std::string & default_model)
{
  MotorConfig motor;
  motor.id = motor_id;

  const auto colon = descriptor.rfind(':');
  if (colon != std::string::npos) {
    motor.name = descriptor.substr(0, colon);
    motor.model = descriptor.substr(colon + 1);
  } else if (is_motor_model(descriptor)) {
    motor.model = descriptor;
  } else {
    motor.name = descriptor;
    motor.model = default_model;
  }

  motor.model = lookup_motor_model(motor.model).name;
  if (motor.name.empty()) {
    motor.name = "motor_" + std::to_string(motor_id);
  }
  return motor;
}

Supervisor::Supervisor(const SupervisorConfig & config)
: Supervisor(make_transport(config.endpoint), config)
{
}

Supervisor::Supervisor(std::unique_ptr<Transport> transport, const SupervisorConfig & config)
: config_(config), period_(config.period), paused_(config.start_paused)
{
  if (config_.period.count() <= 0) {
    throw ConfigurationError("loop period must be positive");
  }
  if (config_.motors.empty()) {
    throw ConfigurationError("no motors configured");
  }

  std::vector<MotorConfig> motors;
  for (const auto & entry : config_.motors) {
    motors.push_back(parse_motor_descriptor(entry.first, entry.second, config_.default_model));
  }

  DriverOptions options;
  options.reply_timeout = config_.reply_timeout;
  options.host_id = config_.host_id;
  options.fault_after_failures = config_.fault_after_failures;
  driver_ = std::make_unique<MotorDriver>(std::move(transport), motors, options);

  for (uint8_t id : driver_->motor_ids()) {
    models_.emplace(id, driver_->session(id).model());
    targets_[id] = MotorControlParams();
    failed_commands_[id] = 0;
  }
  publish_snapshot(false);

  RCLCPP_INFO(
    logger(), "Supervising %zu motors every %ld us%s", models_.size(),
    static_cast<long>(period_.count()), paused_ ? " (paused)" : "");

  running_ = true;
  thread_ = std::thread(&Supervisor::run, this);
}

Supervisor::~Supervisor()
{
  stop();
}

/**********************************Targets****************************/
void Supervisor::set_field(uint8_t motor_id, float MotorControlParams::* field, float value)
{
  check_alive();
  const MotorModel & model = model_of(motor_id);

  std::scoped_lock<std::mutex> lock(state_mutex_);
  MotorControlParams params = targets_[motor_id];
  params.*field = value;
  frame_codec::validate(params, model);
  targets_[motor_id] = params;
}

void Supervisor::set_position(uint8_t motor_id, float position)
{
  set_field(motor_id, &MotorControlParams::position, position);
}

void Supervisor::set_velocity(uint8_t motor_id, float velocity)
{
  set_field(motor_id, &MotorControlParams::velocity, velocity);
}

void Supervisor::set_kp(uint8_t motor_id, float kp)
{
  set_field(motor_id, &MotorControlParams::kp, kp);
}

void Supervisor::set_kd(uint8_t motor_id, float kd)
{
  set_field(motor_id, &MotorControlParams::kd, kd);
}

void Supervisor::set_torque(uint8_t motor_id, float torque)
{
  set_field(motor_id, &MotorControlParams::torque, torque);
}

void Supervisor::set_params(uint8_t motor_id, const MotorControlParams & params)
{
  check_alive();
  frame_codec::validate(params, model_of(motor_id));

  std::scoped_lock<std::mutex> lock(state_mutex_);
  targets_[motor_id] = params;
}

MotorControlParams Supervisor::get_params(uint8_t motor_id) const
{
  model_of(motor_id);
  std::scoped_lock<std::mutex> lock(state_mutex_);
  return targets_.at(motor_id);
}

void Supervisor::add_motor_to_zero(uint8_t motor_id)
{
  check_alive();
  model_of(motor_id);

  std::scoped_lock<std::mutex> lock(state_mutex_);
  queue_zero(motor_id);
}

void Supervisor::queue_zero(uint8_t motor_id)
{
  // The reference jumps to the current position; hold still across the change.
  MotorControlParams & target = targets_[motor_id];
  target.position = 0.0f;
  target.velocity = 0.0f;
  target.torque = 0.0f;
  pending_zero_.insert(motor_id);
}

void Supervisor::request_reset(std::optional<uint8_t> motor_id)
{
  check_alive();
  if (motor_id) {
    model_of(*motor_id);
  }

  std::scoped_lock<std::mutex> lock(state_mutex_);
  if (motor_id) {
    pending_resets_.insert(*motor_id);
  } else {
    for (const auto & entry : models_) {
      pending_resets_.insert(entry.first);
    }
  }
}

bool Supervisor::toggle_pause()
{
  bool paused;
  {
    std::scoped_lock<std::mutex> lock(state_mutex_);
    paused_ = !paused_;
    paused = paused_;
    if (!paused_) {
      wake_ = true;
    }
  }
  wake_cv_.notify_all();
  RCLCPP_INFO(logger(), "%s", paused ? "Paused, polling telemetry only" : "Resumed");
  return paused;
}

bool Supervisor::is_paused() const
{
  std::scoped_lock<std::mutex> lock(state_mutex_);
  return paused_;
}

void Supervisor::park()
{
  std::unique_lock<std::mutex> lock(state_mutex_);
  paused_ = true;
  park_requested_ = true;
  wake_ = true;
  wake_cv_.notify_all();
  wake_cv_.wait(lock, [this] {return !park_requested_ || !running_;});
  RCLCPP_INFO(logger(), "Parked, motors disabled");
}

void Supervisor::set_sleep_duration(std::chrono::microseconds period)
{
  if (period.count() <= 0) {
    throw ValidationError("loop period must be positive");
  }
  std::scoped_lock<std::mutex> lock(state_mutex_);
  period_ = period;
}

std::chrono::microseconds Supervisor::sleep_duration() const
{
  std::scoped_lock<std::mutex> lock(state_mutex_);
  return period_;
}

/**********************************Feedback****************************/
FeedbackMap Supervisor::get_latest_feedback() const
{
  const auto snapshot = get_snapshot();
  FeedbackMap feedback;
  for (const auto & entry : snapshot->motors) {
    feedback[entry.first] = entry.second.feedback;
  }
  return feedback;
}

MotorFeedback Supervisor::get_latest_feedback_for(uint8_t motor_id) const
{
  model_of(motor_id);
  return get_snapshot()->motors.at(motor_id).feedback;
}

std::shared_ptr<const FeedbackSnapshot> Supervisor::get_snapshot() const
{
  std::scoped_lock<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

uint64_t Supervisor::get_total_commands() const
{
  std::scoped_lock<std::mutex> lock(stats_mutex_);
  return total_commands_;
}

uint64_t Supervisor::get_failed_commands(uint8_t motor_id) const
{
  model_of(motor_id);
  std::scoped_lock<std::mutex> lock(stats_mutex_);
  return failed_commands_.at(motor_id);
}

void Supervisor::reset_command_counters()
{
  std::scoped_lock<std::mutex> lock(stats_mutex_);
  total_commands_ = 0;
  for (auto & entry : failed_commands_) {
    entry.second = 0;
  }
}

double Supervisor::get_actual_update_rate() const
{
  std::scoped_lock<std::mutex> lock(stats_mutex_);
  return update_rate_;
}

std::vector<uint8_t> Supervisor::motor_ids() const
{
  std::vector<uint8_t> ids;
  for (const auto & entry : models_) {
    ids.push_back(entry.first);
  }
  return ids;
}

std::string Supervisor::last_error() const
{
  std::scoped_lock<std::mutex> lock(snapshot_mutex_);
  return last_error_;
}

void Supervisor::stop()
{
  {
    std::scoped_lock<std::mutex> lock(state_mutex_);
    stop_requested_ = true;
  }
  wake_cv_.notify_all();

  std::scoped_lock<std::mutex> lock(join_mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }
}

/**********************************Loop****************************/
void Supervisor::run()
{
  try {
    bool preflight_done = false;
    auto next = std::chrono::steady_clock::now();

    while (true) {
      bool paused;
      bool park;
      {
        std::scoped_lock<std::mutex> lock(state_mutex_);
        if (stop_requested_) {
          break;
        }
        paused = paused_;
        park = park_requested_;
      }
      if (park) {
        if (preflight_done) {
          shutdown_motors();
        }
        preflight_done = false;
        {
          std::scoped_lock<std::mutex> lock(state_mutex_);
          park_requested_ = false;
        }
        wake_cv_.notify_all();
      }
      // Motors are only enabled once the loop is allowed to command them.
      if (!paused && !preflight_done) {
        preflight();
        preflight_done = true;
      }

      tick();

      std::unique_lock<std::mutex> lock(state_mutex_);
      next += period_;
      const auto now = std::chrono::steady_clock::now();
      if (next < now) {
        RCLCPP_DEBUG(logger(), "Tick overran the period, resynchronising");
        next = now;
      }
      wake_cv_.wait_until(lock, next, [this] {return stop_requested_ || wake_;});
      if (wake_) {
        wake_ = false;
        next = std::chrono::steady_clock::now();
      }
    }

    shutdown_motors();
    driver_->close();
    publish_snapshot(true);
  } catch (const TransportLostError & e) {
    RCLCPP_ERROR(logger(), "Stopping control loop: %s", e.what());
    lost_ = true;
    abandon(e.what());
  } catch (const Error & e) {
    RCLCPP_ERROR(logger(), "Control loop failed: %s", e.what());
    abandon(e.what());
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger(), "Control loop aborted: %s", e.what());
    abandon(e.what());
  }

  {
    std::scoped_lock<std::mutex> lock(state_mutex_);
    running_ = false;
    park_requested_ = false;
  }
  wake_cv_.notify_all();
}

void Supervisor::abandon(const std::string & what)
{
  {
    std::scoped_lock<std::mutex> lock(snapshot_mutex_);
    last_error_ = what;
  }
  driver_->mark_all_stale();
  driver_->close();
  publish_snapshot(true);
}

void Supervisor::preflight()
{
  driver_->send_reset();
  driver_->send_start();
  if (config_.can_timeout_s > 0.0f) {
    driver_->send_can_timeout(config_.can_timeout_s);
  }

  if (!zero_on_init_queued_) {
    std::scoped_lock<std::mutex> lock(state_mutex_);
    for (const auto & entry : models_) {
      if (entry.second.zero_on_init) {
        queue_zero(entry.first);
      }
    }
    zero_on_init_queued_ = true;
  }
  RCLCPP_INFO(logger(), "Motors reset and started");
}

void Supervisor::tick()
{
  std::map<uint8_t, MotorControlParams> targets;
  std::set<uint8_t> zeros;
  std::set<uint8_t> resets;
  bool paused;
  {
    std::scoped_lock<std::mutex> lock(state_mutex_);
    paused = paused_;
    targets = targets_;
    if (!paused) {
      zeros.swap(pending_zero_);
      resets.swap(pending_resets_);
    }
  }

  driver_->mark_all_stale();

  if (!resets.empty()) {
    const MotorIds ids(resets.begin(), resets.end());
    driver_->send_reset(ids);
    driver_->send_start(ids);
  }

  // A motor about to be zeroed only gets zero torque this tick.
  for (uint8_t id : zeros) {
    targets.erase(id);
  }

  std::map<uint8_t, bool> commanded;
  if (paused) {
    driver_->poll_feedback();
  } else {
    for (const auto & entry : targets) {
      commanded[entry.first] = driver_->session(entry.first).accepts_setpoints();
    }
    driver_->send_motor_controls(targets);
  }

  if (!zeros.empty()) {
    std::map<uint8_t, float> idle;
    for (uint8_t id : zeros) {
      idle[id] = 0.0f;
    }
    driver_->send_torque_controls(idle);
    driver_->send_set_zero(MotorIds(zeros.begin(), zeros.end()));
  }

  const auto now = std::chrono::steady_clock::now();
  {
    std::scoped_lock<std::mutex> lock(stats_mutex_);
    for (const auto & entry : commanded) {
      if (!entry.second) {
        continue;
      }
      ++total_commands_;
      if (!driver_->session(entry.first).fresh()) {
        ++failed_commands_[entry.first];
      }
    }
    if (last_tick_ != std::chrono::steady_clock::time_point{}) {
      const double elapsed = std::chrono::duration<double>(now - last_tick_).count();
      if (elapsed > 0.0) {
        const double rate = 1.0 / elapsed;
        update_rate_ = update_rate_ == 0.0 ? rate : 0.9 * update_rate_ + 0.1 * rate;
      }
    }
    last_tick_ = now;
  }

  publish_snapshot(false);
}

void Supervisor::shutdown_motors()
{
  std::map<uint8_t, float> idle;
  for (uint8_t id : driver_->motor_ids()) {
    if (driver_->session(id).accepts_setpoints()) {
      idle[id] = 0.0f;
    }
  }
  if (!idle.empty()) {
    driver_->send_torque_controls(idle);
  }
  driver_->send_reset();
  RCLCPP_INFO(logger(), "Motors stopped");
}

void Supervisor::publish_snapshot(bool stopped)
{
  auto snapshot = std::make_shared<FeedbackSnapshot>();
  snapshot->stopped = stopped;
  for (uint8_t id : driver_->motor_ids()) {
    const MotorSession & session = driver_->session(id);
    MotorSnapshot motor;
    motor.feedback = session.latest_feedback();
    motor.state = session.state();
    motor.fresh = session.fresh();
    snapshot->motors.emplace(id, motor);
  }

  std::scoped_lock<std::mutex> lock(snapshot_mutex_);
  snapshot->tick = tick_++;
  snapshot_ = std::move(snapshot);
}

const MotorModel & Supervisor::model_of(uint8_t motor_id) const
{
  const auto it = models_.find(motor_id);
  if (it == models_.end()) {
    throw UnknownMotorError(motor_id);
  }
  return it->second;
}

void Supervisor::check_alive() const
{
  if (lost_) {
    throw TransportLostError("control loop has stopped");
  }
}

}  // namespace robstride_driver
