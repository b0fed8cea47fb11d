#include "robstride_hw_interface/robstride_system.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "hardware_interface/types/hardware_interface_type_values.hpp"
#include "rclcpp/rclcpp.hpp"

namespace robstride_hw_interface
{

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("RobstrideSystem");
}

std::chrono::microseconds milliseconds_param(const std::string & value)
{
  return std::chrono::microseconds(static_cast<int64_t>(std::stod(value) * 1000.0));
}

}  // namespace

hardware_interface::CallbackReturn RobstrideSystem::on_init(
  const hardware_interface::HardwareInfo & info)
{
  if (
    hardware_interface::SystemInterface::on_init(info) !=
    hardware_interface::CallbackReturn::SUCCESS)
  {
    return hardware_interface::CallbackReturn::ERROR;
  }

  RCLCPP_INFO(logger(), "Initializing hardware interface...");

  hw_states_positions_.resize(info_.joints.size(), std::numeric_limits<double>::quiet_NaN());
  hw_states_velocities_.resize(info_.joints.size(), std::numeric_limits<double>::quiet_NaN());
  hw_states_efforts_.resize(info_.joints.size(), std::numeric_limits<double>::quiet_NaN());
  hw_commands_positions_.resize(info_.joints.size(), std::numeric_limits<double>::quiet_NaN());
  hw_commands_velocities_.resize(info_.joints.size(), std::numeric_limits<double>::quiet_NaN());
  hw_commands_efforts_.resize(info_.joints.size(), std::numeric_limits<double>::quiet_NaN());

  config_ = robstride_driver::SupervisorConfig();
  config_.start_paused = true;
  kp_ = 50.0;
  kd_ = 5.0;

  try {
    for (const auto & [key, value] : info_.hardware_parameters) {
      if (key == "endpoint") {
        config_.endpoint = value;
      } else if (key == "period_ms") {
        config_.period = milliseconds_param(value);
      } else if (key == "reply_timeout_ms") {
        config_.reply_timeout = milliseconds_param(value);
      } else if (key == "can_timeout_s") {
        config_.can_timeout_s = std::stof(value);
      } else if (key == "kp") {
        kp_ = std::stod(value);
      } else if (key == "kd") {
        kd_ = std::stod(value);
      }
    }

    //  Each joint carries motor_id = "0x01" (hex) and optionally model = "03"
    motor_ids_.clear();
    config_.motors.clear();
    for (const auto & joint : info_.joints) {
      auto it = joint.parameters.find("motor_id");
      if (it == joint.parameters.end()) {
        RCLCPP_ERROR(logger(), "Joint '%s' missing motor_id parameter", joint.name.c_str());
        return hardware_interface::CallbackReturn::ERROR;
      }
      const unsigned long id = std::stoul(it->second, nullptr, 16);
      if (id > 0xFF) {
        RCLCPP_ERROR(
          logger(), "Joint '%s' motor_id %s does not fit a CAN id", joint.name.c_str(),
          it->second.c_str());
        return hardware_interface::CallbackReturn::ERROR;
      }

      std::string descriptor = joint.name;
      auto model = joint.parameters.find("model");
      if (model != joint.parameters.end()) {
        descriptor += ":" + model->second;
      }
      // Validates the model now rather than at configure.
      robstride_driver::parse_motor_descriptor(static_cast<uint8_t>(id), descriptor);

      motor_ids_.push_back(static_cast<uint8_t>(id));
      config_.motors.emplace_back(static_cast<uint8_t>(id), descriptor);
      RCLCPP_INFO(
        logger(), "Joint '%s' mapped to motor ID 0x%02X", joint.name.c_str(),
        static_cast<unsigned int>(id));
    }
  } catch (const std::invalid_argument & e) {
    RCLCPP_ERROR(logger(), "Malformed hardware parameter: %s", e.what());
    return hardware_interface::CallbackReturn::ERROR;
  } catch (const std::out_of_range & e) {
    RCLCPP_ERROR(logger(), "Hardware parameter out of range: %s", e.what());
    return hardware_interface::CallbackReturn::ERROR;
  } catch (const robstride_driver::Error & e) {
    RCLCPP_ERROR(logger(), "%s", e.what());
    return hardware_interface::CallbackReturn::ERROR;
  }

  RCLCPP_INFO(
    logger(), "Hardware interface initialized on %s (Kp %.2f, Kd %.2f)",
    config_.endpoint.c_str(), kp_, kd_);
  return hardware_interface::CallbackReturn::SUCCESS;
}

hardware_interface::CallbackReturn RobstrideSystem::on_configure(
  const rclcpp_lifecycle::State & /*previous_state*/)
{
  RCLCPP_INFO(logger(), "Configuring hardware interface...");

  try {
    supervisor_ = std::make_unique<robstride_driver::Supervisor>(config_);
  } catch (const robstride_driver::Error & e) {
    RCLCPP_ERROR(logger(), "Failed to open motors: %s", e.what());
    return hardware_interface::CallbackReturn::ERROR;
  }

  for (size_t i = 0; i < motor_ids_.size(); ++i) {
    hw_states_positions_[i] = 0.0;
    hw_states_velocities_[i] = 0.0;
    hw_states_efforts_[i] = 0.0;
    hw_commands_positions_[i] = std::numeric_limits<double>::quiet_NaN();
    hw_commands_velocities_[i] = std::numeric_limits<double>::quiet_NaN();
    hw_commands_efforts_[i] = std::numeric_limits<double>::quiet_NaN();
  }

  RCLCPP_INFO(logger(), "Hardware configured successfully");
  return hardware_interface::CallbackReturn::SUCCESS;
}

hardware_interface::CallbackReturn RobstrideSystem::on_cleanup(
  const rclcpp_lifecycle::State & /*previous_state*/)
{
  if (supervisor_) {
    supervisor_->stop();
  }
  supervisor_.reset();
  return hardware_interface::CallbackReturn::SUCCESS;
}

std::vector<hardware_interface::StateInterface>
RobstrideSystem::export_state_interfaces()
{
  std::vector<hardware_interface::StateInterface> state_interfaces;

  for (size_t i = 0; i < info_.joints.size(); ++i) {
    state_interfaces.emplace_back(hardware_interface::StateInterface(
      info_.joints[i].name, hardware_interface::HW_IF_POSITION, &hw_states_positions_[i]));

    state_interfaces.emplace_back(hardware_interface::StateInterface(
      info_.joints[i].name, hardware_interface::HW_IF_VELOCITY, &hw_states_velocities_[i]));

    state_interfaces.emplace_back(hardware_interface::StateInterface(
      info_.joints[i].name, hardware_interface::HW_IF_EFFORT, &hw_states_efforts_[i]));
  }

  return state_interfaces;
}

std::vector<hardware_interface::CommandInterface>
RobstrideSystem::export_command_interfaces()
{
  std::vector<hardware_interface::CommandInterface> command_interfaces;

  for (size_t i = 0; i < info_.joints.size(); ++i) {
    command_interfaces.emplace_back(hardware_interface::CommandInterface(
      info_.joints[i].name, hardware_interface::HW_IF_POSITION, &hw_commands_positions_[i]));

    command_interfaces.emplace_back(hardware_interface::CommandInterface(
      info_.joints[i].name, hardware_interface::HW_IF_VELOCITY, &hw_commands_velocities_[i]));

    command_interfaces.emplace_back(hardware_interface::CommandInterface(
      info_.joints[i].name, hardware_interface::HW_IF_EFFORT, &hw_commands_efforts_[i]));
  }

  return command_interfaces;
}

hardware_interface::CallbackReturn RobstrideSystem::on_activate(
  const rclcpp_lifecycle::State & /*previous_state*/)
{
  RCLCPP_INFO(logger(), "Activating hardware interface...");

  if (!supervisor_ || !supervisor_->is_running()) {
    RCLCPP_ERROR(logger(), "Control loop is not running");
    return hardware_interface::CallbackReturn::ERROR;
  }

  //  Hold the current pose until a controller writes a command
  try {
    const auto snapshot = supervisor_->get_snapshot();
    for (size_t i = 0; i < motor_ids_.size(); ++i) {
      hw_commands_positions_[i] = std::numeric_limits<double>::quiet_NaN();
      hw_commands_velocities_[i] = std::numeric_limits<double>::quiet_NaN();
      hw_commands_efforts_[i] = std::numeric_limits<double>::quiet_NaN();

      const auto & motor = snapshot->motors.at(motor_ids_[i]);
      //  A silent motor gets a zero-gain target and stays limp
      if (!motor.fresh) {
        RCLCPP_WARN(logger(), "No feedback from motor 0x%02X yet", motor_ids_[i]);
        supervisor_->set_params(motor_ids_[i], robstride_driver::MotorControlParams());
        continue;
      }
      robstride_driver::MotorControlParams params;
      params.position = motor.feedback.position;
      params.kp = static_cast<float>(kp_);
      params.kd = static_cast<float>(kd_);
      supervisor_->set_params(motor_ids_[i], params);
    }
  } catch (const robstride_driver::Error & e) {
    RCLCPP_ERROR(logger(), "Activation failed: %s", e.what());
    return hardware_interface::CallbackReturn::ERROR;
  }

  if (supervisor_->is_paused()) {
    supervisor_->toggle_pause();
  }

  RCLCPP_INFO(logger(), "Hardware activated successfully");
  return hardware_interface::CallbackReturn::SUCCESS;
}

hardware_interface::CallbackReturn RobstrideSystem::on_deactivate(
  const rclcpp_lifecycle::State & /*previous_state*/)
{
  RCLCPP_INFO(logger(), "Deactivating hardware interface...");

  //  Disable the motors but keep the loop polling, so activate can re-enable them
  if (supervisor_) {
    supervisor_->park();
  }

  RCLCPP_INFO(logger(), "Hardware deactivated successfully");
  return hardware_interface::CallbackReturn::SUCCESS;
}

hardware_interface::return_type RobstrideSystem::read(
  const rclcpp::Time & /*time*/, const rclcpp::Duration & /*period*/)
{
  if (!supervisor_) {
    return hardware_interface::return_type::ERROR;
  }

  const auto snapshot = supervisor_->get_snapshot();
  if (snapshot->stopped) {
    RCLCPP_ERROR(logger(), "Control loop stopped: %s", supervisor_->last_error().c_str());
    return hardware_interface::return_type::ERROR;
  }

  for (size_t i = 0; i < motor_ids_.size(); ++i) {
    const auto & motor = snapshot->motors.at(motor_ids_[i]);
    //  Keep the previous state for a motor that missed this tick
    if (!motor.fresh) {
      continue;
    }
    hw_states_positions_[i] = motor.feedback.position;
    hw_states_velocities_[i] = motor.feedback.velocity;
    hw_states_efforts_[i] = motor.feedback.torque;
  }

  return hardware_interface::return_type::OK;
}

hardware_interface::return_type RobstrideSystem::write(
  const rclcpp::Time & /*time*/, const rclcpp::Duration & /*period*/)
{
  if (!supervisor_) {
    return hardware_interface::return_type::ERROR;
  }

  for (size_t i = 0; i < motor_ids_.size(); ++i) {
    //  Check for NaN commands (no command received)
    if (std::isnan(hw_commands_positions_[i]) &&
      std::isnan(hw_commands_velocities_[i]) &&
      std::isnan(hw_commands_efforts_[i]))
    {
      continue;
    }

    robstride_driver::MotorControlParams params;
    params.position = static_cast<float>(
      std::isnan(hw_commands_positions_[i]) ? hw_states_positions_[i] : hw_commands_positions_[i]);
    params.velocity = static_cast<float>(
      std::isnan(hw_commands_velocities_[i]) ? 0.0 : hw_commands_velocities_[i]);
    params.torque = static_cast<float>(
      std::isnan(hw_commands_efforts_[i]) ? 0.0 : hw_commands_efforts_[i]);
    params.kp = static_cast<float>(kp_);
    params.kd = static_cast<float>(kd_);

    try {
      supervisor_->set_params(motor_ids_[i], params);
    } catch (const robstride_driver::TransportLostError & e) {
      RCLCPP_ERROR(logger(), "%s", e.what());
      return hardware_interface::return_type::ERROR;
    } catch (const robstride_driver::ValidationError & e) {
      if (should_log()) {
        RCLCPP_WARN(
          logger(), "Rejected command for motor 0x%02X: %s", motor_ids_[i], e.what());
      }
    }
  }

  return hardware_interface::return_type::OK;
}

bool RobstrideSystem::should_log()
{
  const auto now = std::chrono::steady_clock::now();
  if (last_log_ == std::chrono::steady_clock::time_point{} ||
    now - last_log_ >= std::chrono::seconds(5))
  {
    last_log_ = now;
    return true;
  }
  return false;
}

}  // namespace robstride_hw_interface

#include "pluginlib/class_list_macros.hpp"
PLUGINLIB_EXPORT_CLASS(
  robstride_hw_interface::RobstrideSystem, hardware_interface::SystemInterface)
