#ifndef ROBSTRIDE_HW_INTERFACE__ROBSTRIDE_SYSTEM_HPP_
#define ROBSTRIDE_HW_INTERFACE__ROBSTRIDE_SYSTEM_HPP_

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "hardware_interface/handle.hpp"
#include "hardware_interface/hardware_info.hpp"
#include "hardware_interface/system_interface.hpp"
#include "hardware_interface/types/hardware_interface_return_values.hpp"
#include "rclcpp/macros.hpp"
#include "rclcpp_lifecycle/node_interfaces/lifecycle_node_interface.hpp"
#include "rclcpp_lifecycle/state.hpp"

#include "robstride_driver/supervisor.hpp"

namespace robstride_hw_interface
{

class RobstrideSystem : public hardware_interface::SystemInterface
{
public:
  RCLCPP_SHARED_PTR_DEFINITIONS(RobstrideSystem)

  hardware_interface::CallbackReturn on_init(
    const hardware_interface::HardwareInfo & info) override;

  // Opens the bus and starts the supervisor loop paused (telemetry only).
  hardware_interface::CallbackReturn on_configure(
    const rclcpp_lifecycle::State & previous_state) override;

  hardware_interface::CallbackReturn on_cleanup(
    const rclcpp_lifecycle::State & previous_state) override;

  std::vector<hardware_interface::StateInterface> export_state_interfaces() override;

  std::vector<hardware_interface::CommandInterface> export_command_interfaces() override;

  hardware_interface::CallbackReturn on_activate(
    const rclcpp_lifecycle::State & previous_state) override;

  // Zero torque and reset; the loop keeps polling until cleanup.
  hardware_interface::CallbackReturn on_deactivate(
    const rclcpp_lifecycle::State & previous_state) override;

  hardware_interface::return_type read(
    const rclcpp::Time & time, const rclcpp::Duration & period) override;

  hardware_interface::return_type write(
    const rclcpp::Time & time, const rclcpp::Duration & period) override;

private:
  bool should_log();

  std::unique_ptr<robstride_driver::Supervisor> supervisor_;
  robstride_driver::SupervisorConfig config_;

  //  Joint states (position, velocity, effort)
  std::vector<double> hw_commands_positions_;
  std::vector<double> hw_commands_velocities_;
  std::vector<double> hw_commands_efforts_;

  std::vector<double> hw_states_positions_;
  std::vector<double> hw_states_velocities_;
  std::vector<double> hw_states_efforts_;

  //  Joint index -> motor ID
  std::vector<uint8_t> motor_ids_;

  double kp_;
  double kd_;

  std::chrono::steady_clock::time_point last_log_{};
};

}  // namespace robstride_hw_interface

#endif  // ROBSTRIDE_HW_INTERFACE__ROBSTRIDE_SYSTEM_HPP_
