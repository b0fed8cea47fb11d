#ifndef ROBSTRIDE_DRIVER__MOTOR_MODEL_HPP_
#define ROBSTRIDE_DRIVER__MOTOR_MODEL_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace robstride_driver
{

// Closed interval used to quantize one field.
struct Range
{
  float min;
  float max;

  bool contains(float value) const;
};

// Protocol normalization ranges and firmware quirks of one actuator family.
// Adding a family means adding a table entry in motor_model.cpp.
struct MotorModel
{
  std::string name;        // "01", "02", ...
  Range position;          // rad
  Range velocity;          // rad/s
  Range kp;
  Range kd;
  Range torque;            // Nm
  bool zero_on_init;       // single-encoder motors lose their reference on power-up
  uint16_t can_timeout_index;  // parameter holding the CAN watchdog (units of 1/20 s)
};

// Throws ConfigurationError for an unknown model name. Accepts "01" and "robstride01".
const MotorModel & lookup_motor_model(const std::string & name);

// True if `name` names a model in the table.
bool is_motor_model(const std::string & name);

std::vector<std::string> motor_model_names();

}  // namespace robstride_driver

#endif  // ROBSTRIDE_DRIVER__MOTOR_MODEL_HPP_
