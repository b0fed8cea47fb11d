#include "robstride_driver/motor_model.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "robstride_driver/errors.hpp"

namespace robstride_driver
{

namespace
{

// Values from the vendor manuals. Type 02 has not shipped; its entry mirrors type 01.
const std::vector<MotorModel> & model_table()
{
  static const std::vector<MotorModel> table = {
    {"01", {-12.5f, 12.5f}, {-44.0f, 44.0f}, {0.0f, 500.0f}, {0.0f, 5.0f}, {-12.0f, 12.0f},
      true, 0x200c},
    {"02", {-12.5f, 12.5f}, {-44.0f, 44.0f}, {0.0f, 500.0f}, {0.0f, 5.0f}, {-12.0f, 12.0f},
      false, 0x200b},
    {"03", {-12.5f, 12.5f}, {-20.0f, 20.0f}, {0.0f, 5000.0f}, {0.0f, 100.0f}, {-60.0f, 60.0f},
      false, 0x200b},
    {"04", {-12.5f, 12.5f}, {-15.0f, 15.0f}, {0.0f, 5000.0f}, {0.0f, 100.0f}, {-120.0f, 120.0f},
      false, 0x200b},
  };
  return table;
}

std::string normalize(const std::string & name)
{
  std::string lowered(name);
  std::transform(
    lowered.begin(), lowered.end(), lowered.begin(),
    [](unsigned char c) {return static_cast<char>(std::tolower(c));});
  const std::string prefix = "robstride";
  if (lowered.compare(0, prefix.size(), prefix) == 0) {
    lowered.erase(0, prefix.size());
  }
  return lowered;
}

const MotorModel * find_model(const std::string & name)
{
  const std::string key = normalize(name);
  for (const auto & model : model_table()) {
    if (model.name == key) {
      return &model;
    }
  }
  return nullptr;
}

}  // namespace

bool Range::contains(float value) const
{
  return std::isfinite(value) && value >= min && value <= max;
}

const MotorModel & lookup_motor_model(const std::string & name)
{
  const MotorModel * model = find_model(name);
  if (model == nullptr) {
    std::string known;
    for (const auto & candidate : motor_model_names()) {
      known += known.empty() ? candidate : ", " + candidate;
    }
    throw ConfigurationError("unknown motor model '" + name + "' (expected one of " + known + ")");
  }
  return *model;
}

bool is_motor_model(const std::string & name)
{
  return find_model(name) != nullptr;
}

std::vector<std::string> motor_model_names()
{
  std::vector<std::string> names;
  for (const auto & model : model_table()) {
    names.push_back(model.name);
  }
  return names;
}

}  // namespace robstride_driver
