#include "robstride_driver/motor_driver.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

#include "rclcpp/rclcpp.hpp"

namespace robstride_driver
{

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("MotorDriver");
}

}  // namespace

MotorDriver::MotorDriver(
  std::unique_ptr<Transport> transport, const std::vector<MotorConfig> & motors,
  const DriverOptions & options)
: transport_(std::move(transport)), options_(options)
{
  if (!transport_) {
    throw ConfigurationError("no transport");
  }
  if (motors.empty()) {
    throw ConfigurationError("no motors to manage");
  }

  for (const auto & motor : motors) {
    if (sessions_.count(motor.id) != 0) {
      throw ConfigurationError("motor id " + std::to_string(motor.id) + " appears twice");
    }
    const MotorModel & model = lookup_motor_model(motor.model);
    models_.emplace(motor.id, model);
    sessions_.emplace(
      std::piecewise_construct, std::forward_as_tuple(motor.id),
      std::forward_as_tuple(motor.id, motor.name, model, options_.fault_after_failures));
    run_modes_[motor.id] = RunMode::kUnset;

    RCLCPP_INFO(
      logger(), "Motor 0x%02X '%s' (model %s) on %s:%s", motor.id, motor.name.c_str(),
      model.name.c_str(), transport_->kind(), transport_->endpoint().c_str());
  }
}

MotorDriver::~MotorDriver()
{
  close();
}

void MotorDriver::close()
{
  if (transport_ && transport_->is_open()) {
    transport_->close();
    RCLCPP_INFO(logger(), "Transport released");
  }
}

/**********************************Commands****************************/
std::map<uint8_t, RunMode> MotorDriver::send_get_mode()
{
  std::map<uint8_t, RunMode> modes;
  for (auto & entry : sessions_) {
    MotorSession & session = entry.second;
    can_frame reply;
    if (exchange(session, frame_codec::GetMode{}, CommType::kParamRead, reply) !=
      Exchange::kReply)
    {
      continue;
    }
    frame_codec::ParameterReply param;
    const DecodeStatus status = frame_codec::decode_parameter_reply(reply, models_, param);
    if (status != DecodeStatus::kOk || param.index != kParamRunMode) {
      session.on_decode_error(
        status != DecodeStatus::kOk ? status : DecodeStatus::kUnexpectedCommand);
      continue;
    }
    session.on_status(param.mode, param.faults);
    const RunMode mode = static_cast<RunMode>(param.as_uint8());
    run_modes_[entry.first] = mode;
    modes[entry.first] = mode;
  }
  return modes;
}

FeedbackMap MotorDriver::send_set_zero(const std::optional<MotorIds> & motor_ids)
{
  const MotorIds ids = resolve(motor_ids);
  FeedbackMap feedback;

  for (uint8_t id : ids) {
    MotorSession & session = session_ref(id);
    const bool was_running = session.state() == SessionState::kRunning;
    can_frame reply;

    // The firmware only takes a new zero while stopped.
    if (was_running) {
      if (exchange(session, frame_codec::Reset{false}, CommType::kFeedback, reply) ==
        Exchange::kReply)
      {
        apply_feedback(session, reply);
      }
    }

    const Exchange zeroed = exchange(session, frame_codec::SetZero{}, CommType::kFeedback, reply);
    if (zeroed != Exchange::kNotSent) {
      session.on_zeroed();
      RCLCPP_INFO(logger(), "Motor 0x%02X zeroed", id);
    }
    if (zeroed == Exchange::kReply) {
      apply_feedback(session, reply);
    }

    if (was_running) {
      if (exchange(session, frame_codec::Start{}, CommType::kFeedback, reply) ==
        Exchange::kReply && apply_feedback(session, reply))
      {
        session.on_start();
      }
    }

    if (session.fresh()) {
      feedback[id] = session.latest_feedback();
    }
  }
  return feedback;
}

FeedbackMap MotorDriver::send_reset(const std::optional<MotorIds> & motor_ids)
{
  const MotorIds ids = resolve(motor_ids);
  FeedbackMap feedback;

  for (uint8_t id : ids) {
    MotorSession & session = session_ref(id);
    const bool clear_faults = session.state() == SessionState::kFault;
    can_frame reply;
    const Exchange result =
      exchange(session, frame_codec::Reset{clear_faults}, CommType::kFeedback, reply);
    if (result == Exchange::kNotSent) {
      continue;
    }
    if (clear_faults) {
      RCLCPP_INFO(
        logger(), "Motor 0x%02X reset, clearing faults 0x%04X", id, session.faults());
    }
    session.on_reset();
    if (result == Exchange::kReply && apply_feedback(session, reply)) {
      feedback[id] = session.latest_feedback();
    }
  }
  return feedback;
}

FeedbackMap MotorDriver::send_start(const std::optional<MotorIds> & motor_ids)
{
  const MotorIds ids = resolve(motor_ids);
  FeedbackMap feedback;

  for (uint8_t id : ids) {
    MotorSession & session = session_ref(id);
    can_frame reply;
    const Exchange result = exchange(session, frame_codec::Start{}, CommType::kFeedback, reply);
    if (result == Exchange::kNotSent) {
      continue;
    }
    session.on_start();
    if (result == Exchange::kReply && apply_feedback(session, reply)) {
      feedback[id] = session.latest_feedback();
    }
  }
  return feedback;
}

FeedbackMap MotorDriver::send_motor_controls(const std::map<uint8_t, MotorControlParams> & params)
{
  // Reject the whole batch before touching the bus.
  for (const auto & entry : params) {
    const MotorSession & session = session_ref(entry.first);
    frame_codec::validate(entry.second, session.model());
  }

  FeedbackMap feedback;
  for (const auto & entry : params) {
    MotorSession & session = session_ref(entry.first);

    if (!session.accepts_setpoints()) {
      warn(session, "faulted, polling instead of commanding until reset");
      if (poll_one(session)) {
        feedback[entry.first] = session.latest_feedback();
      }
      continue;
    }
    if (!ensure_mit_mode(session)) {
      continue;
    }
    // The mode switch reply may be the first to report a fault.
    if (!session.accepts_setpoints()) {
      feedback[entry.first] = session.latest_feedback();
      continue;
    }

    can_frame reply;
    const Exchange result =
      exchange(session, frame_codec::SetControls{entry.second}, CommType::kFeedback, reply);
    if (result == Exchange::kNotSent) {
      continue;
    }
    session.on_setpoint(entry.second);
    if (result == Exchange::kReply && apply_feedback(session, reply)) {
      feedback[entry.first] = session.latest_feedback();
    }
  }
  return feedback;
}

FeedbackMap MotorDriver::send_torque_controls(const std::map<uint8_t, float> & torques)
{
  for (const auto & entry : torques) {
    const MotorSession & session = session_ref(entry.first);
    MotorControlParams params;
    params.torque = entry.second;
    frame_codec::validate(params, session.model());
  }

  FeedbackMap feedback;
  for (const auto & entry : torques) {
    MotorSession & session = session_ref(entry.first);

    if (!session.accepts_setpoints()) {
      warn(session, "faulted, polling instead of commanding until reset");
      if (poll_one(session)) {
        feedback[entry.first] = session.latest_feedback();
      }
      continue;
    }
    if (!ensure_mit_mode(session)) {
      continue;
    }
    // The mode switch reply may be the first to report a fault.
    if (!session.accepts_setpoints()) {
      feedback[entry.first] = session.latest_feedback();
      continue;
    }

    can_frame reply;
    const Exchange result =
      exchange(session, frame_codec::SetTorque{entry.second}, CommType::kFeedback, reply);
    if (result == Exchange::kNotSent) {
      continue;
    }
    MotorControlParams setpoint;
    setpoint.torque = entry.second;
    session.on_setpoint(setpoint);
    if (result == Exchange::kReply && apply_feedback(session, reply)) {
      feedback[entry.first] = session.latest_feedback();
    }
  }
  return feedback;
}

FeedbackMap MotorDriver::poll_feedback(const std::optional<MotorIds> & motor_ids)
{
  const MotorIds ids = resolve(motor_ids);
  FeedbackMap feedback;
  for (uint8_t id : ids) {
    MotorSession & session = session_ref(id);
    if (poll_one(session)) {
      feedback[id] = session.latest_feedback();
    }
  }
  return feedback;
}

FeedbackMap MotorDriver::send_can_timeout(float seconds)
{
  if (!std::isfinite(seconds) || seconds < 0.0f) {
    throw ValidationError("CAN timeout must be a non-negative number of seconds");
  }
  const uint32_t ticks =
    static_cast<uint32_t>(std::min(std::round(seconds * 20.0f), 100000.0f));

  FeedbackMap feedback;
  for (auto & entry : sessions_) {
    MotorSession & session = entry.second;
    const uint16_t index = session.model().can_timeout_index;

    // Skip the flash write when the register already holds the value.
    frame_codec::ParameterReply current;
    DecodeStatus status;
    if (read_param(session, index, current, status) == Exchange::kReply &&
      current.as_uint16() == ticks)
    {
      RCLCPP_DEBUG(logger(), "Motor 0x%02X already has CAN timeout %u", entry.first, ticks);
      continue;
    }

    can_frame reply;
    const frame_codec::WriteParameter write{index, ticks, frame_codec::kParamTypeU32};
    if (exchange(session, write, CommType::kFeedback, reply) == Exchange::kReply &&
      apply_feedback(session, reply))
    {
      feedback[entry.first] = session.latest_feedback();
    }
  }
  RCLCPP_INFO(logger(), "CAN timeout set to %.2f s (%u ticks)", seconds, ticks);
  return feedback;
}

/**********************************Queries****************************/
std::map<uint8_t, float> MotorDriver::read_can_timeouts()
{
  std::map<uint8_t, float> timeouts;
  for (auto & entry : sessions_) {
    frame_codec::ParameterReply param;
    DecodeStatus status;
    if (read_param(entry.second, entry.second.model().can_timeout_index, param, status) ==
      Exchange::kReply)
    {
      timeouts[entry.first] = static_cast<float>(param.as_uint16()) / 20.0f;
    }
  }
  return timeouts;
}

std::map<uint8_t, std::string> MotorDriver::read_names()
{
  return read_string_params(kParamName, 4);
}

std::map<uint8_t, std::string> MotorDriver::read_bar_codes()
{
  return read_string_params(kParamBarCode, 4);
}

std::map<uint8_t, std::string> MotorDriver::read_build_dates()
{
  return read_string_params(kParamBuildDate, 3);
}

frame_codec::ParameterReply MotorDriver::read_parameter(uint8_t motor_id, uint16_t index)
{
  MotorSession & session = session_ref(motor_id);

  std::ostringstream what;
  what << "parameter 0x" << std::hex << std::setw(4) << std::setfill('0') << index <<
    " of motor 0x" << std::setw(2) << static_cast<unsigned int>(motor_id);

  frame_codec::ParameterReply param;
  DecodeStatus status;
  switch (read_param(session, index, param, status)) {
    case Exchange::kReply:
      return param;
    case Exchange::kNotSent:
      throw IoError("could not request " + what.str());
    case Exchange::kNoReply:
      break;
  }
  if (status != DecodeStatus::kOk) {
    throw DecodeError(status, what.str());
  }
  throw TimeoutError(what.str());
}

/**********************************Cache****************************/
FeedbackMap MotorDriver::get_latest_feedback() const
{
  FeedbackMap feedback;
  for (const auto & entry : sessions_) {
    feedback[entry.first] = entry.second.latest_feedback();
  }
  return feedback;
}

MotorFeedback MotorDriver::get_latest_feedback_for(uint8_t motor_id) const
{
  return session(motor_id).latest_feedback();
}

const MotorSession & MotorDriver::session(uint8_t motor_id) const
{
  const auto it = sessions_.find(motor_id);
  if (it == sessions_.end()) {
    throw UnknownMotorError(motor_id);
  }
  return it->second;
}

MotorIds MotorDriver::motor_ids() const
{
  MotorIds ids;
  for (const auto & entry : sessions_) {
    ids.push_back(entry.first);
  }
  return ids;
}

void MotorDriver::mark_all_stale()
{
  for (auto & entry : sessions_) {
    entry.second.mark_stale();
  }
}

/**********************************Internals****************************/
MotorSession & MotorDriver::session_ref(uint8_t motor_id)
{
  const auto it = sessions_.find(motor_id);
  if (it == sessions_.end()) {
    throw UnknownMotorError(motor_id);
  }
  return it->second;
}

MotorIds MotorDriver::resolve(const std::optional<MotorIds> & requested) const
{
  if (!requested) {
    return motor_ids();
  }
  std::set<uint8_t> unique;
  for (uint8_t id : *requested) {
    if (sessions_.count(id) == 0) {
      throw UnknownMotorError(id);
    }
    unique.insert(id);
  }
  return MotorIds(unique.begin(), unique.end());
}

MotorDriver::Exchange MotorDriver::exchange(
  MotorSession & session, const frame_codec::Command & command, CommType reply_type,
  can_frame & reply)
{
  if (!send_request(session, command)) {
    return Exchange::kNotSent;
  }
  return await_reply(session, reply_type, reply);
}

bool MotorDriver::send_request(MotorSession & session, const frame_codec::Command & command)
{
  const can_frame request =
    frame_codec::encode_command(command, session.motor_id(), session.model(), options_.host_id);

  if (!transport_ || !transport_->is_open()) {
    throw TransportLostError("transport is closed");
  }

  try {
    transport_->send(request);
  } catch (const TransportLostError &) {
    throw;
  } catch (const IoError & e) {
    session.on_io_error();
    warn(session, e.what());
    return false;
  }
  return true;
}

MotorDriver::Exchange MotorDriver::await_reply(
  MotorSession & session, CommType reply_type, can_frame & reply)
{
  const uint8_t id = session.motor_id();
  const auto deadline = std::chrono::steady_clock::now() + options_.reply_timeout;
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      session.on_timeout();
      warn(session, "no reply");
      return Exchange::kNoReply;
    }

    can_frame frame;
    bool received = false;
    try {
      received = transport_->recv(
        frame, std::chrono::duration_cast<std::chrono::microseconds>(deadline - now));
    } catch (const TransportLostError &) {
      throw;
    } catch (const IoError & e) {
      session.on_io_error();
      warn(session, e.what());
      return Exchange::kNoReply;
    }
    if (!received) {
      continue;
    }

    if (!(frame.can_id & CAN_EFF_FLAG) || frame_codec::reply_motor_id(frame.can_id) != id) {
      ingest(frame);
      continue;
    }

    const uint8_t type = frame_codec::comm_type_of(frame.can_id);
    if (!is_known_comm_type(type)) {
      session.on_decode_error(DecodeStatus::kUnknownCommand);
      warn(session, "reply with unknown command byte");
      return Exchange::kNoReply;
    }
    if (type != static_cast<uint8_t>(reply_type)) {
      // A late reply to an earlier command or an unsolicited fault report.
      ingest(frame);
      continue;
    }

    reply = frame;
    return Exchange::kReply;
  }
}

MotorDriver::Exchange MotorDriver::read_param(
  MotorSession & session, uint16_t index, frame_codec::ParameterReply & param,
  DecodeStatus & status)
{
  status = DecodeStatus::kOk;
  can_frame reply;
  const Exchange result =
    exchange(session, frame_codec::ReadParameter{index}, CommType::kParamRead, reply);
  if (result != Exchange::kReply) {
    return result;
  }

  status = frame_codec::decode_parameter_reply(reply, models_, param);
  if (status == DecodeStatus::kOk && param.index != index) {
    status = DecodeStatus::kUnexpectedCommand;
  }
  if (status != DecodeStatus::kOk) {
    session.on_decode_error(status);
    warn(session, std::string("unusable parameter reply: ") + to_string(status));
    return Exchange::kNoReply;
  }
  session.on_status(param.mode, param.faults);
  return Exchange::kReply;
}

bool MotorDriver::read_string_param(
  MotorSession & session, uint16_t index, int frames, std::string & out)
{
  if (!send_request(session, frame_codec::ReadParameter{index})) {
    return false;
  }

  out.clear();
  for (int i = 0; i < frames; ++i) {
    can_frame reply;
    if (await_reply(session, CommType::kParamRead, reply) != Exchange::kReply) {
      return false;
    }
    frame_codec::ParameterReply param;
    DecodeStatus status = frame_codec::decode_parameter_reply(reply, models_, param);
    if (status == DecodeStatus::kOk && param.index != index) {
      status = DecodeStatus::kUnexpectedCommand;
    }
    if (status != DecodeStatus::kOk) {
      session.on_decode_error(status);
      warn(session, std::string("unusable string reply: ") + to_string(status));
      return false;
    }
    session.on_status(param.mode, param.faults);
    for (uint8_t c : param.value) {
      if (c != '\0') {
        out.push_back(static_cast<char>(c));
      }
    }
  }
  return true;
}

std::map<uint8_t, std::string> MotorDriver::read_string_params(uint16_t index, int frames)
{
  std::map<uint8_t, std::string> values;
  for (auto & entry : sessions_) {
    std::string value;
    if (read_string_param(entry.second, index, frames, value)) {
      values[entry.first] = value;
    }
  }
  return values;
}

bool MotorDriver::apply_feedback(MotorSession & session, const can_frame & reply)
{
  MotorFeedback feedback;
  const DecodeStatus status = frame_codec::decode_feedback(reply, models_, feedback);
  if (status != DecodeStatus::kOk) {
    session.on_decode_error(status);
    warn(session, std::string("undecodable feedback: ") + to_string(status));
    return false;
  }
  const bool was_faulted = session.state() == SessionState::kFault;
  session.on_feedback(feedback);
  if (!was_faulted && session.state() == SessionState::kFault) {
    RCLCPP_ERROR(
      logger(), "Motor 0x%02X reported faults 0x%04X", session.motor_id(), feedback.faults);
  }
  return true;
}

void MotorDriver::ingest(const can_frame & frame)
{
  const uint8_t type = frame_codec::comm_type_of(frame.can_id);
  if (type == static_cast<uint8_t>(CommType::kFeedback)) {
    MotorFeedback feedback;
    if (frame_codec::decode_feedback(frame, models_, feedback) == DecodeStatus::kOk) {
      session_ref(feedback.motor_id).on_feedback(feedback);
      return;
    }
  } else if (type == static_cast<uint8_t>(CommType::kParamRead)) {
    frame_codec::ParameterReply param;
    if (frame_codec::decode_parameter_reply(frame, models_, param) == DecodeStatus::kOk) {
      session_ref(param.motor_id).on_status(param.mode, param.faults);
      return;
    }
  }
  RCLCPP_DEBUG(logger(), "Dropped stray frame 0x%08X", frame.can_id & CAN_EFF_MASK);
}

bool MotorDriver::poll_one(MotorSession & session)
{
  frame_codec::ParameterReply param;
  DecodeStatus status;

  if (read_param(session, kParamMechPos, param, status) != Exchange::kReply) {
    return false;
  }
  session.on_position(param.as_float());

  if (read_param(session, kParamMechVel, param, status) != Exchange::kReply) {
    return false;
  }
  session.on_velocity(param.as_float());
  return true;
}

bool MotorDriver::ensure_mit_mode(MotorSession & session)
{
  RunMode & mode = run_modes_[session.motor_id()];
  if (mode == RunMode::kMit) {
    return true;
  }

  can_frame reply;
  const frame_codec::WriteParameter write{
    kParamRunMode, static_cast<uint32_t>(RunMode::kMit)};
  if (exchange(session, write, CommType::kFeedback, reply) != Exchange::kReply ||
    !apply_feedback(session, reply))
  {
    return false;
  }
  mode = RunMode::kMit;
  RCLCPP_INFO(logger(), "Motor 0x%02X switched to MIT mode", session.motor_id());
  return true;
}

void MotorDriver::warn(MotorSession & session, const std::string & what)
{
  if (session.should_log(std::chrono::steady_clock::now())) {
    RCLCPP_WARN(
      logger(), "Motor 0x%02X (%s): %s [%lu failures]", session.motor_id(),
      session.name().c_str(), what.c_str(),
      static_cast<unsigned long>(session.total_failures()));
  }
}

}  // namespace robstride_driver
