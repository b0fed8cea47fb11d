#include "robstride_driver/ros_topic_transport.hpp"

#include <algorithm>
#include <cstring>

#include "robstride_driver/errors.hpp"

namespace robstride_driver
{

RosTopicTransport::RosTopicTransport(const std::string & rx_topic, const std::string & tx_topic)
: rx_topic_(rx_topic), tx_topic_(tx_topic)
{
  if (!rclcpp::ok()) {
    throw ConfigurationError("rclcpp must be initialized before opening a ROS CAN transport");
  }

  node_ = std::make_shared<rclcpp::Node>("robstride_can_bridge");
  can_receive_ = node_->create_subscription<can_msgs::msg::Frame>(
    rx_topic_, 100,
    std::bind(&RosTopicTransport::rx_callback, this, std::placeholders::_1));
  can_send_ = node_->create_publisher<can_msgs::msg::Frame>(tx_topic_, 100);

  executor_ = std::make_shared<rclcpp::executors::SingleThreadedExecutor>();
  executor_->add_node(node_);

  RCLCPP_INFO(
    node_->get_logger(), "Bridging CAN frames: rx %s, tx %s", rx_topic_.c_str(),
    tx_topic_.c_str());
}

RosTopicTransport::~RosTopicTransport()
{
  close();
}

void RosTopicTransport::send(const can_frame & frame)
{
  if (!node_ || !rclcpp::ok()) {
    throw TransportLostError("ROS context is shut down");
  }

  can_msgs::msg::Frame cansendata;
  cansendata.header.stamp = node_->now();
  cansendata.is_extended = (frame.can_id & CAN_EFF_FLAG) != 0;
  cansendata.is_rtr = (frame.can_id & CAN_RTR_FLAG) != 0;
  cansendata.is_error = false;
  cansendata.id = cansendata.is_extended ? (frame.can_id & CAN_EFF_MASK) :
    (frame.can_id & CAN_SFF_MASK);
  cansendata.dlc = std::min<uint8_t>(frame.can_dlc, 8);
  std::copy(frame.data, frame.data + cansendata.dlc, cansendata.data.begin());

  can_send_->publish(cansendata);
}

bool RosTopicTransport::recv(can_frame & frame, std::chrono::microseconds timeout)
{
  if (!node_ || !rclcpp::ok()) {
    throw TransportLostError("ROS context is shut down");
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (rx_queue_.empty()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    executor_->spin_once(deadline - now);
    if (!rclcpp::ok()) {
      throw TransportLostError("ROS context is shut down");
    }
  }

  frame = rx_queue_.front();
  rx_queue_.pop_front();
  return true;
}

void RosTopicTransport::close()
{
  if (node_) {
    executor_->remove_node(node_);
    can_receive_.reset();
    can_send_.reset();
    executor_.reset();
    node_.reset();
    rx_queue_.clear();
  }
}

void RosTopicTransport::rx_callback(const can_msgs::msg::Frame::SharedPtr msg)
{
  if (msg->is_error) {
    return;
  }

  can_frame frame;
  std::memset(&frame, 0, sizeof(frame));
  frame.can_id = msg->is_extended ? ((msg->id & CAN_EFF_MASK) | CAN_EFF_FLAG) :
    (msg->id & CAN_SFF_MASK);
  if (msg->is_rtr) {
    frame.can_id |= CAN_RTR_FLAG;
  }
  frame.can_dlc = std::min<uint8_t>(msg->dlc, 8);
  std::copy(msg->data.begin(), msg->data.begin() + frame.can_dlc, frame.data);
  rx_queue_.push_back(frame);
}

}  // namespace robstride_driver
