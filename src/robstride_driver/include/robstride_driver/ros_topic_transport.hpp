#ifndef ROBSTRIDE_DRIVER__ROS_TOPIC_TRANSPORT_HPP_
#define ROBSTRIDE_DRIVER__ROS_TOPIC_TRANSPORT_HPP_

#include <deque>
#include <memory>
#include <string>

#include "can_msgs/msg/frame.hpp"
#include "rclcpp/rclcpp.hpp"
#include "robstride_driver/transport.hpp"

namespace robstride_driver
{

/**
 * RosTopicTransport — exchanges frames with ros2_socketcan bridges.
 *
 * Data flow:
 *   send() → publish /to_can_bus (can_msgs/Frame) → socket_can_sender → HW
 *   HW → socket_can_receiver → /from_can_bus → rx callback → rx_queue_ → recv()
 *
 * The node is spun by recv() on the calling thread through a private executor,
 * so no executor thread is created and the loop thread remains the only user.
 */
class RosTopicTransport : public Transport
{
public:
  RosTopicTransport(const std::string & rx_topic, const std::string & tx_topic);
  ~RosTopicTransport() override;

  RosTopicTransport(const RosTopicTransport &) = delete;
  RosTopicTransport & operator=(const RosTopicTransport &) = delete;

  void send(const can_frame & frame) override;
  bool recv(can_frame & frame, std::chrono::microseconds timeout) override;
  void close() override;
  bool is_open() const override {return node_ != nullptr;}

  const char * kind() const override {return "ros";}
  std::string endpoint() const override {return rx_topic_ + ":" + tx_topic_;}

private:
  void rx_callback(const can_msgs::msg::Frame::SharedPtr msg);

  std::string rx_topic_;
  std::string tx_topic_;
  rclcpp::Node::SharedPtr node_;
  rclcpp::executors::SingleThreadedExecutor::SharedPtr executor_;
  rclcpp::Subscription<can_msgs::msg::Frame>::SharedPtr can_receive_;
  rclcpp::Publisher<can_msgs::msg::Frame>::SharedPtr can_send_;
  std::deque<can_frame> rx_queue_;
};

}  // namespace robstride_driver

#endif  // ROBSTRIDE_DRIVER__ROS_TOPIC_TRANSPORT_HPP_
