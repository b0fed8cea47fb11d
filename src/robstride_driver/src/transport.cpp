#include "robstride_driver/transport.hpp"

#include "robstride_driver/errors.hpp"
#include "robstride_driver/ros_topic_transport.hpp"
#include "robstride_driver/serial_transport.hpp"
#include "robstride_driver/socketcan_transport.hpp"

namespace robstride_driver
{

std::unique_ptr<Transport> make_transport(const std::string & endpoint)
{
  if (endpoint.empty()) {
    throw ConfigurationError("empty bus endpoint");
  }

  if (endpoint == "ros") {
    return std::make_unique<RosTopicTransport>("/from_can_bus", "/to_can_bus");
  }
  if (endpoint.compare(0, 4, "ros:") == 0) {
    const std::string topics = endpoint.substr(4);
    const auto split = topics.find(':');
    if (split == std::string::npos || split == 0 || split + 1 == topics.size()) {
      throw ConfigurationError(
        "expected 'ros:<rx_topic>:<tx_topic>', got '" + endpoint + "'");
    }
    return std::make_unique<RosTopicTransport>(topics.substr(0, split), topics.substr(split + 1));
  }
  if (endpoint.compare(0, 5, "/dev/") == 0) {
    return std::make_unique<SerialTransport>(endpoint);
  }
  return std::make_unique<SocketCanTransport>(endpoint);
}

}  // namespace robstride_driver
