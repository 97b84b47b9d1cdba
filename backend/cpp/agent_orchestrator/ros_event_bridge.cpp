#include "ros_event_bridge.hpp"
#include "json_codec.hpp"

#include <std_msgs/String.h>

RosEventBridge::RosEventBridge(ros::NodeHandle& node, const std::string& topic, EventBus& bus)
    : event_publisher_(node.advertise<std_msgs::String>(topic, 100)) {
    unsubscribe_ = bus.subscribeAll([this](const OrchestratorEvent& event) { publish(event); });
}

RosEventBridge::~RosEventBridge() {
    if (unsubscribe_) {
        unsubscribe_();
    }
}

void RosEventBridge::publish(const OrchestratorEvent& event) {
    std_msgs::String msg;
    nlohmann::json event_data = event;
    msg.data = event_data.dump();
    event_publisher_.publish(msg);
}
