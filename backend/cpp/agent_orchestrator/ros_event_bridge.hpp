#ifndef ROS_EVENT_BRIDGE_HPP
#define ROS_EVENT_BRIDGE_HPP

#include "event_bus.hpp"

#include <ros/ros.h>

#include <string>

// Republishes every orchestrator event as a JSON std_msgs/String so display
// and notification nodes can follow task and agent state.
class RosEventBridge {
public:
    RosEventBridge(ros::NodeHandle& node, const std::string& topic, EventBus& bus);
    ~RosEventBridge();

    RosEventBridge(const RosEventBridge&) = delete;
    RosEventBridge& operator=(const RosEventBridge&) = delete;

private:
    void publish(const OrchestratorEvent& event);

    ros::Publisher event_publisher_; // ROS publisher for orchestrator events
    EventBus::Unsubscribe unsubscribe_;
};

#endif // ROS_EVENT_BRIDGE_HPP
