#include "execution_store.hpp"
#include "orchestrator.hpp"
#include "orchestrator_config.hpp"
#include "ros_event_bridge.hpp"
#include "zmq_dispatcher.hpp"

#include <ros/ros.h>

#include <iostream>
#include <memory>

// agent_orchestratord: hosts the orchestrator in a ROS node. Executions go to
// the worker service over ZeroMQ (simulated locally when it is unreachable),
// outcomes and metrics are recorded in SQLite, and events are republished on
// a ROS topic.
//
// Usage: agent_orchestratord [config.json]
int main(int argc, char** argv) {
    ros::init(argc, argv, "agent_orchestrator");
    try {
        OrchestratorConfig config = argc > 1 ? loadConfig(argv[1]) : OrchestratorConfig();

        auto random = std::make_shared<MersenneRandom>(config.rng_seed);
        auto simulator = std::make_shared<SimulatedDispatcher>(random, config.time_scale);
        auto dispatcher = std::make_shared<ZmqDispatcher>(config.worker_endpoint, config.worker_timeout_ms, simulator);

        // Declared first so it outlives any late events delivered while the orchestrator stops
        ExecutionStore store(config.database_path);

        Orchestrator orchestrator(config, dispatcher, nullptr, random);
        EventBus::Unsubscribe detach_store = store.attach(orchestrator.events());

        ros::NodeHandle ros_node;
        RosEventBridge bridge(ros_node, config.event_topic, orchestrator.events());

        auto detach_log = orchestrator.subscribe(EventType::AgentSpawned, [](const OrchestratorEvent& event) {
            for (const auto& agent : event.agents) {
                std::cout << "Spawned agent " << agent.id << " (" << agent.name << ")" << std::endl;
            }
        });

        orchestrator.start();
        for (const auto& spec : config.tasks) {
            std::string task_id = orchestrator.submitTask(spec);
            std::cout << "Submitted " << task_id << " (" << spec.type << ")" << std::endl;
        }

        ros::Rate rate(10);
        while (ros::ok()) {
            ros::spinOnce();
            rate.sleep();
        }

        orchestrator.stop();
        detach_log();
        detach_store();

        OrchestrationMetrics metrics = orchestrator.getMetrics();
        std::cout << "Tasks: " << metrics.total_tasks << ", Completed: " << metrics.completed_tasks
                  << ", Failed: " << metrics.failed_tasks << ", Queue: " << metrics.queue_length << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
