#ifndef ORCHESTRATOR_CONFIG_HPP
#define ORCHESTRATOR_CONFIG_HPP

#include "agent.hpp"
#include "task.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

struct OrchestratorConfig {
    // Scaling
    int max_pool_size = 20;
    double scale_load_threshold = 0.8;

    // Learning
    int learning_window = 10;
    double success_delta = 0.01;
    double failure_delta = -0.005;
    int task_history_capacity = 100;
    int adaptation_log_capacity = 500;

    // Execution
    int max_critical_retries = 3;
    double time_scale = 1.0;               // multiplier on simulated durations, 0 completes at once
    double execution_timeout_factor = 3.0; // watchdog, 0 disables
    bool enforce_dependencies = false;

    // Periodic tick
    int tick_interval_ms = 1000;
    double resource_drift = 0.1;

    bool seed_default_agents = true;
    unsigned int rng_seed = 42;

    // Peripheral services used by the daemon
    std::string database_path = "agent_orchestrator.db";
    std::string worker_endpoint = "tcp://localhost:5555";
    int worker_timeout_ms = 2000;
    std::string event_topic = "/agent_orchestrator/events";

    std::vector<Agent> agents;   // registered after the default roster
    std::vector<TaskSpec> tasks; // submitted by the daemon at startup
};

// Missing keys keep their defaults; wrongly typed values throw std::runtime_error
OrchestratorConfig configFromJson(const nlohmann::json& document);

// Throws std::runtime_error when the file cannot be read or parsed
OrchestratorConfig loadConfig(const std::string& path);

#endif // ORCHESTRATOR_CONFIG_HPP
