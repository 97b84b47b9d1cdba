#include "orchestrator_config.hpp"
#include "json_codec.hpp"

#include <fstream>
#include <stdexcept>

namespace {

template <typename T>
void readValue(const nlohmann::json& document, const char* key, T& target) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config value for " + std::string(key) + ": " + e.what());
    }
}

} // namespace

OrchestratorConfig configFromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Config document must be a JSON object");
    }

    OrchestratorConfig config;
    readValue(document, "max_pool_size", config.max_pool_size);
    readValue(document, "scale_load_threshold", config.scale_load_threshold);
    readValue(document, "learning_window", config.learning_window);
    readValue(document, "success_delta", config.success_delta);
    readValue(document, "failure_delta", config.failure_delta);
    readValue(document, "task_history_capacity", config.task_history_capacity);
    readValue(document, "adaptation_log_capacity", config.adaptation_log_capacity);
    readValue(document, "max_critical_retries", config.max_critical_retries);
    readValue(document, "time_scale", config.time_scale);
    readValue(document, "execution_timeout_factor", config.execution_timeout_factor);
    readValue(document, "enforce_dependencies", config.enforce_dependencies);
    readValue(document, "tick_interval_ms", config.tick_interval_ms);
    readValue(document, "resource_drift", config.resource_drift);
    readValue(document, "seed_default_agents", config.seed_default_agents);
    readValue(document, "rng_seed", config.rng_seed);
    readValue(document, "database_path", config.database_path);
    readValue(document, "worker_endpoint", config.worker_endpoint);
    readValue(document, "worker_timeout_ms", config.worker_timeout_ms);
    readValue(document, "event_topic", config.event_topic);

    // Agent and task definitions may also fail with std::invalid_argument on
    // unknown enum names; report both the same way.
    try {
        readValue(document, "agents", config.agents);
        readValue(document, "tasks", config.tasks);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config entry: ") + e.what());
    }

    if (config.max_pool_size < 1) {
        throw std::runtime_error("max_pool_size must be at least 1");
    }
    if (config.learning_window < 1 || config.task_history_capacity < config.learning_window) {
        throw std::runtime_error("task_history_capacity must be at least learning_window, which must be positive");
    }
    if (config.tick_interval_ms <= 0) {
        throw std::runtime_error("tick_interval_ms must be positive");
    }
    if (config.time_scale < 0.0 || config.execution_timeout_factor < 0.0 || config.max_critical_retries < 0) {
        throw std::runtime_error("time_scale, execution_timeout_factor and max_critical_retries must not be negative");
    }
    return config;
}

OrchestratorConfig loadConfig(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    nlohmann::json document;
    try {
        input >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }
    return configFromJson(document);
}
