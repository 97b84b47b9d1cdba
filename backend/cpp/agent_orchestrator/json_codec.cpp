#include "json_codec.hpp"

#include <stdexcept>

void to_json(nlohmann::json& j, const Capability& capability) {
    j = nlohmann::json{{"type", toString(capability.type)},
                       {"level", capability.level},
                       {"specializations", capability.specializations},
                       {"resource_cost", capability.resource_cost},
                       {"max_concurrent_tasks", capability.max_concurrent_tasks}};
}

void from_json(const nlohmann::json& j, Capability& capability) {
    capability.type = parseCapabilityType(j.at("type").get<std::string>());
    capability.level = j.at("level").get<double>();
    capability.specializations = j.value("specializations", std::set<std::string>{});
    capability.resource_cost = j.value("resource_cost", 0.0);
    capability.max_concurrent_tasks = j.value("max_concurrent_tasks", 1);
}

void to_json(nlohmann::json& j, const Agent& agent) {
    nlohmann::json history = nlohmann::json::array();
    for (const auto& record : agent.learning_data.task_history) {
        history.push_back({{"task_type", record.task_type},
                           {"duration_ms", record.duration_ms},
                           {"success", record.success}});
    }
    nlohmann::json adaptations = nlohmann::json::array();
    for (const auto& adaptation : agent.learning_data.adaptations) {
        adaptations.push_back({{"capability", toString(adaptation.capability)},
                               {"delta", adaptation.delta},
                               {"timestamp", toEpochMillis(adaptation.timestamp)}});
    }

    j = nlohmann::json{
        {"id", agent.id},
        {"name", agent.name},
        {"capabilities", agent.capabilities},
        {"status", toString(agent.status)},
        {"current_tasks", agent.current_tasks},
        {"performance",
         {{"tasks_completed", agent.performance.tasks_completed},
          {"average_completion_time", agent.performance.average_completion_time},
          {"success_rate", agent.performance.success_rate},
          {"efficiency", agent.performance.efficiency},
          {"last_active", toEpochMillis(agent.performance.last_active)}}},
        {"resources",
         {{"cpu", agent.resources.cpu}, {"memory", agent.resources.memory}, {"network", agent.resources.network}}},
        {"location", {{"x", agent.location.x}, {"y", agent.location.y}}},
        {"connections", agent.connections},
        {"learning_data", {{"task_history", history}, {"adaptations", adaptations}}}};
}

// Reads an agent definition as written in a config file. Runtime state
// (current tasks, learning data) always starts empty.
void from_json(const nlohmann::json& j, Agent& agent) {
    agent = Agent{};
    agent.id = j.at("id").get<std::string>();
    agent.name = j.value("name", agent.id);
    agent.capabilities = j.at("capabilities").get<std::vector<Capability>>();
    if (j.contains("status")) {
        agent.status = parseAgentStatus(j.at("status").get<std::string>());
    }
    if (j.contains("performance")) {
        const auto& performance = j.at("performance");
        agent.performance.success_rate = performance.value("success_rate", agent.performance.success_rate);
        agent.performance.efficiency = performance.value("efficiency", agent.performance.efficiency);
    }
    if (j.contains("resources")) {
        const auto& resources = j.at("resources");
        agent.resources.cpu = resources.value("cpu", 0.0);
        agent.resources.memory = resources.value("memory", 0.0);
        agent.resources.network = resources.value("network", 0.0);
    }
    if (j.contains("location")) {
        agent.location.x = j.at("location").value("x", 0.0);
        agent.location.y = j.at("location").value("y", 0.0);
    }
    agent.connections = j.value("connections", std::set<std::string>{});
}

void to_json(nlohmann::json& j, const Task& task) {
    nlohmann::json required = nlohmann::json::array();
    for (CapabilityType type : task.required_capabilities) {
        required.push_back(toString(type));
    }

    j = nlohmann::json{{"id", task.id},
                       {"type", task.type},
                       {"priority", toString(task.priority)},
                       {"complexity", task.complexity},
                       {"required_capabilities", required},
                       {"payload", task.payload},
                       {"dependencies", task.dependencies},
                       {"status", toString(task.status)},
                       {"assigned_agents", task.assigned_agents},
                       {"created_at", toEpochMillis(task.created_at)},
                       {"estimated_duration", task.estimated_duration},
                       {"attempts", task.attempts}};
    j["actual_duration"] = task.actual_duration ? nlohmann::json(*task.actual_duration) : nlohmann::json(nullptr);
    j["deadline"] = task.deadline ? nlohmann::json(toEpochMillis(*task.deadline)) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, TaskSpec& spec) {
    spec = TaskSpec{};
    spec.type = j.at("type").get<std::string>();
    spec.priority = parseTaskPriority(j.value("priority", std::string("medium")));
    spec.complexity = j.at("complexity").get<int>();
    for (const auto& name : j.at("required_capabilities")) {
        spec.required_capabilities.push_back(parseCapabilityType(name.get<std::string>()));
    }
    spec.payload = j.value("payload", nlohmann::json::object());
    spec.dependencies = j.value("dependencies", std::set<std::string>{});
    spec.estimated_duration = j.value("estimated_duration", 0.0);
    if (j.contains("deadline") && !j.at("deadline").is_null()) {
        spec.deadline = fromEpochMillis(j.at("deadline").get<std::int64_t>());
    }
}

void to_json(nlohmann::json& j, const OrchestrationMetrics& metrics) {
    j = nlohmann::json{{"total_tasks", metrics.total_tasks},
                       {"completed_tasks", metrics.completed_tasks},
                       {"failed_tasks", metrics.failed_tasks},
                       {"retried_tasks", metrics.retried_tasks},
                       {"average_task_time", metrics.average_task_time},
                       {"system_load", metrics.system_load},
                       {"agent_utilization", metrics.agent_utilization},
                       {"network_efficiency", metrics.network_efficiency},
                       {"queue_length", metrics.queue_length}};
}

void to_json(nlohmann::json& j, const OrchestratorEvent& event) {
    j = nlohmann::json{{"event", toString(event.type)}};
    if (event.task) {
        j["task"] = *event.task;
    }
    if (!event.agents.empty()) {
        j["agents"] = event.agents;
    }
    if (event.metrics) {
        j["metrics"] = *event.metrics;
    }
}
