#ifndef JSON_CODEC_HPP
#define JSON_CODEC_HPP

#include "agent.hpp"
#include "event_bus.hpp"
#include "metrics.hpp"
#include "task.hpp"

#include <nlohmann/json.hpp>

// nlohmann::json conversions found by ADL. Keys are snake_case and timestamps
// are milliseconds since the Unix epoch.

void to_json(nlohmann::json& j, const Capability& capability);
void from_json(const nlohmann::json& j, Capability& capability);

void to_json(nlohmann::json& j, const Agent& agent);
void from_json(const nlohmann::json& j, Agent& agent);

void to_json(nlohmann::json& j, const Task& task);
void from_json(const nlohmann::json& j, TaskSpec& spec);

void to_json(nlohmann::json& j, const OrchestrationMetrics& metrics);

void to_json(nlohmann::json& j, const OrchestratorEvent& event);

#endif // JSON_CODEC_HPP
