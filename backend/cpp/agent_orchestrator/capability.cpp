#include "capability.hpp"

#include <algorithm>
#include <stdexcept>

std::string toString(CapabilityType type) {
    switch (type) {
    case CapabilityType::Nlp: return "nlp";
    case CapabilityType::Quantum: return "quantum";
    case CapabilityType::Swarm: return "swarm";
    case CapabilityType::Compliance: return "compliance";
    case CapabilityType::Copilot: return "copilot";
    case CapabilityType::Analytics: return "analytics";
    case CapabilityType::Security: return "security";
    }
    throw std::invalid_argument("Unknown capability type value");
}

CapabilityType parseCapabilityType(const std::string& name) {
    for (CapabilityType type : allCapabilityTypes()) {
        if (toString(type) == name) {
            return type;
        }
    }
    throw std::invalid_argument("Unknown capability type: " + name);
}

const std::vector<CapabilityType>& allCapabilityTypes() {
    static const std::vector<CapabilityType> types = {
        CapabilityType::Nlp,     CapabilityType::Quantum,   CapabilityType::Swarm,
        CapabilityType::Compliance, CapabilityType::Copilot, CapabilityType::Analytics,
        CapabilityType::Security};
    return types;
}

// Specializations given to agents spawned for an unmet capability
std::set<std::string> defaultSpecializations(CapabilityType type) {
    switch (type) {
    case CapabilityType::Nlp: return {"sentiment", "entity-extraction", "summarization"};
    case CapabilityType::Quantum: return {"optimization", "cryptography", "simulation"};
    case CapabilityType::Swarm: return {"coordination", "consensus", "distributed-processing"};
    case CapabilityType::Compliance: return {"security-audit", "policy-check", "risk-assessment"};
    case CapabilityType::Copilot: return {"code-generation", "debugging", "optimization"};
    case CapabilityType::Analytics: return {"data-mining", "pattern-recognition", "forecasting"};
    case CapabilityType::Security: return {"threat-detection", "vulnerability-scan", "incident-response"};
    }
    return {};
}

double clampLevel(double level) {
    return std::max(kMinCapabilityLevel, std::min(kMaxCapabilityLevel, level));
}
