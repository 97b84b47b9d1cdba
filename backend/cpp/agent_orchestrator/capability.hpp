#ifndef CAPABILITY_HPP
#define CAPABILITY_HPP

#include <set>
#include <string>
#include <vector>

enum class CapabilityType {
    Nlp,
    Quantum,
    Swarm,
    Compliance,
    Copilot,
    Analytics,
    Security
};

constexpr double kMinCapabilityLevel = 1.0;
constexpr double kMaxCapabilityLevel = 10.0;

// A typed, leveled skill an agent offers. Only the learning controller changes
// level after registration.
struct Capability {
    CapabilityType type = CapabilityType::Nlp;
    double level = kMinCapabilityLevel; // proficiency in [1, 10]
    std::set<std::string> specializations;
    double resource_cost = 0.0;
    int max_concurrent_tasks = 1;
};

std::string toString(CapabilityType type);

// Throws std::invalid_argument for names outside the catalogue
CapabilityType parseCapabilityType(const std::string& name);

const std::vector<CapabilityType>& allCapabilityTypes();

std::set<std::string> defaultSpecializations(CapabilityType type);

double clampLevel(double level);

#endif // CAPABILITY_HPP
