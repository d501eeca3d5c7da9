#pragma once

#include "lens/lens.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace optum {

using StepId = std::string;

inline const StepId kEscalateStep = "escalate_to_professional";
inline const StepId kCompleteStep = "complete";

// What the session does with a clear answer on a step. Adding a category
// means touching every switch over it.
enum class StepCategory : uint8_t {
    Intake,                // history, acuity, health, alignment, PD
    MonocularRefraction,   // sphere bracketing on one eye
    CrossCylinder,         // JCC axis refinement + duochrome
    BinocularBalance,
    NearVision,
    Verification,          // comfort check, product selection
    Terminal,
};

const char* to_string(StepCategory category);
std::optional<StepCategory> step_category_from_string(const std::string& s);

struct SlotRequirement {
    std::string              key;
    std::vector<std::string> accepted;   // recognised values
};

struct ProtocolStep {
    StepId                       id;
    std::optional<StepId>        successor;   // nullopt → terminal
    StepCategory                 category{StepCategory::Intake};
    std::optional<Eye>           eye;         // eye under test, refraction steps only
    std::vector<SlotRequirement> required_slots;

    bool is_terminal() const { return !successor.has_value(); }
};

// Fixed directed graph over protocol steps. Validated once on
// construction; a malformed graph throws ConfigurationError.
class StepGraph {
public:
    StepGraph(std::vector<ProtocolStep> steps, StepId start);

    // The ten-stage clinical protocol, 0.1 through 9.2.
    static StepGraph clinical_default();

    static StepGraph from_json(const std::string& json_text);
    static StepGraph load(const std::string& path);

    const ProtocolStep* find(const StepId& id) const;
    const ProtocolStep& at(const StepId& id) const;   // throws std::out_of_range

    const StepId& start() const { return start_; }
    std::size_t   size() const { return steps_.size(); }

    // Steps in walk order from start().
    std::vector<StepId> walk() const;

private:
    void validate() const;

    std::map<StepId, ProtocolStep> steps_;
    StepId start_;
};

} // namespace optum
