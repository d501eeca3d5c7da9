#pragma once

#include "config/config.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace optum {

enum class Sentiment : uint8_t {
    Confident,
    UnderConfident,
    Confused,
    Overconfident,
    Fatigued,
    Unknown,
};

const char* to_string(Sentiment sentiment);
// Accepts "Under Confident", "under_confident", "UNDER-CONFIDENT", ...
Sentiment   sentiment_from_string(const std::string& s);

// Session-length stages. Only HardStop forces a halt.
enum class DurationStage : uint8_t {
    Continue,
    OfferBreak,
    WarnAndComplete,
    HardStop,
};

const char* to_string(DurationStage stage);

enum class Severity : uint8_t { Low, Medium, High, Critical };

const char* to_string(Severity severity);

struct SafetyIncident {
    double      elapsed_s{0.0};
    std::string kind;
    Severity    severity{Severity::Low};
    std::string description;
};

// One turn's contribution to the fatigue window.
struct TurnSample {
    double    accuracy{0.0};     // 1 for a clear response, else 0
    double    confidence{0.0};
    double    latency_s{0.0};
    Sentiment sentiment{Sentiment::Unknown};
};

struct SafetySnapshot {
    std::deque<TurnSample>  recent;      // last N turns
    std::vector<TurnSample> baseline;    // first N turns of the session
    std::size_t             turns{0};
    double                  elapsed_s{0.0};
    uint32_t                red_flag_count{0};
    uint32_t                persona_override_count{0};
    DurationStage           duration_stage{DurationStage::Continue};
    bool                    fatigued{false};
    std::string             fatigue_reason;
    double                  fatigue_score{0.0};
    std::vector<SafetyIncident> incidents;
};

// Which authority, if any, takes the turn away from the quality gate.
// Listed highest precedence first.
enum class SafetyOverride : uint8_t {
    RedFlag,
    HardStop,
    PersonaLock,
    None,
};

const char* to_string(SafetyOverride o);

struct SafetyVerdict {
    SafetyOverride override_kind{SafetyOverride::None};
    std::string    escalation_reason;   // set when escalate() is true
    DurationStage  duration_stage{DurationStage::Continue};

    bool escalate() const {
        return override_kind == SafetyOverride::RedFlag ||
               override_kind == SafetyOverride::HardStop;
    }
};

struct FatigueAssessment {
    bool        fatigued{false};
    bool        severe{false};
    double      score{0.0};
    std::string reason;
};

// Cross-cutting override authority for one session. Never reads a clock;
// elapsed time arrives with each turn.
class SafetyMonitor {
public:
    SafetyMonitor(const DurationLimits& duration, const FatigueLimits& fatigue);

    // Pre-turn screening: counts red flags and persona attempts, advances
    // the duration stage and resolves precedence
    //   red_flag > hard_stop > persona_override > (quality gate).
    SafetyVerdict screen(bool red_flag, bool persona_override, double elapsed_s);

    // Post-turn: push the sample and re-evaluate fatigue. Advisory only.
    FatigueAssessment record(const TurnSample& sample);

    void log_incident(const std::string& kind, Severity severity,
                      const std::string& description);

    DurationStage stage_for(double elapsed_s) const;

    const SafetySnapshot& snapshot() const { return snap_; }

private:
    FatigueAssessment evaluate_fatigue() const;

    DurationLimits duration_;
    FatigueLimits  fatigue_;
    SafetySnapshot snap_;
};

} // namespace optum
