#pragma once

#include "config/config.h"
#include "phoropter/phoropter.h"
#include "protocol/step_graph.h"
#include "quality/quality_gate.h"
#include "safety/safety_monitor.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace optum {

// One classified patient response, as delivered by the NLU collaborator.
struct TurnInput {
    Intent    intent{Intent::Unknown};
    double    confidence{0.0};
    Slots     slots;
    Sentiment sentiment{Sentiment::Unknown};
    bool      red_flag{false};
    bool      persona_override{false};
    double    elapsed_s{0.0};    // session clock, owned by the caller
    double    latency_s{0.0};    // time the patient took to answer
};

enum class TurnStatus : uint8_t {
    Advanced,            // clear answer, moved to the successor step
    Repeated,            // not clear (or binocular re-test), same step again
    Rejected,            // clear answer but the adjustment failed validation
    PersonaLocked,       // identity lock: step held, adjustment suppressed
    Escalated,           // red flag or hard stop; session is now halted
    InvalidTransition,   // turn submitted to a finished session
};

const char* to_string(TurnStatus status);

struct TurnOutcome {
    TurnStatus                     status{TurnStatus::Repeated};
    StepId                         step;        // the step this turn answered
    StepId                         next_step;
    std::optional<ResponseVerdict> verdict;     // absent when safety took the turn
    DeviceCommand                  command;
    std::vector<AdjustmentResult>  adjustments;
    std::string                    message;     // audit line for the collaborator
    SafetyOverride                 override_kind{SafetyOverride::None};
    std::string                    escalation_reason;
    DurationStage                  duration_stage{DurationStage::Continue};
    FatigueAssessment              fatigue;
    std::vector<std::string>       advisories;  // offer_break, warn_and_complete, fatigue_break, ...
};

struct QualityMetrics {
    std::size_t responses{0};
    std::size_t clear{0};
    double      clear_rate{0.0};
    double      mean_confidence{0.0};
    std::size_t adjustments_attempted{0};
    std::size_t adjustments_applied{0};
    double      adjustment_success_rate{1.0};
    bool        acceptable{false};
};

// Everything the reporting collaborator may serialise.
struct SessionSnapshot {
    std::string        session_id;
    StepId             current_step;
    bool               escalated{false};
    std::string        escalation_reason;
    ControllerSnapshot controller;
    SafetySnapshot     safety;
    QualityMetrics     quality;
};

// One exam. Owns its controller and safety monitor; shares only the
// immutable step graph. Single writer: callers serialise turns.
class ExamSession {
public:
    ExamSession(std::string session_id,
                std::shared_ptr<const StepGraph> graph,
                const EngineConfig& config,
                std::optional<StepId> start = std::nullopt);

    ExamSession(const ExamSession&) = delete;
    ExamSession& operator=(const ExamSession&) = delete;

    // Instrument command for the current step (start of exam, resume).
    DeviceCommand open();

    TurnOutcome process_turn(const TurnInput& in);

    // External abort. Idempotent: later calls return the first halt command.
    DeviceCommand abort(const std::string& reason);

    const std::string&  id() const { return id_; }
    const StepId&       current_step() const { return current_step_; }
    bool                escalated() const { return escalated_; }
    bool                finished() const;
    ControllerState     lifecycle() const { return controller_.lifecycle(); }

    const PhoropterController& controller() const { return controller_; }
    const SafetyMonitor&       safety() const { return safety_; }

    QualityMetrics  quality_metrics() const;
    SessionSnapshot snapshot() const;

private:
    DeviceCommand escalate_session(const std::string& reason);
    DeviceCommand present(const ProtocolStep& step);
    DeviceCommand repeat(const ProtocolStep& step);

    // Apply a clear answer on `step`. Returns true when the step is done.
    bool apply_clear_answer(const ProtocolStep& step, const TurnInput& in,
                            TurnOutcome& out);

    void add_advisories(TurnOutcome& out) const;
    void record_adjustment(const AdjustmentResult& r, TurnOutcome& out);

    std::string                      id_;
    std::shared_ptr<const StepGraph> graph_;
    EngineConfig                     config_;
    PhoropterController              controller_;
    SafetyMonitor                    safety_;
    StepId                           current_step_;

    bool          escalated_{false};
    std::string   escalation_reason_;
    DeviceCommand halt_command_;

    std::size_t responses_{0};
    std::size_t clear_responses_{0};
    double      confidence_sum_{0.0};
    std::size_t adjustments_attempted_{0};
    std::size_t adjustments_applied_{0};
};

} // namespace optum
