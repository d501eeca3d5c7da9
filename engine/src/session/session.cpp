#include "session/session.h"

#include "protocol/progression.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace optum {

const char* to_string(TurnStatus status) {
    switch (status) {
    case TurnStatus::Advanced:          return "advanced";
    case TurnStatus::Repeated:          return "repeated";
    case TurnStatus::Rejected:          return "rejected";
    case TurnStatus::PersonaLocked:     return "persona_locked";
    case TurnStatus::Escalated:         return "escalated";
    case TurnStatus::InvalidTransition: return "invalid_transition";
    }
    return "?";
}

// ── Slot vocabularies ───────────────────────────────────────────

static std::optional<LensChoice> lens_choice_from(const Slots& slots) {
    auto v = slot_value(slots, "clarity_feedback");
    if (!v) return std::nullopt;
    if (*v == "first_better")  return LensChoice::FirstBetter;
    if (*v == "second_better") return LensChoice::SecondBetter;
    if (*v == "both_same")     return LensChoice::BothSame;
    return std::nullopt;
}

static std::optional<DuochromeResult> duochrome_from(const Slots& slots) {
    auto v = slot_value(slots, "color_preference");
    if (!v) return std::nullopt;
    if (*v == "red")   return DuochromeResult::RedClearer;
    if (*v == "green") return DuochromeResult::GreenClearer;
    if (*v == "both")  return DuochromeResult::Equal;
    return std::nullopt;
}

// Binocular test presents OD first and OS second.
static std::optional<BinocularReport> binocular_from(const Slots& slots) {
    auto choice = lens_choice_from(slots);
    if (!choice) return std::nullopt;
    switch (*choice) {
    case LensChoice::FirstBetter:  return BinocularReport::OdClearer;
    case LensChoice::SecondBetter: return BinocularReport::OsClearer;
    case LensChoice::BothSame:     return BinocularReport::Equal;
    }
    return std::nullopt;
}

// PD arrives as text from the classifier, e.g. "63" or "62.5".
static std::optional<double> number_from(const Slots& slots, const std::string& key) {
    auto v = slot_value(slots, key);
    if (!v || v->empty()) return std::nullopt;
    char* end = nullptr;
    const double d = std::strtod(v->c_str(), &end);
    if (end != v->c_str() + v->size()) return std::nullopt;
    return d;
}

// ── Construction ────────────────────────────────────────────────

ExamSession::ExamSession(std::string session_id,
                         std::shared_ptr<const StepGraph> graph,
                         const EngineConfig& config,
                         std::optional<StepId> start)
    : id_(std::move(session_id))
    , graph_(std::move(graph))
    , config_(config)
    , controller_(config.limits, config.nudges)
    , safety_(config.duration, config.fatigue)
{
    if (!graph_) throw ConfigurationError("session " + id_ + ": no step graph");
    current_step_ = start ? *start : graph_->start();
    if (!graph_->find(current_step_)) {
        throw ConfigurationError("session " + id_ + ": unknown start step '" + current_step_ + "'");
    }
    std::cout << "[SESSION] " << id_ << " opened at step " << current_step_ << ".\n";
}

bool ExamSession::finished() const {
    return escalated_ || graph_->at(current_step_).is_terminal();
}

// ── Commands ────────────────────────────────────────────────────

DeviceCommand ExamSession::present(const ProtocolStep& step) {
    CommandResult r;
    r.command.kind = CommandKind::NoAction;

    const bool instrument_step = step.category == StepCategory::MonocularRefraction ||
                                 step.category == StepCategory::CrossCylinder ||
                                 step.category == StepCategory::BinocularBalance;
    if (instrument_step && controller_.lifecycle() != ControllerState::Active) {
        r.command.reason = std::string("controller is ") + to_string(controller_.lifecycle());
        r.command.step   = step.id;
        return r.command;
    }

    switch (step.category) {
    case StepCategory::MonocularRefraction:
        controller_.set_occlusion(fellow(*step.eye));
        r = controller_.present_refraction_pair(*step.eye);
        break;
    case StepCategory::CrossCylinder:
        controller_.set_occlusion(fellow(*step.eye));
        r = controller_.present_jcc(*step.eye);
        break;
    case StepCategory::BinocularBalance:
        controller_.set_occlusion(std::nullopt);
        r = controller_.present_binocular();
        break;
    case StepCategory::Intake:
    case StepCategory::NearVision:
    case StepCategory::Verification:
        r.command.reason = "no instrument action";
        break;
    case StepCategory::Terminal:
        r.command.reason = "exam complete";
        break;
    }

    DeviceCommand cmd = r.command;
    if (!r.ok()) cmd.kind = CommandKind::NoAction;
    cmd.step = step.id;
    return cmd;
}

DeviceCommand ExamSession::repeat(const ProtocolStep& step) {
    DeviceCommand cmd = present(step);
    if (step.category != StepCategory::Terminal) cmd.kind = CommandKind::RepeatPresentation;
    return cmd;
}

DeviceCommand ExamSession::open() {
    if (escalated_) return halt_command_;
    return present(graph_->at(current_step_));
}

DeviceCommand ExamSession::escalate_session(const std::string& reason) {
    if (escalated_) return halt_command_;

    CommandResult r = controller_.escalate(reason);
    if (r.ok()) {
        halt_command_ = r.command;
    } else {
        // Prescription already frozen; still halt the exam.
        halt_command_        = DeviceCommand{};
        halt_command_.kind   = CommandKind::Escalate;
        halt_command_.reason = reason;
    }
    halt_command_.step = kEscalateStep;

    escalated_         = true;
    escalation_reason_ = reason;
    current_step_      = kEscalateStep;

    std::cerr << "[SESSION] " << id_ << " ESCALATED: " << reason << "\n";
    return halt_command_;
}

DeviceCommand ExamSession::abort(const std::string& reason) {
    if (!escalated_) safety_.log_incident("external_abort", Severity::High, reason);
    return escalate_session(reason);
}

// ── Turn pipeline ───────────────────────────────────────────────

void ExamSession::record_adjustment(const AdjustmentResult& r, TurnOutcome& out) {
    if (r.record) {
        ++adjustments_attempted_;
        ++adjustments_applied_;
    } else if (r.status == ControlStatus::Rejected) {
        ++adjustments_attempted_;
        safety_.log_incident("rejected_adjustment", Severity::Low, r.message);
    }
    out.adjustments.push_back(r);
}

bool ExamSession::apply_clear_answer(const ProtocolStep& step, const TurnInput& in,
                                     TurnOutcome& out) {
    const double t = in.elapsed_s;

    switch (step.category) {
    case StepCategory::MonocularRefraction: {
        if (auto choice = lens_choice_from(in.slots)) {
            record_adjustment(controller_.apply_lens_choice(*step.eye, *choice, step.id, t), out);
        }
        return true;
    }
    case StepCategory::CrossCylinder: {
        auto choice = lens_choice_from(in.slots);
        auto duo    = duochrome_from(in.slots);
        if (!choice && !duo) return true;
        for (const auto& r : controller_.apply_jcc_sequence(*step.eye, choice, duo, step.id, t)) {
            record_adjustment(r, out);
        }
        return true;
    }
    case StepCategory::BinocularBalance: {
        auto report = binocular_from(in.slots);
        if (!report) return true;
        BalanceOutcome b = controller_.balance_binocular(*report, step.id, t);
        record_adjustment(b.adjustment, out);
        if (b.command.ok()) {
            out.command      = b.command.command;
            out.command.step = step.id;
        }
        return b.balanced;
    }
    case StepCategory::Intake: {
        // PD measurement steps report pd_mm and/or near_pd_mm.
        auto distance = number_from(in.slots, "pd_mm");
        auto near     = number_from(in.slots, "near_pd_mm");
        if (distance || near) {
            const double d = distance ? *distance : controller_.state().pd.distance_mm;
            record_adjustment(controller_.set_pupillary_distance(d, near), out);
        }
        return true;
    }
    case StepCategory::NearVision:
    case StepCategory::Verification:
        return true;
    case StepCategory::Terminal:
        return false;
    }
    return false;
}

void ExamSession::add_advisories(TurnOutcome& out) const {
    switch (out.duration_stage) {
    case DurationStage::OfferBreak:      out.advisories.push_back("offer_break"); break;
    case DurationStage::WarnAndComplete: out.advisories.push_back("warn_and_complete"); break;
    case DurationStage::Continue:
    case DurationStage::HardStop:        break;
    }
    if (out.fatigue.fatigued) {
        out.advisories.push_back(out.fatigue.severe ? "fatigue_severe" : "fatigue_break");
    }
}

TurnOutcome ExamSession::process_turn(const TurnInput& in) {
    TurnOutcome out;
    out.step      = current_step_;
    out.next_step = current_step_;

    if (finished()) {
        out.status         = TurnStatus::InvalidTransition;
        out.command.kind   = CommandKind::NoAction;
        out.command.step   = current_step_;
        out.message        = escalated_ ? "session halted: " + escalation_reason_
                                        : "session complete";
        out.command.reason = out.message;
        std::cerr << "[SESSION] " << id_ << " turn refused, " << out.message << "\n";
        return out;
    }

    const ProtocolStep& step = graph_->at(current_step_);
    // Out-of-band confidence still counts, but must not skew the means.
    const double confidence = std::isfinite(in.confidence) ? std::clamp(in.confidence, 0.0, 1.0)
                                                           : 0.0;
    ++responses_;
    confidence_sum_ += confidence;

    // ── Safety authority first ──────────────────────────────────
    SafetyVerdict sv = safety_.screen(in.red_flag, in.persona_override, in.elapsed_s);
    out.override_kind  = sv.override_kind;
    out.duration_stage = sv.duration_stage;

    if (sv.escalate()) {
        out.fatigue           = safety_.record({0.0, confidence, in.latency_s, in.sentiment});
        out.status            = TurnStatus::Escalated;
        out.escalation_reason = sv.escalation_reason;
        out.command           = escalate_session(sv.escalation_reason);
        out.next_step         = kEscalateStep;
        out.message           = "escalated: " + sv.escalation_reason;
        return out;
    }

    if (sv.override_kind == SafetyOverride::PersonaLock) {
        out.status  = TurnStatus::PersonaLocked;
        out.command = repeat(step);
        out.message = "persona override blocked, step held";
        add_advisories(out);
        std::cout << "[SESSION] " << id_ << " step " << step.id << " held (persona lock).\n";
        return out;
    }

    // ── Quality gate ────────────────────────────────────────────
    ResponseVerdict verdict = assess(in.confidence, in.intent, in.slots, step, config_.quality);
    out.verdict = verdict;

    if (!verdict.clear()) {
        out.fatigue = safety_.record({0.0, confidence, in.latency_s, in.sentiment});
        out.status  = TurnStatus::Repeated;
        out.command = repeat(step);
        out.message = std::string(to_string(verdict.quality)) + ": " + verdict.reason;
        add_advisories(out);
        std::cout << "[SESSION] " << id_ << " step " << step.id << " repeats ("
                  << to_string(verdict.quality) << ", confidence " << in.confidence << ").\n";
        return out;
    }

    ++clear_responses_;
    out.fatigue = safety_.record({1.0, confidence, in.latency_s, in.sentiment});

    // ── Adjustment ──────────────────────────────────────────────
    const bool step_done = apply_clear_answer(step, in, out);

    std::ostringstream msg;
    for (std::size_t i = 0; i < out.adjustments.size(); ++i) {
        if (i) msg << "; ";
        msg << out.adjustments[i].message;
    }
    out.message = msg.str();

    for (const auto& adj : out.adjustments) {
        if (adj.status == ControlStatus::Ok) continue;
        out.status         = adj.status == ControlStatus::Rejected ? TurnStatus::Rejected
                                                                   : TurnStatus::InvalidTransition;
        out.command        = DeviceCommand{};
        out.command.kind   = CommandKind::NoAction;
        out.command.step   = step.id;
        out.command.reason = adj.message;
        add_advisories(out);
        std::cout << "[SESSION] " << id_ << " step " << step.id << " repeats ("
                  << to_string(adj.status) << ").\n";
        return out;
    }

    if (!step_done) {
        // Binocular imbalance: fellow eye nudged, re-test on the same step.
        out.status = TurnStatus::Repeated;
        add_advisories(out);
        std::cout << "[SESSION] " << id_ << " step " << step.id << " re-test after balance nudge.\n";
        return out;
    }

    const StepId next = next_step(*graph_, step.id, verdict.quality, false);
    const bool finalized_here = step.category == StepCategory::BinocularBalance &&
                                controller_.lifecycle() == ControllerState::Finalized;

    current_step_  = next;
    out.status     = TurnStatus::Advanced;
    out.next_step  = next;
    if (finalized_here) {
        // Binocular agreement: the finalize command goes out, not the next step.
        if (out.message.empty()) out.message = "prescription finalized";
    } else {
        out.command = present(graph_->at(next));
    }
    add_advisories(out);

    std::cout << "[SESSION] " << id_ << " step " << step.id << " -> " << next
              << " (" << to_string(out.command.kind) << ").\n";
    return out;
}

// ── Reporting ───────────────────────────────────────────────────

QualityMetrics ExamSession::quality_metrics() const {
    QualityMetrics q;
    q.responses             = responses_;
    q.clear                 = clear_responses_;
    q.adjustments_attempted = adjustments_attempted_;
    q.adjustments_applied   = adjustments_applied_;

    if (responses_ > 0) {
        q.clear_rate      = static_cast<double>(clear_responses_) / static_cast<double>(responses_);
        q.mean_confidence = confidence_sum_ / static_cast<double>(responses_);
    }
    if (adjustments_attempted_ > 0) {
        q.adjustment_success_rate = static_cast<double>(adjustments_applied_) /
                                    static_cast<double>(adjustments_attempted_);
    }
    q.acceptable = responses_ > 0 &&
                   q.clear_rate >= 0.90 &&
                   q.mean_confidence >= 0.70 &&
                   q.adjustment_success_rate >= 0.95;
    return q;
}

SessionSnapshot ExamSession::snapshot() const {
    SessionSnapshot s;
    s.session_id        = id_;
    s.current_step      = current_step_;
    s.escalated         = escalated_;
    s.escalation_reason = escalation_reason_;
    s.controller        = controller_.snapshot();
    s.safety            = safety_.snapshot();
    s.quality           = quality_metrics();
    return s;
}

} // namespace optum
