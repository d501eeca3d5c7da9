#include "safety/safety_monitor.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace optum {

const char* to_string(Sentiment sentiment) {
    switch (sentiment) {
    case Sentiment::Confident:      return "confident";
    case Sentiment::UnderConfident: return "under_confident";
    case Sentiment::Confused:       return "confused";
    case Sentiment::Overconfident:  return "overconfident";
    case Sentiment::Fatigued:       return "fatigued";
    case Sentiment::Unknown:        return "unknown";
    }
    return "unknown";
}

Sentiment sentiment_from_string(const std::string& s) {
    std::string key;
    key.reserve(s.size());
    for (char c : s) {
        if (c == ' ' || c == '-') c = '_';
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (key == "confident")       return Sentiment::Confident;
    if (key == "under_confident") return Sentiment::UnderConfident;
    if (key == "confused")        return Sentiment::Confused;
    if (key == "overconfident")   return Sentiment::Overconfident;
    if (key == "fatigued")        return Sentiment::Fatigued;
    return Sentiment::Unknown;
}

const char* to_string(DurationStage stage) {
    switch (stage) {
    case DurationStage::Continue:        return "continue";
    case DurationStage::OfferBreak:      return "offer_break";
    case DurationStage::WarnAndComplete: return "warn_and_complete";
    case DurationStage::HardStop:        return "hard_stop";
    }
    return "continue";
}

const char* to_string(Severity severity) {
    switch (severity) {
    case Severity::Low:      return "LOW";
    case Severity::Medium:   return "MEDIUM";
    case Severity::High:     return "HIGH";
    case Severity::Critical: return "CRITICAL";
    }
    return "LOW";
}

const char* to_string(SafetyOverride o) {
    switch (o) {
    case SafetyOverride::RedFlag:     return "red_flag";
    case SafetyOverride::HardStop:    return "hard_stop";
    case SafetyOverride::PersonaLock: return "persona_lock";
    case SafetyOverride::None:        return "none";
    }
    return "none";
}

SafetyMonitor::SafetyMonitor(const DurationLimits& duration, const FatigueLimits& fatigue)
    : duration_(duration), fatigue_(fatigue) {}

DurationStage SafetyMonitor::stage_for(double elapsed_s) const {
    if (elapsed_s >= duration_.hard_stop_s)         return DurationStage::HardStop;
    if (elapsed_s >= duration_.warn_and_complete_s) return DurationStage::WarnAndComplete;
    if (elapsed_s >= duration_.offer_break_s)       return DurationStage::OfferBreak;
    return DurationStage::Continue;
}

void SafetyMonitor::log_incident(const std::string& kind, Severity severity,
                                 const std::string& description) {
    SafetyIncident inc;
    inc.elapsed_s   = snap_.elapsed_s;
    inc.kind        = kind;
    inc.severity    = severity;
    inc.description = description;
    snap_.incidents.push_back(inc);

    auto& out = severity >= Severity::High ? std::cerr : std::cout;
    out << "[SAFETY] Incident " << kind << " (" << to_string(severity) << "): "
        << description << "\n";
}

// ── Screening ───────────────────────────────────────────────────

SafetyVerdict SafetyMonitor::screen(bool red_flag, bool persona_override, double elapsed_s) {
    // The session clock is external; hold the last good value if it
    // arrives broken or running backwards.
    if (std::isfinite(elapsed_s) && elapsed_s >= snap_.elapsed_s) {
        snap_.elapsed_s = elapsed_s;
    } else {
        std::cerr << "[SAFETY] WARNING: ignoring elapsed " << elapsed_s
                  << " s (last " << snap_.elapsed_s << " s).\n";
    }

    const DurationStage stage = stage_for(snap_.elapsed_s);
    if (stage != snap_.duration_stage) {
        snap_.duration_stage = stage;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(0) << snap_.elapsed_s << " s elapsed";
        log_incident(std::string("duration_") + to_string(stage),
                     stage == DurationStage::HardStop ? Severity::Critical : Severity::Medium,
                     ss.str());
    }

    if (red_flag) {
        ++snap_.red_flag_count;
        log_incident("red_flag", Severity::Critical, "emergency symptom reported");
    }
    if (persona_override) {
        ++snap_.persona_override_count;
        log_incident("persona_override", Severity::High, "role redirection attempt blocked");
    }

    SafetyVerdict v;
    v.duration_stage = stage;

    if (red_flag) {
        v.override_kind     = SafetyOverride::RedFlag;
        v.escalation_reason = "red_flag";
    } else if (stage == DurationStage::HardStop) {
        v.override_kind     = SafetyOverride::HardStop;
        v.escalation_reason = "duration_exceeded";
    } else if (persona_override) {
        v.override_kind = SafetyOverride::PersonaLock;
    }
    return v;
}

// ── Fatigue ─────────────────────────────────────────────────────

template <typename Container, typename Field>
static double mean_of(const Container& samples, Field field) {
    if (samples.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& s : samples) sum += field(s);
    return sum / static_cast<double>(samples.size());
}

FatigueAssessment SafetyMonitor::record(const TurnSample& sample) {
    ++snap_.turns;
    if (snap_.baseline.size() < fatigue_.window) snap_.baseline.push_back(sample);
    snap_.recent.push_back(sample);
    while (snap_.recent.size() > fatigue_.window) snap_.recent.pop_front();

    const bool was_fatigued = snap_.fatigued;
    FatigueAssessment a = evaluate_fatigue();

    snap_.fatigued       = a.fatigued;
    snap_.fatigue_reason = a.reason;
    snap_.fatigue_score  = a.score;

    if (a.fatigued && !was_fatigued) {
        log_incident("fatigue", Severity::Medium, a.reason);
    }
    return a;
}

FatigueAssessment SafetyMonitor::evaluate_fatigue() const {
    FatigueAssessment a;
    const auto& recent   = snap_.recent;
    const auto& baseline = snap_.baseline;

    auto accuracy   = [](const TurnSample& s) { return s.accuracy; };
    auto confidence = [](const TurnSample& s) { return s.confidence; };
    auto latency    = [](const TurnSample& s) { return s.latency_s; };

    if (!recent.empty()) {
        const double acc_score  = 1.0 - mean_of(recent, accuracy);
        const double lat_score  = std::min(1.0, mean_of(recent, latency) / 5.0);
        const double conf_score = 1.0 - mean_of(recent, confidence);
        a.score = std::clamp(0.4 * acc_score + 0.3 * lat_score + 0.3 * conf_score, 0.0, 1.0);
    }

    std::ostringstream reason;
    reason << std::fixed << std::setprecision(2);

    // First N against last N needs two disjoint windows.
    if (snap_.turns >= 2 * fatigue_.window) {
        const double acc_drop  = mean_of(baseline, accuracy) - mean_of(recent, accuracy);
        const double conf_drop = mean_of(baseline, confidence) - mean_of(recent, confidence);
        if (acc_drop > fatigue_.accuracy_drop) {
            a.fatigued = true;
            reason << "accuracy dropped by " << acc_drop;
        } else if (conf_drop > fatigue_.confidence_drop) {
            a.fatigued = true;
            reason << "confidence dropped by " << conf_drop;
        }
    }

    if (!a.fatigued && recent.size() >= fatigue_.window) {
        const double mean_latency = mean_of(recent, latency);
        if (mean_latency > fatigue_.max_mean_latency_s) {
            a.fatigued = true;
            reason << "mean response latency " << mean_latency << " s";
        }
    }

    if (!a.fatigued) {
        const auto hits = static_cast<std::size_t>(
            std::count_if(recent.begin(), recent.end(),
                          [](const TurnSample& s) { return s.sentiment == Sentiment::Fatigued; }));
        if (hits >= fatigue_.fatigued_sentiment_hits) {
            a.fatigued = true;
            reason << hits << " fatigued responses in last " << recent.size();
        }
    }

    if (a.fatigued) {
        a.reason = reason.str();
        a.severe = a.score > fatigue_.severe_score;
    }
    return a;
}

} // namespace optum
