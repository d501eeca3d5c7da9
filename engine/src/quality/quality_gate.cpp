#include "quality/quality_gate.h"

#include <algorithm>
#include <cmath>

namespace optum {

const char* to_string(Intent intent) {
    switch (intent) {
    case Intent::Greeting:           return "greeting";
    case Intent::TestComplete:       return "test_complete";
    case Intent::VisionReported:     return "vision_reported";
    case Intent::HealthCheck:        return "health_check";
    case Intent::AlignmentOk:        return "alignment_ok";
    case Intent::PdReady:            return "pd_ready";
    case Intent::RefractionFeedback: return "refraction_feedback";
    case Intent::ReadingAbility:     return "reading_ability";
    case Intent::PrescriptionOk:     return "prescription_ok";
    case Intent::ProductChoice:      return "product_choice";
    case Intent::Unknown:            return "unknown";
    case Intent::Invalid:            return "invalid";
    }
    return "unknown";
}

Intent intent_from_string(const std::string& s) {
    static const std::map<std::string, Intent> kTable = {
        {"greeting",            Intent::Greeting},
        {"test_complete",       Intent::TestComplete},
        {"vision_reported",     Intent::VisionReported},
        {"health_check",        Intent::HealthCheck},
        {"alignment_ok",        Intent::AlignmentOk},
        {"pd_ready",            Intent::PdReady},
        {"refraction_feedback", Intent::RefractionFeedback},
        {"reading_ability",     Intent::ReadingAbility},
        {"prescription_ok",     Intent::PrescriptionOk},
        {"product_choice",      Intent::ProductChoice},
        {"unknown",             Intent::Unknown},
        {"invalid",             Intent::Invalid},
    };
    auto it = kTable.find(s);
    return it == kTable.end() ? Intent::Unknown : it->second;
}

const char* to_string(ResponseQuality quality) {
    switch (quality) {
    case ResponseQuality::Clear:     return "clear";
    case ResponseQuality::Ambiguous: return "ambiguous";
    case ResponseQuality::Unclear:   return "unclear";
    case ResponseQuality::Invalid:   return "invalid";
    }
    return "invalid";
}

std::optional<std::string> slot_value(const Slots& slots, const std::string& key) {
    auto it = slots.find(key);
    if (it == slots.end()) return std::nullopt;
    return it->second;
}

bool has_required_slots(const Slots& slots, const ProtocolStep& step) {
    for (const auto& req : step.required_slots) {
        auto value = slot_value(slots, req.key);
        if (!value) return false;
        if (std::find(req.accepted.begin(), req.accepted.end(), *value) == req.accepted.end()) {
            return false;
        }
    }
    return true;
}

ResponseVerdict assess(double confidence, Intent intent, const Slots& slots,
                       const ProtocolStep& step, const QualityThresholds& thresholds) {
    ResponseVerdict v;
    v.confidence             = confidence;
    v.required_slots_present = has_required_slots(slots, step);

    if (intent == Intent::Invalid || intent == Intent::Unknown) {
        v.quality = ResponseQuality::Invalid;
        v.reason  = std::string("intent is ") + to_string(intent);
        return v;
    }

    if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
        v.quality = ResponseQuality::Invalid;
        v.reason  = "confidence outside [0, 1]";
        return v;
    }

    if (confidence < thresholds.unclear_below) {
        v.quality = ResponseQuality::Unclear;
        v.reason  = "confidence below unclear threshold";
        return v;
    }

    if (confidence < thresholds.clear_at) {
        v.quality = ResponseQuality::Ambiguous;
        v.reason  = "confidence below clear threshold";
        return v;
    }

    if (!v.required_slots_present) {
        v.quality = ResponseQuality::Ambiguous;
        v.reason  = "required information missing for step " + step.id;
        return v;
    }

    v.quality = ResponseQuality::Clear;
    v.reason  = "clear";
    return v;
}

} // namespace optum
