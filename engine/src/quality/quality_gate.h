#pragma once

#include "config/config.h"
#include "protocol/step_graph.h"

#include <map>
#include <optional>
#include <string>

namespace optum {

// Intent vocabulary of the upstream classifier. Strings outside it map
// to Unknown.
enum class Intent : uint8_t {
    Greeting,
    TestComplete,
    VisionReported,
    HealthCheck,
    AlignmentOk,
    PdReady,
    RefractionFeedback,
    ReadingAbility,
    PrescriptionOk,
    ProductChoice,
    Unknown,
    Invalid,
};

const char* to_string(Intent intent);
Intent      intent_from_string(const std::string& s);

using Slots = std::map<std::string, std::string>;

enum class ResponseQuality : uint8_t {
    Clear,
    Ambiguous,
    Unclear,
    Invalid,
};

const char* to_string(ResponseQuality quality);

struct ResponseVerdict {
    ResponseQuality quality{ResponseQuality::Invalid};
    double          confidence{0.0};
    bool            required_slots_present{false};
    std::string     reason;

    bool clear() const { return quality == ResponseQuality::Clear; }
};

// Pure classification of one parsed response. No side effects.
ResponseVerdict assess(double confidence, Intent intent, const Slots& slots,
                       const ProtocolStep& step, const QualityThresholds& thresholds);

// Key and value present, value in the accepted list.
bool has_required_slots(const Slots& slots, const ProtocolStep& step);

// Value of `key` if present.
std::optional<std::string> slot_value(const Slots& slots, const std::string& key);

} // namespace optum
