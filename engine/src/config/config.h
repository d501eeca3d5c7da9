#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace optum {

// Raised while loading or validating static configuration. Fatal: the
// engine must not start with a configuration that throws this.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

// Response-quality confidence bands.
//   [0, unclear_below)        → unclear
//   [unclear_below, clear_at) → ambiguous
//   [clear_at, 1]             → clear
struct QualityThresholds {
    double unclear_below{0.3};
    double clear_at{0.6};
};

// Largest single change the validator accepts per parameter.
struct StepLimits {
    double max_sphere_step_d{0.50};
    double max_cylinder_step_d{0.50};
    double max_axis_step_deg{10.0};
};

// Elapsed-time breakpoints, seconds since session start.
struct DurationLimits {
    double offer_break_s{12.0 * 60.0};
    double warn_and_complete_s{20.0 * 60.0};
    double hard_stop_s{25.0 * 60.0};
};

struct FatigueLimits {
    std::size_t window{5};
    double      accuracy_drop{0.2};
    double      confidence_drop{0.3};
    double      max_mean_latency_s{3.0};
    std::size_t fatigued_sentiment_hits{2};
    double      severe_score{0.7};
};

// Fixed-step heuristic sizes. These are policy constants, not clinical
// invariants, and may be tuned per deployment.
struct NudgeSizes {
    double refraction_step_d{0.25};
    double duochrome_d{0.125};
    double jcc_axis_step_deg{5.0};
    double binocular_d{-0.25};
};

// Every threshold the engine consults, passed in at construction.
struct EngineConfig {
    QualityThresholds quality;
    StepLimits        limits;
    DurationLimits    duration;
    FatigueLimits     fatigue;
    NudgeSizes        nudges;

    // Throws ConfigurationError on an inconsistent configuration.
    void validate() const;
};

// Parse a JSON document; absent keys keep their compiled defaults.
// The result is validated before it is returned.
EngineConfig engine_config_from_json(const std::string& json_text);
EngineConfig load_engine_config(const std::string& path);

// Read a whole file; throws ConfigurationError if it cannot be opened.
std::string read_config_file(const std::string& path);

} // namespace optum
