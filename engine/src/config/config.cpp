#include "config/config.h"

#include <cmath>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace optum {

static void require(bool ok, const std::string& message) {
    if (!ok) throw ConfigurationError("engine config: " + message);
}

void EngineConfig::validate() const {
    require(quality.unclear_below >= 0.0 && quality.clear_at <= 1.0,
            "quality thresholds must lie in [0, 1]");
    require(quality.unclear_below <= quality.clear_at,
            "unclear_below must not exceed clear_at");

    require(limits.max_sphere_step_d > 0.0 &&
            limits.max_cylinder_step_d > 0.0 &&
            limits.max_axis_step_deg > 0.0,
            "step limits must be positive");

    require(duration.offer_break_s > 0.0 &&
            duration.offer_break_s < duration.warn_and_complete_s &&
            duration.warn_and_complete_s < duration.hard_stop_s,
            "duration breakpoints must be positive and strictly increasing");

    require(fatigue.window > 0, "fatigue window must be non-empty");
    require(fatigue.fatigued_sentiment_hits > 0 &&
            fatigue.fatigued_sentiment_hits <= fatigue.window,
            "fatigued_sentiment_hits must lie in [1, window]");

    // A nudge the validator would reject can never be applied.
    require(std::fabs(nudges.refraction_step_d) <= limits.max_sphere_step_d,
            "refraction_step_d exceeds max_sphere_step_d");
    require(std::fabs(nudges.duochrome_d) <= limits.max_sphere_step_d,
            "duochrome_d exceeds max_sphere_step_d");
    require(std::fabs(nudges.binocular_d) <= limits.max_sphere_step_d,
            "binocular_d exceeds max_sphere_step_d");
    require(std::fabs(nudges.jcc_axis_step_deg) <= limits.max_axis_step_deg &&
            std::floor(nudges.jcc_axis_step_deg) == nudges.jcc_axis_step_deg,
            "jcc_axis_step_deg must be a whole number within max_axis_step_deg");
}

EngineConfig engine_config_from_json(const std::string& json_text) {
    EngineConfig cfg;

    try {
        auto j = nlohmann::json::parse(json_text);

        if (j.contains("quality")) {
            const auto& q = j["quality"];
            cfg.quality.unclear_below = q.value("unclear_below", cfg.quality.unclear_below);
            cfg.quality.clear_at      = q.value("clear_at", cfg.quality.clear_at);
        }
        if (j.contains("limits")) {
            const auto& l = j["limits"];
            cfg.limits.max_sphere_step_d   = l.value("max_sphere_step_d", cfg.limits.max_sphere_step_d);
            cfg.limits.max_cylinder_step_d = l.value("max_cylinder_step_d", cfg.limits.max_cylinder_step_d);
            cfg.limits.max_axis_step_deg   = l.value("max_axis_step_deg", cfg.limits.max_axis_step_deg);
        }
        if (j.contains("duration")) {
            const auto& d = j["duration"];
            cfg.duration.offer_break_s       = d.value("offer_break_s", cfg.duration.offer_break_s);
            cfg.duration.warn_and_complete_s = d.value("warn_and_complete_s", cfg.duration.warn_and_complete_s);
            cfg.duration.hard_stop_s         = d.value("hard_stop_s", cfg.duration.hard_stop_s);
        }
        if (j.contains("fatigue")) {
            const auto& f = j["fatigue"];
            cfg.fatigue.window                  = f.value("window", cfg.fatigue.window);
            cfg.fatigue.accuracy_drop           = f.value("accuracy_drop", cfg.fatigue.accuracy_drop);
            cfg.fatigue.confidence_drop         = f.value("confidence_drop", cfg.fatigue.confidence_drop);
            cfg.fatigue.max_mean_latency_s      = f.value("max_mean_latency_s", cfg.fatigue.max_mean_latency_s);
            cfg.fatigue.fatigued_sentiment_hits = f.value("fatigued_sentiment_hits", cfg.fatigue.fatigued_sentiment_hits);
            cfg.fatigue.severe_score            = f.value("severe_score", cfg.fatigue.severe_score);
        }
        if (j.contains("nudges")) {
            const auto& n = j["nudges"];
            cfg.nudges.refraction_step_d = n.value("refraction_step_d", cfg.nudges.refraction_step_d);
            cfg.nudges.duochrome_d       = n.value("duochrome_d", cfg.nudges.duochrome_d);
            cfg.nudges.jcc_axis_step_deg = n.value("jcc_axis_step_deg", cfg.nudges.jcc_axis_step_deg);
            cfg.nudges.binocular_d       = n.value("binocular_d", cfg.nudges.binocular_d);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("engine config: ") + e.what());
    }

    cfg.validate();
    return cfg;
}

std::string read_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw ConfigurationError("cannot open " + path);

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

EngineConfig load_engine_config(const std::string& path) {
    return engine_config_from_json(read_config_file(path));
}

} // namespace optum
