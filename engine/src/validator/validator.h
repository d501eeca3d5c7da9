#pragma once

#include "config/config.h"
#include "lens/lens.h"

#include <optional>
#include <string>

namespace optum {

// A proposed change, produced per turn and never stored past validation.
struct AdjustmentRequest {
    Eye         eye{Eye::OD};
    Parameter   parameter{Parameter::Sphere};
    double      magnitude{0.0};   // signed; D for sphere/cylinder, degrees for axis
    std::string source_step;
};

enum class RejectionReason : uint8_t {
    UnsafeJump,        // |magnitude| above the per-step limit
    OutOfRange,        // result would leave the parameter domain
    NotFinite,         // NaN or infinite magnitude
    NonIntegralAxis,   // axis is stored in whole degrees
};

const char* to_string(RejectionReason reason);

struct ValidationResult {
    std::optional<double>          new_value;  // set when accepted
    std::optional<RejectionReason> rejection;  // set when rejected
    std::string                    message;

    bool accepted() const { return new_value.has_value(); }
};

// Pure check of `request` against `state`. Never mutates; the controller
// applies the returned value.
ValidationResult validate(const PhoropterState& state,
                          const AdjustmentRequest& request,
                          const StepLimits& limits);

double max_step_for(Parameter parameter, const StepLimits& limits);

} // namespace optum
