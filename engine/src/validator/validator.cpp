#include "validator/validator.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace optum {

static constexpr double kStepEpsilon = 1e-9;

const char* to_string(RejectionReason reason) {
    switch (reason) {
    case RejectionReason::UnsafeJump:      return "unsafe_jump";
    case RejectionReason::OutOfRange:      return "out_of_range";
    case RejectionReason::NotFinite:       return "not_finite";
    case RejectionReason::NonIntegralAxis: return "non_integral_axis";
    }
    return "unknown";
}

double max_step_for(Parameter parameter, const StepLimits& limits) {
    switch (parameter) {
    case Parameter::Sphere:   return limits.max_sphere_step_d;
    case Parameter::Cylinder: return limits.max_cylinder_step_d;
    case Parameter::Axis:     return limits.max_axis_step_deg;
    }
    return 0.0;
}

static ValidationResult reject(RejectionReason reason, const std::string& detail) {
    ValidationResult r;
    r.rejection = reason;
    r.message   = std::string(to_string(reason)) + ": " + detail;
    return r;
}

ValidationResult validate(const PhoropterState& state,
                          const AdjustmentRequest& request,
                          const StepLimits& limits) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(request.parameter == Parameter::Axis ? 0 : 3);

    const char* eye   = to_string(request.eye);
    const char* param = to_string(request.parameter);

    if (!std::isfinite(request.magnitude)) {
        return reject(RejectionReason::NotFinite,
                      std::string(eye) + " " + param + " magnitude is not finite");
    }

    const double max_step = max_step_for(request.parameter, limits);
    if (std::fabs(request.magnitude) > max_step + kStepEpsilon) {
        ss << eye << ' ' << param << " |" << request.magnitude << "| > " << max_step;
        return reject(RejectionReason::UnsafeJump, ss.str());
    }

    if (request.parameter == Parameter::Axis &&
        std::floor(request.magnitude) != request.magnitude) {
        ss << eye << " AXIS delta " << std::setprecision(3) << request.magnitude
           << " is not a whole degree";
        return reject(RejectionReason::NonIntegralAxis, ss.str());
    }

    const double current  = state.lens(request.eye).value(request.parameter);
    const double proposed = current + request.magnitude;
    if (!in_domain(request.parameter, proposed)) {
        const ParameterDomain d = domain_of(request.parameter);
        ss << eye << ' ' << param << ' ' << proposed
           << " not in [" << d.min << ", " << d.max << "]";
        return reject(RejectionReason::OutOfRange, ss.str());
    }

    ValidationResult ok;
    ok.new_value = proposed;
    ss << eye << ' ' << param << ' ' << current << " -> " << proposed;
    ok.message = ss.str();
    return ok;
}

} // namespace optum
