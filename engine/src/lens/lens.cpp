#include "lens/lens.h"

namespace optum {

// Absorbs binary rounding of sums such as 0.1 + 0.2 at the domain edges.
static constexpr double kDomainEpsilon = 1e-9;

const char* to_string(Eye eye) {
    switch (eye) {
    case Eye::OD: return "OD";
    case Eye::OS: return "OS";
    }
    return "?";
}

const char* to_string(Parameter parameter) {
    switch (parameter) {
    case Parameter::Sphere:   return "SPH";
    case Parameter::Cylinder: return "CYL";
    case Parameter::Axis:     return "AXIS";
    }
    return "?";
}

std::optional<Eye> eye_from_string(const std::string& s) {
    if (s == "OD") return Eye::OD;
    if (s == "OS") return Eye::OS;
    return std::nullopt;
}

std::optional<Parameter> parameter_from_string(const std::string& s) {
    if (s == "SPH")  return Parameter::Sphere;
    if (s == "CYL")  return Parameter::Cylinder;
    if (s == "AXIS") return Parameter::Axis;
    return std::nullopt;
}

Eye fellow(Eye eye) {
    return eye == Eye::OD ? Eye::OS : Eye::OD;
}

ParameterDomain domain_of(Parameter parameter) {
    switch (parameter) {
    case Parameter::Sphere:   return {-20.0, 20.0};
    case Parameter::Cylinder: return {-6.0, 0.0};
    case Parameter::Axis:     return {0.0, 180.0};
    }
    return {0.0, 0.0};
}

bool in_domain(Parameter parameter, double value) {
    const ParameterDomain d = domain_of(parameter);
    return value >= d.min - kDomainEpsilon && value <= d.max + kDomainEpsilon;
}

// ── LensConfiguration ───────────────────────────────────────────

double LensConfiguration::value(Parameter parameter) const {
    switch (parameter) {
    case Parameter::Sphere:   return sphere;
    case Parameter::Cylinder: return cylinder;
    case Parameter::Axis:     return static_cast<double>(axis);
    }
    return 0.0;
}

bool LensConfiguration::within_domain() const {
    return in_domain(Parameter::Sphere, sphere) &&
           in_domain(Parameter::Cylinder, cylinder) &&
           in_domain(Parameter::Axis, axis);
}

bool operator==(const LensConfiguration& a, const LensConfiguration& b) {
    return a.sphere == b.sphere && a.cylinder == b.cylinder && a.axis == b.axis;
}

// ── PhoropterState ──────────────────────────────────────────────

const LensConfiguration& PhoropterState::lens(Eye eye) const {
    return eye == Eye::OD ? od : os;
}

LensConfiguration& PhoropterState::lens(Eye eye) {
    return eye == Eye::OD ? od : os;
}

} // namespace optum
