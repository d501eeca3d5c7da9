#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace optum {

// OD = right eye, OS = left eye.
enum class Eye : uint8_t {
    OD,
    OS,
};

enum class Parameter : uint8_t {
    Sphere,
    Cylinder,
    Axis,
};

const char* to_string(Eye eye);
const char* to_string(Parameter parameter);
std::optional<Eye>       eye_from_string(const std::string& s);
std::optional<Parameter> parameter_from_string(const std::string& s);

// The eye that is not `eye`.
Eye fellow(Eye eye);

// Physical envelope of the instrument. Cylinder uses the minus-cyl
// convention, so its domain is [-6.00, 0.00].
struct ParameterDomain {
    double min;
    double max;
};

ParameterDomain domain_of(Parameter parameter);
bool            in_domain(Parameter parameter, double value);

// Per-eye prescription.
struct LensConfiguration {
    double sphere{0.0};    // diopters
    double cylinder{0.0};  // diopters
    int    axis{0};        // degrees

    double value(Parameter parameter) const;
    bool   within_domain() const;
};

bool operator==(const LensConfiguration& a, const LensConfiguration& b);

struct PupillaryDistance {
    double distance_mm{63.0};
    double near_mm{60.0};
};

// One applied change, in application order.
struct AdjustmentRecord {
    uint64_t    sequence{0};
    double      elapsed_s{0.0};
    Eye         eye{Eye::OD};
    Parameter   parameter{Parameter::Sphere};
    double      magnitude{0.0};
    double      new_value{0.0};
    std::string source_step;
};

// Full instrument state for one exam. Only PhoropterController mutates it.
struct PhoropterState {
    LensConfiguration   od;
    LensConfiguration   os;
    std::optional<Eye>  occluded_eye{Eye::OS};   // nullopt → binocular
    PupillaryDistance   pd;
    std::vector<AdjustmentRecord> adjustment_history;

    const LensConfiguration& lens(Eye eye) const;
    LensConfiguration&       lens(Eye eye);
};

} // namespace optum
