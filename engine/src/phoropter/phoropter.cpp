#include "phoropter/phoropter.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace optum {

const char* to_string(CommandKind kind) {
    switch (kind) {
    case CommandKind::PresentLensPair:    return "present_lens_pair";
    case CommandKind::PresentJcc:         return "present_jcc";
    case CommandKind::BalanceBinocular:   return "balance_binocular";
    case CommandKind::Finalize:           return "finalize";
    case CommandKind::Escalate:           return "escalate";
    case CommandKind::NoAction:           return "no_action";
    case CommandKind::RepeatPresentation: return "repeat_presentation";
    }
    return "no_action";
}

const char* to_string(ControllerState state) {
    switch (state) {
    case ControllerState::Active:    return "active";
    case ControllerState::Finalized: return "finalized";
    case ControllerState::Halted:    return "halted";
    }
    return "?";
}

const char* to_string(ControlStatus status) {
    switch (status) {
    case ControlStatus::Ok:                return "ok";
    case ControlStatus::Rejected:          return "rejected";
    case ControlStatus::InvalidTransition: return "invalid_transition";
    }
    return "?";
}

PhoropterController::PhoropterController(const StepLimits& limits, const NudgeSizes& nudges)
    : limits_(limits), nudges_(nudges) {}

// ── Helpers ─────────────────────────────────────────────────────

AdjustmentResult PhoropterController::invalid_transition(const std::string& operation) const {
    AdjustmentResult r;
    r.status  = ControlStatus::InvalidTransition;
    r.message = operation + " refused: controller is " + to_string(lifecycle_);
    std::cerr << "[PHOROPTER] " << r.message << "\n";
    return r;
}

CommandResult PhoropterController::invalid_command(const std::string& operation) const {
    CommandResult r;
    r.status         = ControlStatus::InvalidTransition;
    r.command.kind   = CommandKind::NoAction;
    r.message        = operation + " refused: controller is " + to_string(lifecycle_);
    r.command.reason = r.message;
    std::cerr << "[PHOROPTER] " << r.message << "\n";
    return r;
}

AdjustmentResult PhoropterController::no_change(const std::string& message) const {
    AdjustmentResult r;
    r.status  = ControlStatus::Ok;
    r.message = message;
    return r;
}

AdjustmentResult PhoropterController::rejected(const ValidationResult& v) const {
    AdjustmentResult r;
    r.status    = ControlStatus::Rejected;
    r.rejection = v.rejection;
    r.message   = v.message;
    std::cerr << "[PHOROPTER] Rejected " << v.message << "\n";
    return r;
}

// ── Adjustment ──────────────────────────────────────────────────

AdjustmentResult PhoropterController::adjust_parameter(Eye eye, Parameter parameter,
                                                       double magnitude,
                                                       const std::string& source_step,
                                                       double elapsed_s) {
    AdjustmentRequest req;
    req.eye         = eye;
    req.parameter   = parameter;
    req.magnitude   = magnitude;
    req.source_step = source_step;
    return adjust(req, elapsed_s);
}

AdjustmentResult PhoropterController::adjust(const AdjustmentRequest& request, double elapsed_s) {
    if (!is_active()) return invalid_transition("adjust_parameter");

    ValidationResult v = validate(state_, request, limits_);
    if (!v.accepted()) return rejected(v);

    LensConfiguration& lens = state_.lens(request.eye);
    switch (request.parameter) {
    case Parameter::Sphere:   lens.sphere   = *v.new_value; break;
    case Parameter::Cylinder: lens.cylinder = *v.new_value; break;
    case Parameter::Axis:     lens.axis     = static_cast<int>(*v.new_value); break;
    }

    AdjustmentRecord rec;
    rec.sequence    = state_.adjustment_history.size() + 1;
    rec.elapsed_s   = elapsed_s;
    rec.eye         = request.eye;
    rec.parameter   = request.parameter;
    rec.magnitude   = request.magnitude;
    rec.new_value   = lens.value(request.parameter);
    rec.source_step = request.source_step;
    state_.adjustment_history.push_back(rec);

    std::cout << "[PHOROPTER] Adjusted " << v.message << "\n";

    AdjustmentResult r;
    r.status  = ControlStatus::Ok;
    r.message = v.message;
    r.record  = rec;
    return r;
}

AdjustmentResult PhoropterController::apply_lens_choice(Eye eye, LensChoice choice,
                                                        const std::string& source_step,
                                                        double elapsed_s) {
    switch (choice) {
    case LensChoice::FirstBetter:
        return adjust_parameter(eye, Parameter::Sphere, nudges_.refraction_step_d,
                                source_step, elapsed_s);
    case LensChoice::SecondBetter:
        return adjust_parameter(eye, Parameter::Sphere, -nudges_.refraction_step_d,
                                source_step, elapsed_s);
    case LensChoice::BothSame:
        if (!is_active()) return invalid_transition("apply_lens_choice");
        return no_change(std::string(to_string(eye)) + " lenses equal, sphere held");
    }
    return no_change("no adjustment");
}

AdjustmentResult PhoropterController::apply_jcc_axis(Eye eye, LensChoice choice,
                                                     const std::string& source_step,
                                                     double elapsed_s) {
    switch (choice) {
    case LensChoice::FirstBetter:
        return adjust_parameter(eye, Parameter::Axis, nudges_.jcc_axis_step_deg,
                                source_step, elapsed_s);
    case LensChoice::SecondBetter:
        return adjust_parameter(eye, Parameter::Axis, -nudges_.jcc_axis_step_deg,
                                source_step, elapsed_s);
    case LensChoice::BothSame:
        if (!is_active()) return invalid_transition("apply_jcc_axis");
        return no_change(std::string(to_string(eye)) + " JCC positions equal, axis held");
    }
    return no_change("no adjustment");
}

std::vector<AdjustmentResult> PhoropterController::apply_jcc_sequence(
    Eye eye, std::optional<LensChoice> axis, std::optional<DuochromeResult> duochrome,
    const std::string& source_step, double elapsed_s) {
    if (!is_active()) return {invalid_transition("apply_jcc_sequence")};

    std::vector<AdjustmentRequest> requests;
    auto request = [&](Parameter parameter, double magnitude) {
        AdjustmentRequest req;
        req.eye         = eye;
        req.parameter   = parameter;
        req.magnitude   = magnitude;
        req.source_step = source_step;
        requests.push_back(req);
    };
    if (axis == LensChoice::FirstBetter)  request(Parameter::Axis, nudges_.jcc_axis_step_deg);
    if (axis == LensChoice::SecondBetter) request(Parameter::Axis, -nudges_.jcc_axis_step_deg);
    if (duochrome == DuochromeResult::RedClearer)   request(Parameter::Sphere, -nudges_.duochrome_d);
    if (duochrome == DuochromeResult::GreenClearer) request(Parameter::Sphere, nudges_.duochrome_d);

    // Axis and sphere are independent, so each checks against the current state.
    for (const auto& req : requests) {
        ValidationResult v = validate(state_, req, limits_);
        if (!v.accepted()) return {rejected(v)};
    }

    std::vector<AdjustmentResult> results;
    if (axis == LensChoice::BothSame) {
        results.push_back(no_change(std::string(to_string(eye)) + " JCC positions equal, axis held"));
    }
    if (duochrome == DuochromeResult::Equal) {
        results.push_back(no_change(std::string(to_string(eye)) + " duochrome balanced, sphere held"));
    }
    for (const auto& req : requests) results.push_back(adjust(req, elapsed_s));
    return results;
}

AdjustmentResult PhoropterController::apply_duochrome(Eye eye, DuochromeResult result,
                                                      const std::string& source_step,
                                                      double elapsed_s) {
    switch (result) {
    case DuochromeResult::RedClearer:
        return adjust_parameter(eye, Parameter::Sphere, -nudges_.duochrome_d,
                                source_step, elapsed_s);
    case DuochromeResult::GreenClearer:
        return adjust_parameter(eye, Parameter::Sphere, nudges_.duochrome_d,
                                source_step, elapsed_s);
    case DuochromeResult::Equal:
        if (!is_active()) return invalid_transition("apply_duochrome");
        return no_change(std::string(to_string(eye)) + " duochrome balanced, sphere held");
    }
    return no_change("no adjustment");
}

// ── Presentation ────────────────────────────────────────────────

CommandResult PhoropterController::present_lens_pair(Eye eye,
                                                     const LensConfiguration& lens_a,
                                                     const LensConfiguration& lens_b,
                                                     const std::string& question_key,
                                                     const std::vector<std::string>& options) const {
    if (!is_active()) return invalid_command("present_lens_pair");

    CommandResult r;
    r.command.kind         = CommandKind::PresentLensPair;
    r.command.eye          = eye;
    r.command.lens_a       = lens_a;
    r.command.lens_b       = lens_b;
    r.command.question_key = question_key;
    r.command.options      = options;
    return r;
}

CommandResult PhoropterController::present_refraction_pair(Eye eye) const {
    const ParameterDomain d = domain_of(Parameter::Sphere);
    LensConfiguration a = state_.lens(eye);
    LensConfiguration b = state_.lens(eye);
    a.sphere = std::min(a.sphere + nudges_.refraction_step_d, d.max);
    b.sphere = std::max(b.sphere - nudges_.refraction_step_d, d.min);
    return present_lens_pair(eye, a, b, "lens_pair.sharper_rounder",
                             {"first_better", "second_better", "both_same"});
}

CommandResult PhoropterController::present_jcc(Eye eye) const {
    if (!is_active()) return invalid_command("present_jcc");

    CommandResult r;
    r.command.kind         = CommandKind::PresentJcc;
    r.command.eye          = eye;
    r.command.current      = state_.lens(eye);
    r.command.sequence     = {
        {"horizontal_axis", "jcc.axis_clearer"},
        {"vertical_axis",   "jcc.axis_clearer"},
        {"duochrome",       "duochrome.red_green"},
    };
    r.command.question_key = "jcc.sequence";
    r.command.options      = {"first_better", "second_better", "both_same",
                              "red", "green", "both"};
    return r;
}

CommandResult PhoropterController::present_binocular() const {
    if (!is_active()) return invalid_command("balance_binocular");

    CommandResult r;
    r.command.kind         = CommandKind::BalanceBinocular;
    r.command.od           = state_.od;
    r.command.os           = state_.os;
    r.command.question_key = "binocular.equal_clarity";
    r.command.options      = {"both_same", "first_better", "second_better"};
    return r;
}

// ── Binocular balance / terminal transitions ────────────────────

BalanceOutcome PhoropterController::balance_binocular(BinocularReport report,
                                                      const std::string& source_step,
                                                      double elapsed_s) {
    BalanceOutcome out;
    if (!is_active()) {
        out.adjustment = invalid_transition("balance_binocular");
        out.command    = invalid_command("balance_binocular");
        return out;
    }

    if (report == BinocularReport::Equal) {
        out.balanced   = true;
        out.adjustment = no_change("binocular balance equal");
        out.command    = finalize();
        return out;
    }

    // The clearer eye dominates; pull the fellow eye.
    const Eye clearer = report == BinocularReport::OdClearer ? Eye::OD : Eye::OS;
    const Eye nudged  = fellow(clearer);
    out.adjustment = adjust_parameter(nudged, Parameter::Sphere, nudges_.binocular_d,
                                      source_step, elapsed_s);
    out.command    = present_binocular();
    return out;
}

CommandResult PhoropterController::finalize() {
    if (!is_active()) return invalid_command("finalize");

    lifecycle_ = ControllerState::Finalized;

    CommandResult r;
    r.command.kind = CommandKind::Finalize;
    r.command.od   = state_.od;
    r.command.os   = state_.os;
    r.command.pd   = state_.pd;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2)
       << "OD " << state_.od.sphere << '/' << state_.od.cylinder << 'x' << state_.od.axis
       << ", OS " << state_.os.sphere << '/' << state_.os.cylinder << 'x' << state_.os.axis;
    r.message = ss.str();
    std::cout << "[PHOROPTER] Prescription finalized: " << r.message << "\n";
    return r;
}

CommandResult PhoropterController::escalate(const std::string& reason) {
    if (lifecycle_ == ControllerState::Halted) {
        CommandResult r;
        r.command = halt_command_;
        r.message = "already halted: " + halt_reason_;
        return r;
    }
    if (lifecycle_ == ControllerState::Finalized) return invalid_command("escalate");

    lifecycle_   = ControllerState::Halted;
    halt_reason_ = reason;

    halt_command_        = DeviceCommand{};
    halt_command_.kind   = CommandKind::Escalate;
    halt_command_.reason = reason;

    std::cerr << "[PHOROPTER] HALT: " << reason << ", shutting down presentation.\n";

    CommandResult r;
    r.command = halt_command_;
    r.message = "halted: " + reason;
    return r;
}

// ── Setup ───────────────────────────────────────────────────────

AdjustmentResult PhoropterController::set_occlusion(std::optional<Eye> occluded) {
    if (!is_active()) return invalid_transition("set_occlusion");

    state_.occluded_eye = occluded;
    return no_change(occluded ? std::string("occluded ") + to_string(*occluded)
                              : std::string("both eyes open"));
}

AdjustmentResult PhoropterController::set_pupillary_distance(double distance_mm,
                                                             std::optional<double> near_mm) {
    if (!is_active()) return invalid_transition("set_pupillary_distance");

    auto rejected = [](const std::string& message) {
        AdjustmentResult r;
        r.status    = ControlStatus::Rejected;
        r.rejection = RejectionReason::OutOfRange;
        r.message   = message;
        return r;
    };

    if (!(distance_mm >= 50.0 && distance_mm <= 80.0)) {
        return rejected("distance PD out of range [50, 80] mm");
    }
    const double near = near_mm ? *near_mm : distance_mm - 3.0;
    if (!(near >= 45.0 && near <= 75.0)) {
        return rejected("near PD out of range [45, 75] mm");
    }

    state_.pd.distance_mm = distance_mm;
    state_.pd.near_mm     = near;

    std::ostringstream ss;
    ss << "PD " << distance_mm << " mm distance, " << near << " mm near";
    return no_change(ss.str());
}

ControllerSnapshot PhoropterController::snapshot() const {
    ControllerSnapshot s;
    s.state       = state_;
    s.lifecycle   = lifecycle_;
    s.halt_reason = halt_reason_;
    return s;
}

} // namespace optum
