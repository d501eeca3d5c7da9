#pragma once

#include "config/config.h"
#include "lens/lens.h"
#include "validator/validator.h"

#include <optional>
#include <string>
#include <vector>

namespace optum {

// Abstract instrument commands. Transport is someone else's problem.
enum class CommandKind : uint8_t {
    PresentLensPair,
    PresentJcc,
    BalanceBinocular,
    Finalize,
    Escalate,
    NoAction,
    RepeatPresentation,
};

const char* to_string(CommandKind kind);

// One part of a Jackson Cross Cylinder sequence.
struct JccStage {
    std::string name;          // "horizontal_axis" | "vertical_axis" | "duochrome"
    std::string question_key;
};

struct DeviceCommand {
    CommandKind        kind{CommandKind::NoAction};
    std::optional<Eye> eye;
    std::string        step;           // protocol step the command belongs to

    // present_lens_pair
    std::optional<LensConfiguration> lens_a;
    std::optional<LensConfiguration> lens_b;

    // present_jcc
    std::optional<LensConfiguration> current;
    std::vector<JccStage>            sequence;

    // balance_binocular / finalize
    std::optional<LensConfiguration> od;
    std::optional<LensConfiguration> os;
    std::optional<PupillaryDistance> pd;

    // Opaque keys; the orchestration layer owns the wording.
    std::string              question_key;
    std::vector<std::string> options;

    std::string reason;   // escalate / no_action
};

enum class ControllerState : uint8_t {
    Active,
    Finalized,   // terminal
    Halted,      // terminal
};

const char* to_string(ControllerState state);

enum class ControlStatus : uint8_t {
    Ok,
    Rejected,            // validation failure, state untouched
    InvalidTransition,   // controller is finalized or halted
};

const char* to_string(ControlStatus status);

struct AdjustmentResult {
    ControlStatus                   status{ControlStatus::Ok};
    std::string                     message;
    std::optional<RejectionReason>  rejection;
    std::optional<AdjustmentRecord> record;   // set when applied

    bool ok() const { return status == ControlStatus::Ok; }
};

struct CommandResult {
    ControlStatus status{ControlStatus::Ok};
    DeviceCommand command;
    std::string   message;

    bool ok() const { return status == ControlStatus::Ok; }
};

// Patient answers the controller knows how to act on.
enum class LensChoice : uint8_t { FirstBetter, SecondBetter, BothSame };
enum class DuochromeResult : uint8_t { RedClearer, GreenClearer, Equal };
enum class BinocularReport : uint8_t { OdClearer, OsClearer, Equal };

struct BalanceOutcome {
    bool             balanced{false};   // true → finalized
    AdjustmentResult adjustment;        // the fellow-eye nudge, if any
    CommandResult    command;           // finalize, or a balance re-test
};

// Read-only view for the persistence collaborator.
struct ControllerSnapshot {
    PhoropterState  state;
    ControllerState lifecycle{ControllerState::Active};
    std::string     halt_reason;
};

// Owns the PhoropterState for one exam and is its only writer.
//   active → finalized   via finalize()
//   active → halted      via escalate()
// Both terminal states reject every further call.
class PhoropterController {
public:
    PhoropterController(const StepLimits& limits, const NudgeSizes& nudges);

    // Validate then apply. State is untouched unless the result is Ok.
    AdjustmentResult adjust_parameter(Eye eye, Parameter parameter, double magnitude,
                                      const std::string& source_step = {},
                                      double elapsed_s = 0.0);
    AdjustmentResult adjust(const AdjustmentRequest& request, double elapsed_s = 0.0);

    // Pure command construction.
    CommandResult present_lens_pair(Eye eye,
                                    const LensConfiguration& lens_a,
                                    const LensConfiguration& lens_b,
                                    const std::string& question_key,
                                    const std::vector<std::string>& options) const;

    // Bracket the current sphere by ± refraction_step_d, clamped to the
    // sphere domain. At an edge the pair is one-sided.
    CommandResult present_refraction_pair(Eye eye) const;

    CommandResult present_jcc(Eye eye) const;
    CommandResult present_binocular() const;

    // JCC sub-results, each routed back through adjust_parameter.
    AdjustmentResult apply_jcc_axis(Eye eye, LensChoice choice,
                                    const std::string& source_step, double elapsed_s);
    AdjustmentResult apply_duochrome(Eye eye, DuochromeResult result,
                                     const std::string& source_step, double elapsed_s);
    // Whole JCC answer: the axis nudge and the duochrome nudge are validated
    // together and applied together. One rejection leaves the state untouched
    // and is the only result returned.
    std::vector<AdjustmentResult> apply_jcc_sequence(Eye eye,
                                                     std::optional<LensChoice> axis,
                                                     std::optional<DuochromeResult> duochrome,
                                                     const std::string& source_step,
                                                     double elapsed_s);
    // Sphere bracket answer from present_refraction_pair.
    AdjustmentResult apply_lens_choice(Eye eye, LensChoice choice,
                                       const std::string& source_step, double elapsed_s);

    BalanceOutcome balance_binocular(BinocularReport report,
                                     const std::string& source_step, double elapsed_s);

    CommandResult finalize();

    // Idempotent: a second call returns the first halt command unchanged.
    CommandResult escalate(const std::string& reason);

    AdjustmentResult set_occlusion(std::optional<Eye> occluded);
    AdjustmentResult set_pupillary_distance(double distance_mm,
                                            std::optional<double> near_mm = std::nullopt);

    ControllerState     lifecycle() const { return lifecycle_; }
    const PhoropterState& state() const { return state_; }
    ControllerSnapshot  snapshot() const;

private:
    bool is_active() const { return lifecycle_ == ControllerState::Active; }
    AdjustmentResult invalid_transition(const std::string& operation) const;
    CommandResult    invalid_command(const std::string& operation) const;
    AdjustmentResult no_change(const std::string& message) const;
    AdjustmentResult rejected(const ValidationResult& v) const;

    StepLimits      limits_;
    NudgeSizes      nudges_;
    PhoropterState  state_;
    ControllerState lifecycle_{ControllerState::Active};
    std::string     halt_reason_;
    DeviceCommand   halt_command_;
};

} // namespace optum
