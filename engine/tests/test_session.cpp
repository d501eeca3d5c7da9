#include "session/registry.h"
#include "session/session.h"

#include "test_support.h"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace optum;

static std::shared_ptr<const StepGraph> clinical() {
    static const auto g = std::make_shared<const StepGraph>(StepGraph::clinical_default());
    return g;
}

static TurnInput turn(Intent intent, double confidence, Slots slots = {}, double elapsed = 60.0) {
    TurnInput in;
    in.intent     = intent;
    in.confidence = confidence;
    in.slots      = std::move(slots);
    in.sentiment  = Sentiment::Confident;
    in.elapsed_s  = elapsed;
    in.latency_s  = 1.0;
    return in;
}

static TurnInput clarity(const std::string& answer, double confidence = 0.95,
                         double elapsed = 400.0) {
    return turn(Intent::RefractionFeedback, confidence, {{"clarity_feedback", answer}}, elapsed);
}

static bool has_advisory(const TurnOutcome& out, const std::string& a) {
    return std::find(out.advisories.begin(), out.advisories.end(), a) != out.advisories.end();
}

// -----------------------------------------------------------------------------
// 6.1, confidence 0.95, first_better → clear, 6.2, OD sphere +0.25
// -----------------------------------------------------------------------------
static void test_clear_answer_advances_and_adjusts() {
    ExamSession s("s1", clinical(), EngineConfig{}, StepId("6.1"));
    const double before = s.controller().state().od.sphere;

    auto out = s.process_turn(clarity("first_better"));

    REQUIRE(out.status == TurnStatus::Advanced, "clear answer advances");
    REQUIRE(out.verdict && out.verdict->quality == ResponseQuality::Clear, "verdict clear");
    REQUIRE(out.next_step == "6.2" && s.current_step() == "6.2", "next step is 6.2");
    REQUIRE(s.controller().state().od.sphere - before == 0.25, "OD sphere +0.25");
    REQUIRE(s.controller().state().adjustment_history.size() == 1, "one record");
    REQUIRE(s.controller().state().adjustment_history[0].source_step == "6.1", "source step");
    REQUIRE(out.adjustments.size() == 1 && out.adjustments[0].ok(), "adjustment reported");

    REQUIRE(out.command.kind == CommandKind::PresentJcc, "6.2 presents the cross cylinder");
    REQUIRE(*out.command.eye == Eye::OD && out.command.step == "6.2", "command for OD on 6.2");
    REQUIRE(*s.controller().state().occluded_eye == Eye::OS, "fellow eye occluded");
}

// -----------------------------------------------------------------------------
// 6.1, confidence 0.45 → ambiguous, repeat 6.1, no mutation
// -----------------------------------------------------------------------------
static void test_ambiguous_answer_repeats() {
    ExamSession s("s2", clinical(), EngineConfig{}, StepId("6.1"));
    const PhoropterState before = s.controller().state();

    auto out = s.process_turn(clarity("first_better", 0.45));

    REQUIRE(out.status == TurnStatus::Repeated, "ambiguous repeats");
    REQUIRE(out.verdict->quality == ResponseQuality::Ambiguous, "verdict ambiguous");
    REQUIRE(out.next_step == "6.1" && s.current_step() == "6.1", "step unchanged");
    REQUIRE(s.controller().state().od == before.od && s.controller().state().os == before.os,
            "lenses unchanged");
    REQUIRE(s.controller().state().adjustment_history.empty(), "no history");
    REQUIRE(out.adjustments.empty(), "no adjustment attempted");
    REQUIRE(out.command.kind == CommandKind::RepeatPresentation, "presentation repeated");
    REQUIRE(out.command.lens_a && out.command.lens_b, "repeat carries the same lens pair");
}

// -----------------------------------------------------------------------------
// red_flag → escalate_to_professional, controller halted
// -----------------------------------------------------------------------------
static void test_red_flag_escalates() {
    struct Case { Intent intent; double confidence; };
    for (auto c : {Case{Intent::Unknown, 0.1}, Case{Intent::RefractionFeedback, 0.99},
                   Case{Intent::Invalid, 2.0}}) {
        ExamSession s("s3", clinical(), EngineConfig{}, StepId("6.1"));
        auto in = clarity("first_better", c.confidence);
        in.intent   = c.intent;
        in.red_flag = true;

        auto out = s.process_turn(in);
        REQUIRE(out.status == TurnStatus::Escalated, "red flag escalates");
        REQUIRE(out.next_step == kEscalateStep, "next step is escalate_to_professional");
        REQUIRE(s.lifecycle() == ControllerState::Halted, "controller halted");
        REQUIRE(out.command.kind == CommandKind::Escalate, "escalate command");
        REQUIRE(out.escalation_reason == "red_flag", "reason red_flag");
        REQUIRE(s.controller().state().adjustment_history.empty(), "nothing applied");

        auto after = s.process_turn(clarity("first_better"));
        REQUIRE(after.status == TurnStatus::InvalidTransition, "halted session refuses turns");
        REQUIRE(after.command.kind == CommandKind::NoAction, "no action after halt");
        REQUIRE(s.controller().state().adjustment_history.empty(), "still nothing applied");
    }
}

// -----------------------------------------------------------------------------
// persona_override on 6.2 → step held, no adjustment, still active
// -----------------------------------------------------------------------------
static void test_persona_override_holds_step() {
    ExamSession s("s4", clinical(), EngineConfig{}, StepId("6.2"));
    auto in = clarity("first_better");
    in.persona_override = true;

    auto out = s.process_turn(in);
    REQUIRE(out.status == TurnStatus::PersonaLocked, "persona locked");
    REQUIRE(out.next_step == "6.2" && s.current_step() == "6.2", "step unchanged");
    REQUIRE(out.adjustments.empty(), "no adjustment");
    REQUIRE(s.controller().state().od.axis == 0, "axis untouched");
    REQUIRE(s.lifecycle() == ControllerState::Active, "controller active");
    REQUIRE(out.command.kind == CommandKind::RepeatPresentation, "presentation repeated");
    REQUIRE(s.safety().snapshot().persona_override_count == 1, "attempt counted");

    // The same answer without the override goes through.
    out = s.process_turn(clarity("first_better"));
    REQUIRE(out.status == TurnStatus::Advanced && s.controller().state().od.axis == 5,
            "clean answer applies the JCC axis step");
}

// -----------------------------------------------------------------------------
// Duochrome through the session: red -0.125, green +0.125, both unchanged
// -----------------------------------------------------------------------------
static void test_duochrome_in_session() {
    struct Case { const char* colour; double delta; };
    for (auto c : {Case{"red", -0.125}, Case{"green", 0.125}, Case{"both", 0.0}}) {
        ExamSession s("s5", clinical(), EngineConfig{}, StepId("6.2"));
        const double before = s.controller().state().od.sphere;

        auto out = s.process_turn(turn(Intent::RefractionFeedback, 0.9,
                                       {{"clarity_feedback", "both_same"},
                                        {"color_preference", c.colour}}, 420.0));
        REQUIRE(out.status == TurnStatus::Advanced, "duochrome answer advances");
        REQUIRE(s.controller().state().od.sphere - before == c.delta,
                "duochrome nudge for " << c.colour);
        REQUIRE(s.controller().state().od.axis == 0, "axis held on both_same");
    }
}

// -----------------------------------------------------------------------------
// elapsed ≥ 1500 s → escalate("duration_exceeded") regardless of verdict
// -----------------------------------------------------------------------------
static void test_hard_stop() {
    ExamSession s("s6", clinical(), EngineConfig{}, StepId("6.1"));
    s.process_turn(clarity("first_better", 0.95, 1499.0));
    REQUIRE(s.lifecycle() == ControllerState::Active, "1499 s still active");

    const std::size_t history = s.controller().state().adjustment_history.size();
    auto out = s.process_turn(clarity("first_better", 0.95, 1500.0));
    REQUIRE(out.status == TurnStatus::Escalated, "1500 s escalates");
    REQUIRE(out.escalation_reason == "duration_exceeded", "reason duration_exceeded");
    REQUIRE(out.override_kind == SafetyOverride::HardStop, "hard stop override");
    REQUIRE(s.lifecycle() == ControllerState::Halted, "controller halted");
    REQUIRE(s.controller().snapshot().halt_reason == "duration_exceeded", "halt reason");
    REQUIRE(s.controller().state().adjustment_history.size() == history,
            "clear answer ignored after the hard stop");
}

// -----------------------------------------------------------------------------
// Rejected adjustment: no_action, step repeats, incident logged
// -----------------------------------------------------------------------------
static void test_rejected_adjustment_repeats() {
    ExamSession s("s7", clinical(), EngineConfig{}, StepId("6.2"));
    // Axis starts at 0; the second JCC position would take it to -5.
    auto out = s.process_turn(clarity("second_better"));

    REQUIRE(out.status == TurnStatus::Rejected, "out of range axis rejected");
    REQUIRE(out.command.kind == CommandKind::NoAction, "no_action emitted");
    REQUIRE(out.next_step == "6.2" && s.current_step() == "6.2", "step repeats");
    REQUIRE(out.adjustments.size() == 1 &&
            *out.adjustments[0].rejection == RejectionReason::OutOfRange, "reason reported");
    REQUIRE(s.controller().state().adjustment_history.empty(), "nothing applied");
    REQUIRE(s.lifecycle() == ControllerState::Active, "rejection is not fatal");

    const auto& incidents = s.safety().snapshot().incidents;
    REQUIRE(!incidents.empty() && incidents.back().kind == "rejected_adjustment" &&
            incidents.back().severity == Severity::Low, "low severity incident");

    auto q = s.quality_metrics();
    REQUIRE(q.adjustments_attempted == 1 && q.adjustments_applied == 0, "attempt counted");
    REQUIRE(q.adjustment_success_rate == 0.0 && !q.acceptable, "quality not acceptable");
}

// -----------------------------------------------------------------------------
// JCC answer whose duochrome half is out of range: nothing applied, ever
// -----------------------------------------------------------------------------
static void test_rejected_jcc_answer_leaves_lens() {
    std::vector<ProtocolStep> steps;
    for (int i = 0; i < 80; ++i) {
        ProtocolStep r;
        r.id        = "r" + std::to_string(i);
        r.successor = i + 1 < 80 ? "r" + std::to_string(i + 1) : StepId("jcc");
        r.category  = StepCategory::MonocularRefraction;
        r.eye       = Eye::OD;
        steps.push_back(r);
    }
    ProtocolStep jcc;
    jcc.id        = "jcc";
    jcc.successor = kCompleteStep;
    jcc.category  = StepCategory::CrossCylinder;
    jcc.eye       = Eye::OD;
    steps.push_back(jcc);
    for (const StepId& id : {kEscalateStep, kCompleteStep}) {
        ProtocolStep t;
        t.id       = id;
        t.category = StepCategory::Terminal;
        steps.push_back(t);
    }
    auto graph = std::make_shared<const StepGraph>(std::move(steps), StepId("r0"));

    ExamSession s("s7b", graph, EngineConfig{});
    for (int i = 0; i < 80; ++i) s.process_turn(clarity("second_better"));
    REQUIRE(s.current_step() == "jcc", "refraction chain walked");
    REQUIRE(s.controller().state().od.sphere == -20.0, "OD sphere at the lower edge");

    const PhoropterState before = s.controller().state();
    for (int rep = 0; rep < 3; ++rep) {
        auto out = s.process_turn(turn(Intent::RefractionFeedback, 0.95,
                                       {{"clarity_feedback", "first_better"},
                                        {"color_preference", "red"}}, 420.0));
        REQUIRE(out.status == TurnStatus::Rejected, "red past -20.00 rejected");
        REQUIRE(out.command.kind == CommandKind::NoAction, "no_action emitted");
        REQUIRE(s.current_step() == "jcc", "step repeats");
        REQUIRE(s.controller().state().od == before.od, "axis untouched on turn " << rep);
        REQUIRE(s.controller().state().adjustment_history.size() ==
                    before.adjustment_history.size(), "history untouched on turn " << rep);
    }
}

static void test_pupillary_distance_capture() {
    ExamSession s("s8", clinical(), EngineConfig{}, StepId("5.1"));
    auto out = s.process_turn(turn(Intent::PdReady, 0.9, {{"pd_mm", "64"}}));
    REQUIRE(out.status == TurnStatus::Advanced, "PD step advances");
    REQUIRE(s.controller().state().pd.distance_mm == 64.0 &&
            s.controller().state().pd.near_mm == 61.0, "distance PD with derived near");

    out = s.process_turn(turn(Intent::PdReady, 0.9, {{"near_pd_mm", "90"}}));
    REQUIRE(out.status == TurnStatus::Rejected && s.current_step() == "5.2",
            "implausible near PD rejected");
    out = s.process_turn(turn(Intent::PdReady, 0.9, {{"near_pd_mm", "60.5"}}));
    REQUIRE(out.status == TurnStatus::Advanced && s.current_step() == "6.1", "near PD accepted");
    REQUIRE(s.controller().state().pd.near_mm == 60.5, "near PD stored");
}

// -----------------------------------------------------------------------------
// Full exam from greeting to complete
// -----------------------------------------------------------------------------
static void test_full_exam() {
    ExamSession s("s9", clinical(), EngineConfig{}, std::nullopt);
    REQUIRE(s.current_step() == "0.1", "starts at greeting");
    REQUIRE(s.open().kind == CommandKind::NoAction, "intake needs no instrument action");

    double t = 30.0;
    while (s.current_step() != "6.1") {
        auto out = s.process_turn(turn(Intent::Greeting, 0.9, {}, t += 10.0));
        REQUIRE(out.status == TurnStatus::Advanced, "intake step " << out.step << " advances");
    }

    auto out = s.process_turn(clarity("first_better", 0.9, t += 10.0));    // 6.1 OD +0.25
    REQUIRE(out.next_step == "6.2", "to OD cross cylinder");
    out = s.process_turn(clarity("both_same", 0.9, t += 10.0));            // 6.2 held
    REQUIRE(out.next_step == "6.3" && out.command.kind == CommandKind::PresentLensPair &&
            *out.command.eye == Eye::OS, "6.3 presents OS lenses");
    REQUIRE(*s.controller().state().occluded_eye == Eye::OD, "OD occluded for OS testing");
    out = s.process_turn(clarity("second_better", 0.9, t += 10.0));        // 6.3 OS -0.25
    out = s.process_turn(clarity("both_same", 0.9, t += 10.0));            // 6.4 held
    REQUIRE(out.next_step == "6.5" && out.command.kind == CommandKind::BalanceBinocular,
            "binocular balance presented");
    REQUIRE(!s.controller().state().occluded_eye, "both eyes open");

    out = s.process_turn(clarity("first_better", 0.9, t += 10.0));         // OD clearer
    REQUIRE(out.status == TurnStatus::Repeated && out.next_step == "6.5", "balance re-test");
    REQUIRE(out.command.kind == CommandKind::BalanceBinocular, "re-test command");
    REQUIRE(s.controller().state().os.sphere == -0.5, "OS pulled by -0.25");

    out = s.process_turn(clarity("both_same", 0.9, t += 10.0));            // balanced
    REQUIRE(out.status == TurnStatus::Advanced && out.next_step == "7.1", "on to near vision");
    REQUIRE(out.command.kind == CommandKind::Finalize, "prescription finalized");
    REQUIRE(s.lifecycle() == ControllerState::Finalized, "controller finalized");
    REQUIRE(out.command.od->sphere == 0.25 && out.command.os->sphere == -0.5,
            "final prescription carried");

    while (!s.finished()) {
        out = s.process_turn(turn(Intent::ReadingAbility, 0.9, {{"color_preference", "both"}},
                                  t += 10.0));
        REQUIRE(out.status == TurnStatus::Advanced, "post-refraction step advances");
    }
    REQUIRE(s.current_step() == kCompleteStep && !s.escalated(), "exam complete");

    out = s.process_turn(clarity("first_better", 0.9, t += 10.0));
    REQUIRE(out.status == TurnStatus::InvalidTransition, "complete session refuses turns");

    auto q = s.quality_metrics();
    REQUIRE(q.clear == q.responses, "every answered turn was clear");
    REQUIRE(q.adjustments_applied == 3 && q.adjustment_success_rate == 1.0,
            "three lens changes applied");
    REQUIRE(q.clear_rate >= 0.9 && q.acceptable, "quality acceptable");

    auto snap = s.snapshot();
    REQUIRE(snap.controller.state.adjustment_history.size() == 3, "snapshot carries history");
    REQUIRE(snap.controller.lifecycle == ControllerState::Finalized, "snapshot lifecycle");
}

static void test_red_flag_after_finalize() {
    ExamSession s("s10", clinical(), EngineConfig{}, StepId("6.5"));
    s.process_turn(clarity("both_same"));
    REQUIRE(s.lifecycle() == ControllerState::Finalized && s.current_step() == "7.1",
            "finalized at 7.1");

    auto in = turn(Intent::ReadingAbility, 0.9, {{"color_preference", "red"}}, 900.0);
    in.red_flag = true;
    auto out = s.process_turn(in);
    REQUIRE(out.status == TurnStatus::Escalated && s.escalated(), "still escalates");
    REQUIRE(out.command.kind == CommandKind::Escalate, "escalate command issued");
    REQUIRE(s.current_step() == kEscalateStep, "at escalate_to_professional");
    REQUIRE(s.lifecycle() == ControllerState::Finalized, "prescription stays frozen");
}

static void test_abort_is_idempotent() {
    ExamSession s("s11", clinical(), EngineConfig{}, StepId("6.1"));
    auto first  = s.abort("operator_stop");
    auto second = s.abort("network_loss");
    REQUIRE(first.kind == CommandKind::Escalate && second.kind == CommandKind::Escalate,
            "abort escalates");
    REQUIRE(second.reason == "operator_stop", "first reason kept");
    REQUIRE(s.snapshot().escalation_reason == "operator_stop", "snapshot reason");
    REQUIRE(s.lifecycle() == ControllerState::Halted, "halted");
    REQUIRE(s.open().kind == CommandKind::Escalate, "open after abort re-sends the halt");
}

static void test_advisories() {
    ExamSession s("s12", clinical(), EngineConfig{}, StepId("6.1"));
    auto out = s.process_turn(clarity("first_better", 0.45, 730.0));
    REQUIRE(has_advisory(out, "offer_break"), "offer a break after 12 minutes");

    ExamSession slow("s13", clinical(), EngineConfig{}, StepId("0.1"));
    for (int i = 0; i < 5; ++i) {
        auto in = turn(Intent::Greeting, 0.9, {}, 60.0 + i);
        in.latency_s = 5.0;
        out = slow.process_turn(in);
    }
    REQUIRE(out.fatigue.fatigued && has_advisory(out, "fatigue_break"),
            "slow answers suggest a break");
    REQUIRE(slow.lifecycle() == ControllerState::Active, "fatigue is advisory only");
}

static void test_unknown_start_rejected() {
    REQUIRE_THROWS(ExamSession("bad", clinical(), EngineConfig{}, StepId("12.9")),
                   ConfigurationError, "unknown start step rejected");
}

// -----------------------------------------------------------------------------
// Registry: one session per id, independent state
// -----------------------------------------------------------------------------
static void test_registry() {
    SessionRegistry reg(clinical(), EngineConfig{});
    ExamSession& a = reg.open("alpha");
    ExamSession& again = reg.open("alpha");
    ExamSession& b = reg.open("beta");
    REQUIRE(&a == &again, "same id, same session");
    REQUIRE(&a != &b && reg.size() == 2, "two sessions");

    auto in = turn(Intent::Greeting, 0.9);
    in.red_flag = true;
    a.process_turn(in);
    REQUIRE(a.escalated() && !b.escalated(), "sessions share no state");

    REQUIRE(reg.find("beta") == &b && reg.find("gamma") == nullptr, "lookup");
    auto snap = reg.close("alpha");
    REQUIRE(snap && snap->escalated && snap->session_id == "alpha", "close returns snapshot");
    REQUIRE(reg.size() == 1 && !reg.find("alpha"), "closed session removed");
    REQUIRE(!reg.close("alpha"), "double close is empty");
    REQUIRE(reg.retired("alpha") && !reg.retired("beta"), "closed id retired");
    REQUIRE_THROWS(reg.open("alpha"), ConfigurationError, "late message for a finished exam refused");
}

// -----------------------------------------------------------------------------
// Retired ids are bounded; the oldest is forgotten first
// -----------------------------------------------------------------------------
static void test_registry_retirement_is_bounded() {
    SessionRegistry reg(clinical(), EngineConfig{}, 2);
    for (const char* id : {"one", "two", "three"}) {
        reg.open(id);
        REQUIRE(reg.close(id), "close " << id);
    }
    REQUIRE(reg.size() == 0, "no live sessions kept");
    REQUIRE(reg.retired_count() == 2, "retired ids capped");
    REQUIRE(!reg.retired("one") && reg.retired("two") && reg.retired("three"), "oldest forgotten");
    REQUIRE(reg.open("one").current_step() == clinical()->start(), "forgotten id starts fresh");
}

int main() {
    std::cout << "=== Exam Session Tests ===\n";
    RUN(test_clear_answer_advances_and_adjusts);
    RUN(test_ambiguous_answer_repeats);
    RUN(test_red_flag_escalates);
    RUN(test_persona_override_holds_step);
    RUN(test_duochrome_in_session);
    RUN(test_hard_stop);
    RUN(test_rejected_adjustment_repeats);
    RUN(test_rejected_jcc_answer_leaves_lens);
    RUN(test_pupillary_distance_capture);
    RUN(test_full_exam);
    RUN(test_red_flag_after_finalize);
    RUN(test_abort_is_idempotent);
    RUN(test_advisories);
    RUN(test_unknown_start_rejected);
    RUN(test_registry);
    RUN(test_registry_retirement_is_bounded);
    std::cout << "All session tests passed.\n";
    return 0;
}
