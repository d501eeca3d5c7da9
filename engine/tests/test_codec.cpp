#include "codec/codec.h"

#include "test_support.h"

#include <memory>

using namespace optum;
using nlohmann::json;

// -----------------------------------------------------------------------------
// Bus messages in
// -----------------------------------------------------------------------------
static void test_decode_turn() {
    auto msg = decode_bus_message(R"({
        "session_id": "exam-42",
        "intent": "refraction_feedback",
        "confidence": 0.92,
        "slots": {"clarity_feedback": "first_better", "pd_mm": 63},
        "sentiment": "Under Confident",
        "red_flag": false,
        "persona_override": true,
        "elapsed_seconds": 512.5,
        "latency_seconds": 2.25
    })");
    REQUIRE(msg.kind == BusMessageKind::Turn && msg.session_id == "exam-42", "turn message");
    REQUIRE(msg.turn.intent == Intent::RefractionFeedback, "intent");
    REQUIRE(msg.turn.confidence == 0.92, "confidence");
    REQUIRE(msg.turn.slots.at("clarity_feedback") == "first_better", "string slot");
    REQUIRE(msg.turn.slots.at("pd_mm") == "63", "numeric slot kept as text");
    REQUIRE(msg.turn.sentiment == Sentiment::UnderConfident, "sentiment normalised");
    REQUIRE(!msg.turn.red_flag && msg.turn.persona_override, "flags");
    REQUIRE(msg.turn.elapsed_s == 512.5 && msg.turn.latency_s == 2.25, "timing");
}

static void test_decode_defaults_and_vocabulary() {
    auto msg = decode_bus_message(R"({"session_id": "x", "intent": "order_pizza"})");
    REQUIRE(msg.turn.intent == Intent::Unknown, "unrecognised intent maps to unknown");
    REQUIRE(msg.turn.confidence == 0.0 && msg.turn.latency_s == 0.0, "numeric defaults");
    REQUIRE(msg.turn.sentiment == Sentiment::Unknown && msg.turn.slots.empty(), "defaults");
}

static void test_decode_control_messages() {
    auto abort = decode_bus_message(R"({"session_id": "x", "abort": "operator_stop"})");
    REQUIRE(abort.kind == BusMessageKind::Abort && abort.abort_reason == "operator_stop",
            "abort message");

    auto bare = decode_bus_message(R"({"session_id": "x", "abort": true})");
    REQUIRE(bare.kind == BusMessageKind::Abort && bare.abort_reason == "external_abort",
            "abort without reason");

    auto open = decode_bus_message(R"({"session_id": "x", "open": true})");
    REQUIRE(open.kind == BusMessageKind::Open, "open message");
}

static void test_decode_errors() {
    REQUIRE_THROWS(decode_bus_message("{oops"), CodecError, "malformed JSON");
    REQUIRE_THROWS(decode_bus_message("[1, 2]"), CodecError, "not an object");
    REQUIRE_THROWS(decode_bus_message(R"({"intent": "greeting"})"), CodecError,
                   "missing session id");
    REQUIRE_THROWS(decode_bus_message(R"({"session_id": "x", "confidence": "high"})"),
                   CodecError, "wrong confidence type");
    REQUIRE_THROWS(decode_bus_message(R"({"session_id": "x", "slots": ["a"]})"),
                   CodecError, "slots must be an object");
}

// -----------------------------------------------------------------------------
// Outcomes and snapshots out
// -----------------------------------------------------------------------------
static void test_outcome_json() {
    auto graph = std::make_shared<const StepGraph>(StepGraph::clinical_default());
    ExamSession s("exam-7", graph, EngineConfig{}, StepId("6.1"));

    TurnInput in;
    in.intent     = Intent::RefractionFeedback;
    in.confidence = 0.95;
    in.slots      = {{"clarity_feedback", "first_better"}};
    in.elapsed_s  = 300.0;
    auto out = s.process_turn(in);

    json j = outcome_to_json(s.id(), out);
    REQUIRE(j["session_id"] == "exam-7" && j["status"] == "advanced", "status");
    REQUIRE(j["step"] == "6.1" && j["next_step"] == "6.2", "steps");
    REQUIRE(j["verdict"]["quality"] == "clear", "verdict");
    REQUIRE(j["command"]["kind"] == "present_jcc" && j["command"]["eye"] == "OD", "command");
    REQUIRE(j["command"]["sequence"].size() == 3, "jcc sequence");
    REQUIRE(j["adjustments"].size() == 1 &&
            j["adjustments"][0]["record"]["new_value"] == 0.25, "adjustment record");
    REQUIRE(j["override"] == "none" && j["duration_stage"] == "continue", "safety fields");
    REQUIRE(!j.contains("escalation_reason"), "no escalation reason when not escalated");
}

static void test_command_json_omits_absent_fields() {
    DeviceCommand cmd;
    cmd.kind   = CommandKind::NoAction;
    cmd.step   = "0.1";
    cmd.reason = "no instrument action";
    json j = command_to_json(cmd);
    REQUIRE(j["kind"] == "no_action" && j["reason"] == "no instrument action", "fields");
    REQUIRE(!j.contains("eye") && !j.contains("lens_a") && !j.contains("options"),
            "absent optionals omitted");
}

static void test_snapshot_json() {
    auto graph = std::make_shared<const StepGraph>(StepGraph::clinical_default());
    ExamSession s("exam-9", graph, EngineConfig{}, StepId("6.1"));

    TurnInput in;
    in.intent     = Intent::RefractionFeedback;
    in.confidence = 0.95;
    in.slots      = {{"clarity_feedback", "second_better"}};
    in.elapsed_s  = 100.0;
    s.process_turn(in);
    s.abort("operator_stop");

    json j = snapshot_to_json(s.snapshot());
    REQUIRE(j["session_id"] == "exam-9" && j["escalated"] == true, "identity");
    REQUIRE(j["lifecycle"] == "halted" && j["halt_reason"] == "operator_stop", "lifecycle");
    REQUIRE(j["current_step"] == kEscalateStep, "current step");
    REQUIRE(j["prescription"]["od"]["sphere"] == -0.25, "prescription");
    REQUIRE(j["adjustment_history"].size() == 1 &&
            j["adjustment_history"][0]["source_step"] == "6.1", "history");
    REQUIRE(j["safety"]["incidents"].size() == 1 &&
            j["safety"]["incidents"][0]["kind"] == "external_abort", "incident log");
    REQUIRE(j["quality"]["responses"] == 1 && j["quality"]["adjustments_applied"] == 1,
            "quality metrics");
}

int main() {
    std::cout << "=== Codec Tests ===\n";
    RUN(test_decode_turn);
    RUN(test_decode_defaults_and_vocabulary);
    RUN(test_decode_control_messages);
    RUN(test_decode_errors);
    RUN(test_outcome_json);
    RUN(test_command_json_omits_absent_fields);
    RUN(test_snapshot_json);
    std::cout << "All codec tests passed.\n";
    return 0;
}
