#include "codec/codec.h"

namespace optum {

using nlohmann::json;

// ── Decoding ────────────────────────────────────────────────────

TurnInput turn_from_json(const json& j) {
    TurnInput in;
    in.intent           = intent_from_string(j.value("intent", std::string("unknown")));
    in.confidence       = j.value("confidence", 0.0);
    in.sentiment        = sentiment_from_string(j.value("sentiment", std::string("unknown")));
    in.red_flag         = j.value("red_flag", false);
    in.persona_override = j.value("persona_override", false);
    in.elapsed_s        = j.value("elapsed_seconds", 0.0);
    in.latency_s        = j.value("latency_seconds", 0.0);

    if (j.contains("slots")) {
        const auto& slots = j.at("slots");
        if (!slots.is_object()) throw CodecError("slots must be an object");
        for (auto it = slots.begin(); it != slots.end(); ++it) {
            // Classifiers sometimes emit numbers or booleans as slot values.
            in.slots[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                                        : it.value().dump();
        }
    }
    return in;
}

BusMessage decode_bus_message(const std::string& text) {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) throw CodecError("message is not a JSON object");

        BusMessage msg;
        msg.session_id = j.value("session_id", std::string());
        if (msg.session_id.empty()) throw CodecError("missing session_id");

        if (j.contains("abort")) {
            msg.kind         = BusMessageKind::Abort;
            msg.abort_reason = j.at("abort").is_string() ? j.at("abort").get<std::string>()
                                                         : std::string("external_abort");
        } else if (j.value("open", false)) {
            msg.kind = BusMessageKind::Open;
        } else {
            msg.kind = BusMessageKind::Turn;
            msg.turn = turn_from_json(j);
        }
        return msg;
    } catch (const json::exception& e) {
        throw CodecError(std::string("bad bus message: ") + e.what());
    }
}

// ── Encoding ────────────────────────────────────────────────────

json lens_to_json(const LensConfiguration& lens) {
    return json{{"sphere", lens.sphere}, {"cylinder", lens.cylinder}, {"axis", lens.axis}};
}

static json pd_to_json(const PupillaryDistance& pd) {
    return json{{"distance_mm", pd.distance_mm}, {"near_mm", pd.near_mm}};
}

static json record_to_json(const AdjustmentRecord& r) {
    return json{
        {"sequence",    r.sequence},
        {"elapsed_s",   r.elapsed_s},
        {"eye",         to_string(r.eye)},
        {"parameter",   to_string(r.parameter)},
        {"magnitude",   r.magnitude},
        {"new_value",   r.new_value},
        {"source_step", r.source_step},
    };
}

json command_to_json(const DeviceCommand& cmd) {
    json j;
    j["kind"] = to_string(cmd.kind);
    j["step"] = cmd.step;
    if (cmd.eye)     j["eye"]     = to_string(*cmd.eye);
    if (cmd.lens_a)  j["lens_a"]  = lens_to_json(*cmd.lens_a);
    if (cmd.lens_b)  j["lens_b"]  = lens_to_json(*cmd.lens_b);
    if (cmd.current) j["current"] = lens_to_json(*cmd.current);
    if (!cmd.sequence.empty()) {
        json seq = json::array();
        for (const auto& s : cmd.sequence) {
            seq.push_back(json{{"name", s.name}, {"question_key", s.question_key}});
        }
        j["sequence"] = seq;
    }
    if (cmd.od) j["od"] = lens_to_json(*cmd.od);
    if (cmd.os) j["os"] = lens_to_json(*cmd.os);
    if (cmd.pd) j["pd"] = pd_to_json(*cmd.pd);
    if (!cmd.question_key.empty()) j["question_key"] = cmd.question_key;
    if (!cmd.options.empty())      j["options"]      = cmd.options;
    if (!cmd.reason.empty())       j["reason"]       = cmd.reason;
    return j;
}

json adjustment_to_json(const AdjustmentResult& r) {
    json j{{"status", to_string(r.status)}, {"message", r.message}};
    if (r.rejection) j["rejection"] = to_string(*r.rejection);
    if (r.record)    j["record"]    = record_to_json(*r.record);
    return j;
}

json outcome_to_json(const std::string& session_id, const TurnOutcome& out) {
    json j;
    j["session_id"]     = session_id;
    j["status"]         = to_string(out.status);
    j["step"]           = out.step;
    j["next_step"]      = out.next_step;
    j["command"]        = command_to_json(out.command);
    j["message"]        = out.message;
    j["override"]       = to_string(out.override_kind);
    j["duration_stage"] = to_string(out.duration_stage);
    j["advisories"]     = out.advisories;

    if (out.verdict) {
        j["verdict"] = {
            {"quality",                to_string(out.verdict->quality)},
            {"confidence",             out.verdict->confidence},
            {"required_slots_present", out.verdict->required_slots_present},
            {"reason",                 out.verdict->reason},
        };
    }
    if (!out.escalation_reason.empty()) j["escalation_reason"] = out.escalation_reason;

    json adjustments = json::array();
    for (const auto& a : out.adjustments) adjustments.push_back(adjustment_to_json(a));
    j["adjustments"] = adjustments;

    j["fatigue"] = {
        {"fatigued", out.fatigue.fatigued},
        {"severe",   out.fatigue.severe},
        {"score",    out.fatigue.score},
        {"reason",   out.fatigue.reason},
    };
    return j;
}

json snapshot_to_json(const SessionSnapshot& snap) {
    const PhoropterState& st = snap.controller.state;

    json history = json::array();
    for (const auto& r : st.adjustment_history) history.push_back(record_to_json(r));

    json incidents = json::array();
    for (const auto& inc : snap.safety.incidents) {
        incidents.push_back(json{
            {"elapsed_s",   inc.elapsed_s},
            {"kind",        inc.kind},
            {"severity",    to_string(inc.severity)},
            {"description", inc.description},
        });
    }

    json j;
    j["session_id"]   = snap.session_id;
    j["current_step"] = snap.current_step;
    j["escalated"]    = snap.escalated;
    if (!snap.escalation_reason.empty()) j["escalation_reason"] = snap.escalation_reason;

    j["lifecycle"] = to_string(snap.controller.lifecycle);
    if (!snap.controller.halt_reason.empty()) j["halt_reason"] = snap.controller.halt_reason;

    j["prescription"] = {
        {"od", lens_to_json(st.od)},
        {"os", lens_to_json(st.os)},
        {"pd", pd_to_json(st.pd)},
    };
    j["occluded_eye"] = st.occluded_eye ? json(to_string(*st.occluded_eye)) : json(nullptr);
    j["adjustment_history"] = history;

    j["safety"] = {
        {"elapsed_s",              snap.safety.elapsed_s},
        {"turns",                  snap.safety.turns},
        {"red_flag_count",         snap.safety.red_flag_count},
        {"persona_override_count", snap.safety.persona_override_count},
        {"duration_stage",         to_string(snap.safety.duration_stage)},
        {"fatigued",               snap.safety.fatigued},
        {"fatigue_reason",         snap.safety.fatigue_reason},
        {"fatigue_score",          snap.safety.fatigue_score},
        {"incidents",              incidents},
    };

    const QualityMetrics& q = snap.quality;
    j["quality"] = {
        {"responses",               q.responses},
        {"clear",                   q.clear},
        {"clear_rate",              q.clear_rate},
        {"mean_confidence",         q.mean_confidence},
        {"adjustments_attempted",   q.adjustments_attempted},
        {"adjustments_applied",     q.adjustments_applied},
        {"adjustment_success_rate", q.adjustment_success_rate},
        {"quality_acceptable",      q.acceptable},
    };
    return j;
}

} // namespace optum
