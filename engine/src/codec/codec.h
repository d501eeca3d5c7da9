#pragma once

#include "session/session.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace optum {

// Malformed bus message. The runtime logs and drops it.
class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& what)
        : std::runtime_error(what) {}
};

// What can arrive on the turn bus.
enum class BusMessageKind : uint8_t {
    Turn,    // {"session_id", "intent", "confidence", ...}
    Abort,   // {"session_id", "abort": "<reason>"}
    Open,    // {"session_id", "open": true}
};

struct BusMessage {
    BusMessageKind kind{BusMessageKind::Turn};
    std::string    session_id;
    TurnInput      turn;
    std::string    abort_reason;
};

// Throws CodecError on invalid JSON, a missing session_id or wrongly
// typed fields. Unrecognised intent or sentiment strings are not errors.
BusMessage decode_bus_message(const std::string& text);
TurnInput  turn_from_json(const nlohmann::json& j);

nlohmann::json lens_to_json(const LensConfiguration& lens);
nlohmann::json command_to_json(const DeviceCommand& cmd);
nlohmann::json adjustment_to_json(const AdjustmentResult& r);
nlohmann::json outcome_to_json(const std::string& session_id, const TurnOutcome& out);
nlohmann::json snapshot_to_json(const SessionSnapshot& snap);

} // namespace optum
