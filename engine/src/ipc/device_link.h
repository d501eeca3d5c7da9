#pragma once

#include "codec/codec.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace optum {

// ZeroMQ link between the engine and its collaborators.
//   SUB:  classified turns, aborts and opens (JSON) from the orchestration layer.
//   PUSH: turn outcomes and device commands (JSON) to the device side.
class DeviceLink {
public:
    DeviceLink(const std::string& sub_endpoint, const std::string& push_endpoint);

    // Derives the PUSH port as SUB port + 1.
    // e.g. tcp://127.0.0.1:5560 → push on :5561.
    explicit DeviceLink(const std::string& sub_endpoint);

    ~DeviceLink();

    DeviceLink(const DeviceLink&) = delete;
    DeviceLink& operator=(const DeviceLink&) = delete;

    // Throws std::runtime_error if a socket cannot be created or connected.
    void connect();
    void disconnect();
    bool connected() const;

    // Non-blocking. Malformed messages are logged and dropped.
    std::optional<BusMessage> poll_message();

    // Returns false if the message could not be queued.
    bool send(const std::string& json_text);

    // Messages send() refused since construction.
    std::size_t dropped() const;

    const std::string& sub_endpoint() const;
    const std::string& push_endpoint() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// "tcp://host:5560" → "tcp://host:5561". Throws ConfigurationError when the
// port is out of range or is already 65535.
std::string derive_push_endpoint(const std::string& sub_endpoint);

} // namespace optum
