#include "ipc/device_link.h"

#include "config/config.h"

#include <zmq.h>

#include <cerrno>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <string>

namespace optum {

// ---------------------------------------------------------------------------
// Helper: derive PUSH endpoint from SUB endpoint (port + 1)
// ---------------------------------------------------------------------------
std::string derive_push_endpoint(const std::string& sub_ep) {
    std::regex re(R"(^(.*:)(\d+)$)");
    std::smatch m;
    if (std::regex_match(sub_ep, m, re)) {
        const std::string digits = m[2].str();
        const long port = digits.size() > 5 ? 0 : std::stol(digits);
        if (port < 1 || port >= 65535) {
            throw ConfigurationError("no PUSH port follows " + sub_ep);
        }
        return m[1].str() + std::to_string(port + 1);
    }
    return sub_ep + "1";
}

static std::runtime_error zmq_failure(const std::string& what) {
    return std::runtime_error("DeviceLink " + what + ": " + zmq_strerror(zmq_errno()));
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct DeviceLink::Impl {
    std::string sub_endpoint;
    std::string push_endpoint;
    bool        connected{false};
    std::size_t dropped{0};
    void* zmq_ctx  = nullptr;
    void* zmq_sub  = nullptr;
    void* zmq_push = nullptr;

    void close_all() {
        if (zmq_sub)  zmq_close(zmq_sub);
        if (zmq_push) zmq_close(zmq_push);
        if (zmq_ctx)  zmq_ctx_destroy(zmq_ctx);
        zmq_sub  = nullptr;
        zmq_push = nullptr;
        zmq_ctx  = nullptr;
    }
};

// ---------------------------------------------------------------------------
// Constructors
// ---------------------------------------------------------------------------
DeviceLink::DeviceLink(const std::string& sub_endpoint, const std::string& push_endpoint)
    : impl_(std::make_unique<Impl>())
{
    impl_->sub_endpoint  = sub_endpoint;
    impl_->push_endpoint = push_endpoint;
}

DeviceLink::DeviceLink(const std::string& sub_endpoint)
    : DeviceLink(sub_endpoint, derive_push_endpoint(sub_endpoint))
{
}

DeviceLink::~DeviceLink() { disconnect(); }

const std::string& DeviceLink::sub_endpoint() const { return impl_->sub_endpoint; }
const std::string& DeviceLink::push_endpoint() const { return impl_->push_endpoint; }
bool DeviceLink::connected() const { return impl_->connected; }

// ---------------------------------------------------------------------------
// connect / disconnect
// ---------------------------------------------------------------------------
void DeviceLink::connect() {
    if (impl_->connected) return;

    std::cout << "[LINK] Connecting SUB to " << impl_->sub_endpoint
              << ", PUSH to " << impl_->push_endpoint << "...\n";

    impl_->zmq_ctx = zmq_ctx_new();
    if (!impl_->zmq_ctx) throw zmq_failure("context");

    // SUB socket: every turn message, no topic filtering
    impl_->zmq_sub = zmq_socket(impl_->zmq_ctx, ZMQ_SUB);
    if (!impl_->zmq_sub ||
        zmq_connect(impl_->zmq_sub, impl_->sub_endpoint.c_str()) != 0 ||
        zmq_setsockopt(impl_->zmq_sub, ZMQ_SUBSCRIBE, "", 0) != 0) {
        auto err = zmq_failure("SUB " + impl_->sub_endpoint);
        impl_->close_all();
        throw err;
    }

    // PUSH socket: outcomes to the device side
    impl_->zmq_push = zmq_socket(impl_->zmq_ctx, ZMQ_PUSH);
    if (!impl_->zmq_push ||
        zmq_connect(impl_->zmq_push, impl_->push_endpoint.c_str()) != 0) {
        auto err = zmq_failure("PUSH " + impl_->push_endpoint);
        impl_->close_all();
        throw err;
    }

    // Do not hang shutdown on undelivered outcomes.
    int linger = 0;
    zmq_setsockopt(impl_->zmq_push, ZMQ_LINGER, &linger, sizeof(linger));

    impl_->connected = true;
    std::cout << "[LINK] Connected.\n";
}

void DeviceLink::disconnect() {
    if (!impl_ || !impl_->connected) return;

    impl_->close_all();
    impl_->connected = false;
    std::cout << "[LINK] Disconnected.\n";
}

// ---------------------------------------------------------------------------
// poll_message: non-blocking receive on SUB
// ---------------------------------------------------------------------------
std::optional<BusMessage> DeviceLink::poll_message() {
    if (!impl_->connected) return std::nullopt;

    zmq_msg_t msg;
    zmq_msg_init(&msg);
    int rc = zmq_msg_recv(&msg, impl_->zmq_sub, ZMQ_DONTWAIT);
    if (rc == -1) {
        if (zmq_errno() != EAGAIN) {
            std::cerr << "[LINK] Receive error: " << zmq_strerror(zmq_errno()) << "\n";
        }
        zmq_msg_close(&msg);
        return std::nullopt;
    }

    std::string data(static_cast<char*>(zmq_msg_data(&msg)), zmq_msg_size(&msg));
    zmq_msg_close(&msg);

    try {
        return decode_bus_message(data);
    } catch (const CodecError& e) {
        std::cerr << "[LINK] Dropped message: " << e.what() << "\n";
        return std::nullopt;
    }
}

// ---------------------------------------------------------------------------
// send
// ---------------------------------------------------------------------------
bool DeviceLink::send(const std::string& json_text) {
    if (!impl_->connected) {
        ++impl_->dropped;
        return false;
    }

    int rc = zmq_send(impl_->zmq_push, json_text.data(), json_text.size(), ZMQ_DONTWAIT);
    if (rc == -1) {
        ++impl_->dropped;
        std::cerr << "[LINK] Send failed: " << zmq_strerror(zmq_errno()) << "\n";
        return false;
    }

    std::cout << "[LINK] >> " << json_text << "\n";
    return true;
}

std::size_t DeviceLink::dropped() const { return impl_->dropped; }

} // namespace optum
