#include "codec/codec.h"
#include "config/config.h"
#include "config/runtime_config.h"
#include "ipc/device_link.h"
#include "protocol/step_graph.h"
#include "report/report_client.h"
#include "session/registry.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <deque>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

static std::atomic<bool> g_running{true};

static void signal_handler(int) { g_running.store(false); }

// Finished-session snapshots waiting for the report thread.
class ReportQueue {
public:
    void push(optum::SessionSnapshot snap) {
        {
            std::lock_guard lock(mutex_);
            queue_.push_back(std::move(snap));
        }
        cv_.notify_one();
    }

    std::optional<optum::SessionSnapshot> pop(std::chrono::milliseconds wait) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, wait, [this] { return !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;
        auto snap = std::move(queue_.front());
        queue_.pop_front();
        return snap;
    }

private:
    std::mutex                         mutex_;
    std::condition_variable            cv_;
    std::deque<optum::SessionSnapshot> queue_;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "[OPTUMD] Optum refraction engine v0.1.0 starting...\n";

    // ── Configuration ───────────────────────────────────────────
    optum::RuntimeConfig                    runtime;
    optum::EngineConfig                     engine;
    std::shared_ptr<const optum::StepGraph> graph;
    std::string                             push_endpoint;
    try {
        runtime = optum::resolve_runtime_config(argc, argv);
        push_endpoint = runtime.push_endpoint.empty()
                            ? optum::derive_push_endpoint(runtime.sub_endpoint)
                            : runtime.push_endpoint;
        if (!runtime.engine_config_path.empty()) {
            engine = optum::load_engine_config(runtime.engine_config_path);
        }
        engine.validate();
        graph = std::make_shared<const optum::StepGraph>(
            runtime.step_graph_path.empty() ? optum::StepGraph::clinical_default()
                                            : optum::StepGraph::load(runtime.step_graph_path));
    } catch (const optum::ConfigurationError& e) {
        std::cerr << "[OPTUMD] Configuration error: " << e.what() << "\n";
        return 2;
    }

    // ── Subsystems ──────────────────────────────────────────────
    optum::SessionRegistry registry(graph, engine);
    optum::DeviceLink      link(runtime.sub_endpoint, push_endpoint);
    optum::ReportClient    reports(runtime.report_url, {}, runtime.report_timeout_s);
    ReportQueue            report_queue;

    try {
        link.connect();
    } catch (const std::runtime_error& e) {
        std::cerr << "[OPTUMD] " << e.what() << "\n";
        return 1;
    }

    std::cout << "[OPTUMD] Protocol of " << graph->size() << " steps, starting at "
              << graph->start() << ". Ready.\n";

    // ── Threads ─────────────────────────────────────────────────
    // Report hand-off: HTTP can take seconds, keep it off the bus loop.
    std::thread report_thread([&] {
        while (g_running.load()) {
            auto snap = report_queue.pop(std::chrono::milliseconds(200));
            if (snap) reports.submit(*snap);
        }
        // Drain whatever finished before shutdown.
        while (auto snap = report_queue.pop(std::chrono::milliseconds(0))) {
            reports.submit(*snap);
        }
    });

    // ── Main loop: one message, one session, one outcome ────────
    // Outcomes the PUSH socket refused, per live session.
    std::map<std::string, std::size_t> dropped;
    auto send = [&](const std::string& session_id, const nlohmann::json& j) {
        if (link.send(j.dump())) return;
        const std::size_t n = ++dropped[session_id];
        std::cerr << "[OPTUMD] Session " << session_id << ": outcome dropped (" << n
                  << " so far).\n";
    };

    // A finished session leaves the registry; its id stays retired.
    auto hand_off_if_finished = [&](optum::ExamSession& session) {
        if (!session.finished()) return;
        const std::string id = session.id();
        std::cout << "[OPTUMD] Session " << id << " finished at " << session.current_step() << ".\n";

        auto it = dropped.find(id);
        if (it != dropped.end()) {
            std::cerr << "[OPTUMD] Session " << id << " lost " << it->second << " outcome(s).\n";
            dropped.erase(it);
        }
        auto snap = registry.close(id);
        if (snap && reports.enabled()) report_queue.push(std::move(*snap));
    };

    const auto idle = std::chrono::milliseconds(runtime.poll_interval_ms);

    while (g_running.load()) {
        auto msg = link.poll_message();
        if (!msg) {
            std::this_thread::sleep_for(idle);
            continue;
        }

        try {
            optum::ExamSession& session = registry.open(msg->session_id);

            switch (msg->kind) {
            case optum::BusMessageKind::Open: {
                nlohmann::json j;
                j["session_id"] = session.id();
                j["status"]     = "opened";
                j["step"]       = session.current_step();
                j["command"]    = optum::command_to_json(session.open());
                send(msg->session_id, j);
                break;
            }
            case optum::BusMessageKind::Abort: {
                nlohmann::json j;
                j["session_id"]        = session.id();
                j["status"]            = "escalated";
                j["step"]              = session.current_step();
                j["escalation_reason"] = msg->abort_reason;
                j["command"]           = optum::command_to_json(session.abort(msg->abort_reason));
                send(msg->session_id, j);
                break;
            }
            case optum::BusMessageKind::Turn: {
                optum::TurnOutcome out = session.process_turn(msg->turn);
                send(msg->session_id, optum::outcome_to_json(session.id(), out));
                break;
            }
            }

            hand_off_if_finished(session);
        } catch (const optum::ConfigurationError& e) {
            std::cerr << "[OPTUMD] Session " << msg->session_id << " refused: " << e.what() << "\n";
        }
    }

    // ── Shutdown ────────────────────────────────────────────────
    std::cout << "[OPTUMD] Shutting down with " << registry.size() << " session(s) open, "
              << link.dropped() << " outcome(s) dropped...\n";
    g_running.store(false);
    report_thread.join();

    link.disconnect();
    std::cout << "[OPTUMD] Goodbye.\n";
    return 0;
}
