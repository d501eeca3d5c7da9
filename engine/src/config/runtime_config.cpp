#include "config/runtime_config.h"

#include "config/config.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <regex>

namespace optum {

// TCP port at the end of an endpoint, if it has one.
static std::optional<long> endpoint_port(const std::string& name, const std::string& endpoint) {
    static const std::regex re(R"(^.*:(\d+)$)");
    std::smatch m;
    if (!std::regex_match(endpoint, m, re)) return std::nullopt;
    const std::string digits = m[1].str();
    const long port = digits.size() > 5 ? 0 : std::stol(digits);
    if (port < 1 || port > 65535) {
        throw ConfigurationError("runtime config: " + name + " port " + digits + " out of range");
    }
    return port;
}

RuntimeConfig runtime_config_from_json(const std::string& json_text) {
    RuntimeConfig cfg;

    try {
        auto j = nlohmann::json::parse(json_text);

        cfg.sub_endpoint       = j.value("sub_endpoint", cfg.sub_endpoint);
        cfg.push_endpoint      = j.value("push_endpoint", cfg.push_endpoint);
        cfg.report_url         = j.value("report_url", cfg.report_url);
        cfg.report_timeout_s   = j.value("report_timeout_s", cfg.report_timeout_s);
        cfg.engine_config_path = j.value("engine_config", cfg.engine_config_path);
        cfg.step_graph_path    = j.value("step_graph", cfg.step_graph_path);
        cfg.poll_interval_ms   = j.value("poll_interval_ms", cfg.poll_interval_ms);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("runtime config: ") + e.what());
    }

    if (cfg.sub_endpoint.empty()) throw ConfigurationError("runtime config: empty sub_endpoint");
    const auto sub_port = endpoint_port("sub_endpoint", cfg.sub_endpoint);
    if (cfg.push_endpoint.empty() && sub_port && *sub_port == 65535) {
        throw ConfigurationError("runtime config: sub_endpoint port 65535 leaves no port for the PUSH socket");
    }
    endpoint_port("push_endpoint", cfg.push_endpoint);
    if (cfg.report_timeout_s <= 0) throw ConfigurationError("runtime config: report_timeout_s must be positive");
    if (cfg.poll_interval_ms <= 0) throw ConfigurationError("runtime config: poll_interval_ms must be positive");
    return cfg;
}

RuntimeConfig resolve_runtime_config(int argc, char* argv[]) {
    std::string path;
    if (argc > 1 && argv[1]) {
        path = argv[1];
    } else if (const char* env = std::getenv("OPTUM_CONFIG")) {
        path = env;
    }

    if (path.empty()) {
        std::cout << "[OPTUMD] No config file given, using defaults.\n";
        return RuntimeConfig{};
    }

    std::cout << "[OPTUMD] Loading config " << path << "\n";
    return runtime_config_from_json(read_config_file(path));
}

} // namespace optum
