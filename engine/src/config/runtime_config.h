#pragma once

#include <string>

namespace optum {

// Settings for the optumd process. The engine itself never sees these.
struct RuntimeConfig {
    std::string sub_endpoint{"tcp://127.0.0.1:5560"};
    std::string push_endpoint;        // empty → SUB port + 1
    std::string report_url;           // empty → no report hand-off
    long        report_timeout_s{10};
    std::string engine_config_path;   // empty → compiled defaults
    std::string step_graph_path;      // empty → clinical default graph
    int         poll_interval_ms{5};
};

RuntimeConfig runtime_config_from_json(const std::string& json_text);

// Reads argv[1], else $OPTUM_CONFIG, else returns defaults.
// Throws ConfigurationError on an unreadable or malformed file.
RuntimeConfig resolve_runtime_config(int argc, char* argv[]);

} // namespace optum
