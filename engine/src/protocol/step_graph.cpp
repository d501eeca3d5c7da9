#include "protocol/step_graph.h"

#include "config/config.h"

#include <iostream>
#include <set>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace optum {

const char* to_string(StepCategory category) {
    switch (category) {
    case StepCategory::Intake:              return "intake";
    case StepCategory::MonocularRefraction: return "monocular_refraction";
    case StepCategory::CrossCylinder:       return "cross_cylinder";
    case StepCategory::BinocularBalance:    return "binocular_balance";
    case StepCategory::NearVision:          return "near_vision";
    case StepCategory::Verification:        return "verification";
    case StepCategory::Terminal:            return "terminal";
    }
    return "?";
}

std::optional<StepCategory> step_category_from_string(const std::string& s) {
    if (s == "intake")               return StepCategory::Intake;
    if (s == "monocular_refraction") return StepCategory::MonocularRefraction;
    if (s == "cross_cylinder")       return StepCategory::CrossCylinder;
    if (s == "binocular_balance")    return StepCategory::BinocularBalance;
    if (s == "near_vision")          return StepCategory::NearVision;
    if (s == "verification")         return StepCategory::Verification;
    if (s == "terminal")             return StepCategory::Terminal;
    return std::nullopt;
}

// ── Construction & validation ───────────────────────────────────

StepGraph::StepGraph(std::vector<ProtocolStep> steps, StepId start)
    : start_(std::move(start))
{
    for (auto& step : steps) {
        const StepId id = step.id;
        if (!steps_.emplace(id, std::move(step)).second) {
            throw ConfigurationError("step graph: duplicate step '" + id + "'");
        }
    }
    validate();
}

void StepGraph::validate() const {
    if (steps_.find(start_) == steps_.end()) {
        throw ConfigurationError("step graph: start step '" + start_ + "' is not defined");
    }

    auto escalate = steps_.find(kEscalateStep);
    if (escalate == steps_.end() || !escalate->second.is_terminal()) {
        throw ConfigurationError("step graph: terminal step '" + kEscalateStep + "' is required");
    }

    for (const auto& [id, step] : steps_) {
        if (id.empty()) throw ConfigurationError("step graph: empty step id");

        const bool terminal_category = step.category == StepCategory::Terminal;
        if (terminal_category != step.is_terminal()) {
            throw ConfigurationError("step graph: step '" + id +
                                     "' must have exactly one successor or be terminal");
        }
        if (step.successor && steps_.find(*step.successor) == steps_.end()) {
            throw ConfigurationError("step graph: step '" + id + "' points to undefined '" +
                                     *step.successor + "'");
        }

        const bool needs_eye = step.category == StepCategory::MonocularRefraction ||
                               step.category == StepCategory::CrossCylinder;
        if (needs_eye && !step.eye) {
            throw ConfigurationError("step graph: refraction step '" + id + "' names no eye");
        }
    }

    // One successor per step, so a cycle is a walk longer than the graph.
    for (const auto& entry : steps_) {
        const ProtocolStep* cur = &entry.second;
        std::size_t hops = 0;
        while (cur->successor) {
            if (++hops > steps_.size()) {
                throw ConfigurationError("step graph: cycle reachable from '" + entry.first + "'");
            }
            cur = &steps_.at(*cur->successor);
        }
    }
}

// ── Lookup ──────────────────────────────────────────────────────

const ProtocolStep* StepGraph::find(const StepId& id) const {
    auto it = steps_.find(id);
    return it == steps_.end() ? nullptr : &it->second;
}

const ProtocolStep& StepGraph::at(const StepId& id) const {
    auto it = steps_.find(id);
    if (it == steps_.end()) throw std::out_of_range("unknown protocol step '" + id + "'");
    return it->second;
}

std::vector<StepId> StepGraph::walk() const {
    std::vector<StepId> order;
    const ProtocolStep* cur = &steps_.at(start_);
    order.push_back(cur->id);
    while (cur->successor) {
        cur = &steps_.at(*cur->successor);
        order.push_back(cur->id);
    }
    return order;
}

// ── Clinical default ────────────────────────────────────────────

StepGraph StepGraph::clinical_default() {
    const SlotRequirement clarity{"clarity_feedback", {"first_better", "second_better", "both_same"}};
    const SlotRequirement colour{"color_preference", {"red", "green", "both"}};

    auto step = [](StepId id, StepId next, StepCategory category,
                   std::optional<Eye> eye = std::nullopt,
                   std::vector<SlotRequirement> required = {}) {
        ProtocolStep s;
        s.id             = std::move(id);
        s.successor      = std::move(next);
        s.category       = category;
        s.eye            = eye;
        s.required_slots = std::move(required);
        return s;
    };
    auto terminal = [](StepId id) {
        ProtocolStep s;
        s.id       = std::move(id);
        s.category = StepCategory::Terminal;
        return s;
    };

    std::vector<ProtocolStep> steps = {
        step("0.1", "0.2", StepCategory::Intake),   // greeting
        step("0.2", "1.1", StepCategory::Intake),   // language
        step("1.1", "1.2", StepCategory::Intake),   // auto-refractometer
        step("1.2", "2.1", StepCategory::Intake),   // lensometer
        step("2.1", "2.2", StepCategory::Intake),   // distance acuity
        step("2.2", "2.3", StepCategory::Intake),   // intermediate acuity
        step("2.3", "3.1", StepCategory::Intake),   // near acuity
        step("3.1", "3.2", StepCategory::Intake),   // external inspection
        step("3.2", "3.3", StepCategory::Intake),   // pupils
        step("3.3", "4.1", StepCategory::Intake),   // anterior chamber
        step("4.1", "4.2", StepCategory::Intake),   // Hirschberg
        step("4.2", "4.3", StepCategory::Intake),   // motility
        step("4.3", "4.4", StepCategory::Intake),   // cover/uncover
        step("4.4", "5.1", StepCategory::Intake),   // convergence
        step("5.1", "5.2", StepCategory::Intake),   // distance PD
        step("5.2", "6.1", StepCategory::Intake),   // near PD
        step("6.1", "6.2", StepCategory::MonocularRefraction, Eye::OD, {clarity}),
        step("6.2", "6.3", StepCategory::CrossCylinder,       Eye::OD, {clarity}),
        step("6.3", "6.4", StepCategory::MonocularRefraction, Eye::OS, {clarity}),
        step("6.4", "6.5", StepCategory::CrossCylinder,       Eye::OS, {clarity}),
        step("6.5", "7.1", StepCategory::BinocularBalance,    std::nullopt, {clarity}),
        step("7.1", "7.2", StepCategory::NearVision,          std::nullopt, {colour}),
        step("7.2", "8.1", StepCategory::NearVision,          std::nullopt, {colour}),
        step("8.1", "8.2", StepCategory::Verification),
        step("8.2", "9.1", StepCategory::Verification),
        step("9.1", "9.2", StepCategory::Verification),
        step("9.2", kCompleteStep, StepCategory::Verification),
        terminal(kCompleteStep),
        terminal(kEscalateStep),
    };

    return StepGraph(std::move(steps), "0.1");
}

// ── JSON ────────────────────────────────────────────────────────

StepGraph StepGraph::from_json(const std::string& json_text) {
    std::vector<ProtocolStep> steps;
    StepId start;

    try {
        auto j = nlohmann::json::parse(json_text);
        start = j.at("start").get<std::string>();

        for (const auto& js : j.at("steps")) {
            ProtocolStep s;
            s.id = js.at("id").get<std::string>();

            if (js.contains("successor") && !js["successor"].is_null()) {
                s.successor = js["successor"].get<std::string>();
            }

            const std::string category = js.value("category", std::string("intake"));
            auto parsed = step_category_from_string(category);
            if (!parsed) {
                throw ConfigurationError("step graph: step '" + s.id +
                                         "' has unknown category '" + category + "'");
            }
            s.category = *parsed;

            if (js.contains("eye")) {
                const std::string eye = js["eye"].get<std::string>();
                s.eye = eye_from_string(eye);
                if (!s.eye) {
                    throw ConfigurationError("step graph: step '" + s.id +
                                             "' has unknown eye '" + eye + "'");
                }
            }

            if (js.contains("required_slots")) {
                for (const auto& [key, values] : js["required_slots"].items()) {
                    SlotRequirement req;
                    req.key      = key;
                    req.accepted = values.get<std::vector<std::string>>();
                    s.required_slots.push_back(std::move(req));
                }
            }

            steps.push_back(std::move(s));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("step graph: ") + e.what());
    }

    StepGraph graph(std::move(steps), start);
    std::cout << "[PROTOCOL] Loaded " << graph.size() << " steps, start " << graph.start() << ".\n";
    return graph;
}

StepGraph StepGraph::load(const std::string& path) {
    return from_json(read_config_file(path));
}

} // namespace optum
