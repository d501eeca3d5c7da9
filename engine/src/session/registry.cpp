#include "session/registry.h"

#include <iostream>

namespace optum {

SessionRegistry::SessionRegistry(std::shared_ptr<const StepGraph> graph, EngineConfig config,
                                 std::size_t retired_capacity)
    : graph_(std::move(graph))
    , config_(std::move(config))
    , retired_capacity_(retired_capacity)
{
    if (!graph_) throw ConfigurationError("session registry: no step graph");
    config_.validate();
}

ExamSession& SessionRegistry::open(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end()) return *it->second;
    if (retired_.count(id)) throw ConfigurationError("session " + id + " already finished");

    auto session = std::make_unique<ExamSession>(id, graph_, config_);
    ExamSession& ref = *session;
    sessions_.emplace(id, std::move(session));
    std::cout << "[SESSION] Registry holds " << sessions_.size() << " session(s).\n";
    return ref;
}

ExamSession* SessionRegistry::find(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.get();
}

std::optional<SessionSnapshot> SessionRegistry::close(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;

    SessionSnapshot snap = it->second->snapshot();
    sessions_.erase(it);

    if (retired_capacity_ > 0 && retired_.insert(id).second) {
        retired_order_.push_back(id);
        if (retired_order_.size() > retired_capacity_) {
            retired_.erase(retired_order_.front());
            retired_order_.pop_front();
        }
    }
    return snap;
}

bool SessionRegistry::retired(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return retired_.count(id) > 0;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

std::size_t SessionRegistry::retired_count() const {
    std::lock_guard lock(mutex_);
    return retired_order_.size();
}

} // namespace optum
