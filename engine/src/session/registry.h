#pragma once

#include "session/session.h"

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace optum {

// Owns every live ExamSession. Only the map is locked; a session itself
// must still be driven by one thread at a time.
//
// Closed sessions leave the map. Their ids are kept, up to
// `retired_capacity` of them, oldest forgotten first, so a late message
// for a finished exam is refused instead of starting a new one.
class SessionRegistry {
public:
    SessionRegistry(std::shared_ptr<const StepGraph> graph, EngineConfig config,
                    std::size_t retired_capacity = 4096);

    // Returns the session for `id`, creating it on first sight.
    // Throws ConfigurationError for a retired id.
    ExamSession& open(const std::string& id);

    ExamSession* find(const std::string& id);

    // Remove a session and retire its id, handing back its final snapshot.
    std::optional<SessionSnapshot> close(const std::string& id);

    bool retired(const std::string& id) const;

    std::size_t size() const;
    std::size_t retired_count() const;

private:
    std::shared_ptr<const StepGraph> graph_;
    EngineConfig                     config_;

    std::size_t                      retired_capacity_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<ExamSession>> sessions_;
    std::set<std::string>   retired_;
    std::deque<std::string> retired_order_;
};

} // namespace optum
