#pragma once

#include "session/session.h"

#include <memory>
#include <string>

namespace optum {

// Hands finished-session snapshots to the reporting collaborator over
// HTTP. Report formats are that collaborator's business; this only POSTs
// the snapshot JSON.
class ReportClient {
public:
    // An empty url disables delivery. The bearer token is read from
    // OPTUM_REPORT_TOKEN when `token` is empty.
    explicit ReportClient(const std::string& url, const std::string& token = {},
                          long timeout_seconds = 10);
    ~ReportClient();

    ReportClient(const ReportClient&) = delete;
    ReportClient& operator=(const ReportClient&) = delete;

    bool enabled() const;

    // Returns true on a 2xx reply. Failures are logged, never thrown.
    bool submit(const SessionSnapshot& snapshot);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace optum
