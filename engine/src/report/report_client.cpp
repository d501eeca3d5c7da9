#include "report/report_client.h"

#include "codec/codec.h"

#include <curl/curl.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace optum {

// ── Helpers ─────────────────────────────────────────────────────

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buf = static_cast<std::string*>(userdata);
    buf->append(ptr, size * nmemb);
    return size * nmemb;
}

// Returns the HTTP status; throws on transport failure.
static long http_post(const std::string& url,
                      const std::string& json_body,
                      const std::string& token,
                      long timeout_seconds,
                      std::string& response) {
    CURL* curl = curl_easy_init();
    if (!curl) throw std::runtime_error("ReportClient: curl_easy_init failed");

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (!token.empty()) {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + token).c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("report POST failed: ") +
                                 curl_easy_strerror(res));
    }
    return status;
}

// ── Pimpl ───────────────────────────────────────────────────────

struct ReportClient::Impl {
    std::string url;
    std::string token;   // loaded from env OPTUM_REPORT_TOKEN
    long        timeout_seconds{10};
};

ReportClient::ReportClient(const std::string& url, const std::string& token,
                           long timeout_seconds)
    : impl_(std::make_unique<Impl>())
{
    impl_->url             = url;
    impl_->token           = token;
    impl_->timeout_seconds = timeout_seconds;

    // Read token from environment, never hard-coded.
    if (impl_->token.empty()) {
        const char* env = std::getenv("OPTUM_REPORT_TOKEN");
        if (env) impl_->token = env;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    if (impl_->url.empty()) {
        std::cout << "[REPORT] No report_url configured, snapshots stay local.\n";
    } else if (impl_->token.empty()) {
        std::cerr << "[REPORT] WARNING: OPTUM_REPORT_TOKEN not set, posting unauthenticated.\n";
    }
}

ReportClient::~ReportClient() {
    curl_global_cleanup();
}

bool ReportClient::enabled() const { return !impl_->url.empty(); }

bool ReportClient::submit(const SessionSnapshot& snapshot) {
    if (!enabled()) return false;

    const std::string body = snapshot_to_json(snapshot).dump();
    std::string response;
    try {
        long status = http_post(impl_->url, body, impl_->token,
                                impl_->timeout_seconds, response);
        if (status < 200 || status >= 300) {
            std::cerr << "[REPORT] Session " << snapshot.session_id
                      << " rejected by collector (HTTP " << status << "): "
                      << response << "\n";
            return false;
        }
        std::cout << "[REPORT] Session " << snapshot.session_id
                  << " delivered (HTTP " << status << ").\n";
        return true;
    } catch (const std::runtime_error& e) {
        std::cerr << "[REPORT] Session " << snapshot.session_id << ": " << e.what() << "\n";
        return false;
    }
}

} // namespace optum
