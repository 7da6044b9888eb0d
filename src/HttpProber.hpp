// HttpProber.hpp
// Single GET per target via libcurl, classified by a status-code table
#pragma once

#include <string>

namespace Livecheck {

enum class StatusCategory {
    Active,    // the server answered in a way that proves it is configured and live
    Inactive,  // explicit "does not exist / removed"
    Ambiguous  // neither; the fallback probes decide
};

StatusCategory classifyStatus(long code);
const char* categoryToString(StatusCategory c);

// True when the URL's host starts with "www.".
bool isWwwHost(const std::string& url);

struct HttpProbeResult {
    bool isActive{false};
    bool redirectedToWWW{false};
    long statusCode{0};               // 0 when no response was received
    StatusCategory category{StatusCategory::Ambiguous};
    std::string finalUrl;             // effective URL after redirects
    std::string error;                // transport error, empty if a response arrived

    bool liveness() const { return isActive || redirectedToWWW; }
};

struct HttpProberOptions {
    long timeoutMs{5000};
    long maxRedirects{10};
    std::string userAgent{"livecheck/1.0"};
};

class HttpProber {
public:
    explicit HttpProber(HttpProberOptions options = {});

    // Never throws. Transport failures come back with isActive = redirectedToWWW = false.
    // Each calling thread keeps its own curl handle until it exits or calls
    // releaseThreadHandle(); either must happen before the HttpLibrary goes away.
    HttpProbeResult probe(const std::string& url) const;

    // Frees the calling thread's curl handle. The next probe on the thread opens a new one.
    static void releaseThreadHandle();

    const HttpProberOptions& options() const { return m_options; }

private:
    HttpProberOptions m_options;
};

// Scoped curl_global_init/curl_global_cleanup for the process.
class HttpLibrary {
public:
    HttpLibrary();
    ~HttpLibrary();
    HttpLibrary(const HttpLibrary&) = delete;
    HttpLibrary& operator=(const HttpLibrary&) = delete;
};

} // namespace Livecheck
