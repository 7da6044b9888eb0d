#include "HttpProber.hpp"

#include "Log.hpp"
#include "Target.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <stdexcept>
#include <utility>

#include <curl/curl.h>

namespace Livecheck {

namespace {

// Codes that still prove a responding, configured server.
constexpr std::array<long, 29> kActiveCodes = {
    200, 201, 202, 203, 204, 205, 206,
    300, 301, 302, 303, 304, 307, 308,
    401, 403, 405, 406, 407, 408, 409, 410,
    429,
    500, 501, 502, 503, 504, 505,
};

constexpr std::array<long, 3> kInactiveCodes = {
    404, 410, 451,
};

size_t discard_cb(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

// One easy handle per worker thread so connections are reused across targets.
struct ThreadHandle {
    CURL* curl{nullptr};
    ThreadHandle() = default;
    ~ThreadHandle() { release(); }
    ThreadHandle(const ThreadHandle&) = delete;
    ThreadHandle& operator=(const ThreadHandle&) = delete;

    void release() {
        if (curl) curl_easy_cleanup(curl);
        curl = nullptr;
    }
};

thread_local ThreadHandle t_handle;

CURL* threadHandle() {
    if (!t_handle.curl) t_handle.curl = curl_easy_init();
    return t_handle.curl;
}

} // anonymous namespace

StatusCategory classifyStatus(long code) {
    if (std::find(kActiveCodes.begin(), kActiveCodes.end(), code) != kActiveCodes.end()) {
        return StatusCategory::Active;
    }
    if (std::find(kInactiveCodes.begin(), kInactiveCodes.end(), code) != kInactiveCodes.end()) {
        return StatusCategory::Inactive;
    }
    return StatusCategory::Ambiguous;
}

const char* categoryToString(StatusCategory c) {
    switch (c) {
        case StatusCategory::Active: return "active";
        case StatusCategory::Inactive: return "inactive";
        case StatusCategory::Ambiguous: return "ambiguous";
    }
    return "unknown";
}

bool isWwwHost(const std::string& url) {
    auto host = hostFromUrl(url);
    return host && host->rfind("www.", 0) == 0;
}

HttpLibrary::HttpLibrary() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
    }
}

HttpLibrary::~HttpLibrary() {
    curl_global_cleanup();
}

HttpProber::HttpProber(HttpProberOptions options)
    : m_options(std::move(options)) {}

void HttpProber::releaseThreadHandle() {
    t_handle.release();
}

HttpProbeResult HttpProber::probe(const std::string& url) const {
    HttpProbeResult result;
    try {
        CURL* curl = threadHandle();
        if (!curl) {
            result.error = "Failed to initialize CURL";
            Log::info(2, "Http", "HTTP check for " + url + " failed: " + result.error);
            return result;
        }
        // Reset keeps the connection cache of this handle.
        curl_easy_reset(curl);

        char errbuf[CURL_ERROR_SIZE];
        errbuf[0] = '\0';

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, m_options.maxRedirects);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, m_options.timeoutMs);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, m_options.timeoutMs);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, m_options.userAgent.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_cb);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

        CURLcode rc = curl_easy_perform(curl);
        if (rc != CURLE_OK) {
            result.error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
            Log::info(2, "Http", "HTTP check for " + url + " failed: " + result.error);
            return result;
        }

        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        char* effective = nullptr;
        curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective);

        result.statusCode = code;
        result.finalUrl = effective ? effective : url;
        result.category = classifyStatus(code);
        result.isActive = (result.category == StatusCategory::Active);
        result.redirectedToWWW = isWwwHost(result.finalUrl);
    } catch (const std::exception& e) {
        result = HttpProbeResult{};
        result.error = e.what();
        Log::info(2, "Http", "HTTP check for " + url + " failed: " + result.error);
        return result;
    }

    if (Log::enabled(2)) {
        const std::string code = std::to_string(result.statusCode);
        switch (result.category) {
            case StatusCategory::Active:
                Log::info(2, "Http", "HTTP check for " + url + " succeeded with status code " + code);
                break;
            case StatusCategory::Inactive:
                Log::info(2, "Http", "HTTP check for " + url + " failed with status code " + code);
                break;
            case StatusCategory::Ambiguous:
                Log::info(2, "Http", "HTTP check for " + url + " returned status code " + code);
                break;
        }
        if (result.redirectedToWWW) {
            Log::info(2, "Http", "Redirected to www: " + result.finalUrl);
        }
    }
    return result;
}

} // namespace Livecheck
