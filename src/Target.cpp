#include "Target.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include <curl/curl.h>

namespace Livecheck {

namespace {

bool isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool startsWithNoCase(const std::string& s, const char* prefix) {
    size_t n = std::char_traits<char>::length(prefix);
    if (s.size() < n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

} // anonymous namespace

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && isWhitespace(s[i])) ++i;
    while (j > i && isWhitespace(s[j - 1])) --j;
    return s.substr(i, j - i);
}

bool hasHttpScheme(const std::string& s) {
    return startsWithNoCase(s, "http://") || startsWithNoCase(s, "https://");
}

std::optional<std::string> hostFromUrl(const std::string& url) {
    CURLU* handle = curl_url();
    if (!handle) return std::nullopt;

    std::optional<std::string> result;
    if (curl_url_set(handle, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK) {
        char* host = nullptr;
        if (curl_url_get(handle, CURLUPART_HOST, &host, 0) == CURLUE_OK && host) {
            std::string h(host);
            curl_free(host);
            std::transform(h.begin(), h.end(), h.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            while (!h.empty() && h.back() == '.') h.pop_back();
            if (!h.empty()) result = std::move(h);
        }
    }
    curl_url_cleanup(handle);
    return result;
}

NormalizedTarget normalizeTarget(const std::string& raw) {
    NormalizedTarget out;
    out.target = trim(raw);
    if (hasHttpScheme(out.target)) {
        out.probeUrl = out.target;
    } else {
        out.probeUrl = "http://" + out.target;
    }
    out.host = hostFromUrl(out.probeUrl);
    return out;
}

std::vector<std::string> loadTargets(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open input file: " + path);
    }
    std::vector<std::string> targets;
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        targets.emplace_back(std::move(t));
    }
    if (in.bad()) {
        throw std::runtime_error("error while reading input file: " + path);
    }
    return targets;
}

} // namespace Livecheck
