// Target.hpp
// Turns raw input lines into probe URLs and bare hosts
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Livecheck {

struct NormalizedTarget {
    std::string target;               // trimmed input line, written to the output files
    std::string probeUrl;             // what the HTTP prober requests
    std::optional<std::string> host;  // for DNS/WHOIS; absent when the URL does not parse
};

std::string trim(const std::string& s);

// Never throws. Bare hosts get an "http://" prefix.
NormalizedTarget normalizeTarget(const std::string& raw);

// Host component of an absolute URL, lower-cased and without a trailing dot.
std::optional<std::string> hostFromUrl(const std::string& url);

bool hasHttpScheme(const std::string& s);

// Reads one target per line. Blank lines and '#' comments are skipped.
// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> loadTargets(const std::string& path);

} // namespace Livecheck
