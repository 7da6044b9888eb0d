// Config.hpp
// Command-line and environment settings for a livecheck run
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "Classifier.hpp"
#include "Verdict.hpp"

namespace Livecheck {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Settings {
    std::string inputFile;
    std::string outputFile;                 // prefix for <out>_ACTIVE.txt / <out>_INACTIVE.txt
    Exclusion exclude{Exclusion::None};
    size_t concurrency{10};
    int verboseLevel{1};
    long httpTimeoutMs{5000};
    int dnsTimeoutMs{3000};
    int whoisTimeoutMs{5000};
    std::string whoisServersFile;           // optional overrides for the built-in table
    bool whoisRequireMatch{false};
    FallbackPolicy fallback{FallbackPolicy::DnsAndWhois};
    bool showHelp{false};
};

// Command line wins over LIVECHECK_* environment variables.
// Throws ConfigError on unknown flags, bad values or missing required settings.
Settings parseSettings(int argc, char** argv);

std::string usage(const char* argv0);

} // namespace Livecheck
