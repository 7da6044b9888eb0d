#include "Config.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <functional>
#include <sstream>
#include <vector>

namespace Livecheck {

namespace {

long parseNumber(const std::string& name, const std::string& text, long minValue, long maxValue) {
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || !end || *end != '\0' || errno == ERANGE) {
        throw ConfigError(name + ": expected a number, got '" + text + "'");
    }
    if (v < minValue || v > maxValue) {
        throw ConfigError(name + ": " + text + " is out of range [" + std::to_string(minValue) +
                          ", " + std::to_string(maxValue) + "]");
    }
    return v;
}

struct Option {
    const char* longName;   // without the leading "--"
    const char* shortName;  // without the leading "-", or nullptr
    const char* envName;    // or nullptr
    bool takesValue;
    std::function<void(Settings&, const std::string&)> apply;
};

std::vector<Option> options() {
    return {
        {"input-file", "i", "LIVECHECK_INPUT", true,
         [](Settings& s, const std::string& v) { s.inputFile = v; }},
        {"output-file", "o", "LIVECHECK_OUTPUT", true,
         [](Settings& s, const std::string& v) { s.outputFile = v; }},
        {"exclude", "e", "LIVECHECK_EXCLUDE", true,
         [](Settings& s, const std::string& v) {
             auto e = parseExclusion(v);
             if (!e) throw ConfigError("exclude: expected ACTIVE, INACTIVE or empty, got '" + v + "'");
             s.exclude = *e;
         }},
        {"concurrency", "c", "LIVECHECK_CONCURRENCY", true,
         [](Settings& s, const std::string& v) {
             s.concurrency = static_cast<size_t>(parseNumber("concurrency", v, 1, 100000));
         }},
        {"verbose-level", "v", "LIVECHECK_VERBOSE", true,
         [](Settings& s, const std::string& v) {
             s.verboseLevel = static_cast<int>(parseNumber("verbose-level", v, 0, 2));
         }},
        {"http-timeout-ms", nullptr, nullptr, true,
         [](Settings& s, const std::string& v) { s.httpTimeoutMs = parseNumber("http-timeout-ms", v, 1, INT_MAX); }},
        {"dns-timeout-ms", nullptr, nullptr, true,
         [](Settings& s, const std::string& v) {
             s.dnsTimeoutMs = static_cast<int>(parseNumber("dns-timeout-ms", v, 1, INT_MAX));
         }},
        {"whois-timeout-ms", nullptr, nullptr, true,
         [](Settings& s, const std::string& v) {
             s.whoisTimeoutMs = static_cast<int>(parseNumber("whois-timeout-ms", v, 1, INT_MAX));
         }},
        {"whois-servers", nullptr, "LIVECHECK_WHOIS_SERVERS", true,
         [](Settings& s, const std::string& v) { s.whoisServersFile = v; }},
        {"whois-require-match", nullptr, nullptr, false,
         [](Settings& s, const std::string&) { s.whoisRequireMatch = true; }},
        {"fallback", nullptr, nullptr, true,
         [](Settings& s, const std::string& v) {
             auto p = parseFallbackPolicy(v);
             if (!p) throw ConfigError("fallback: expected dns-whois or dns-only, got '" + v + "'");
             s.fallback = *p;
         }},
        {"help", "h", nullptr, false,
         [](Settings& s, const std::string&) { s.showHelp = true; }},
    };
}

} // anonymous namespace

Settings parseSettings(int argc, char** argv) {
    Settings settings;
    const auto opts = options();

    for (const auto& opt : opts) {
        if (!opt.envName) continue;
        if (const char* env = std::getenv(opt.envName)) {
            opt.apply(settings, env);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const Option* match = nullptr;
        std::string value;
        bool hasInlineValue = false;

        for (const auto& opt : opts) {
            const std::string longFlag = std::string("--") + opt.longName;
            if (arg == longFlag) {
                match = &opt;
                break;
            }
            if (opt.takesValue && arg.rfind(longFlag + "=", 0) == 0) {
                match = &opt;
                value = arg.substr(longFlag.size() + 1);
                hasInlineValue = true;
                break;
            }
            if (opt.shortName && arg == std::string("-") + opt.shortName) {
                match = &opt;
                break;
            }
        }
        if (!match) {
            throw ConfigError("unknown argument: " + arg);
        }
        if (match->takesValue && !hasInlineValue) {
            if (i + 1 >= argc) {
                throw ConfigError(std::string("--") + match->longName + " requires a value");
            }
            value = argv[++i];
        }
        match->apply(settings, value);
    }

    if (settings.showHelp) return settings;
    if (settings.inputFile.empty()) throw ConfigError("--input-file is required");
    if (settings.outputFile.empty()) throw ConfigError("--output-file is required");
    return settings;
}

std::string usage(const char* argv0) {
    std::ostringstream out;
    out << "Usage: " << (argv0 ? argv0 : "livecheck") << " -i <input> -o <output> [options]\n"
        << "  -i, --input-file FILE       targets, one domain or URL per line\n"
        << "  -o, --output-file PREFIX    writes PREFIX_ACTIVE.txt and PREFIX_INACTIVE.txt\n"
        << "  -e, --exclude STATUS        ACTIVE or INACTIVE results are not written\n"
        << "  -c, --concurrency N         targets probed at once (default 10)\n"
        << "  -v, --verbose-level N       0 quiet, 1 results, 2 probe detail (default 1)\n"
        << "      --http-timeout-ms MS    total HTTP request timeout (default 5000)\n"
        << "      --dns-timeout-ms MS     DNS lookup timeout (default 3000)\n"
        << "      --whois-timeout-ms MS   WHOIS query timeout (default 5000)\n"
        << "      --whois-servers FILE    extra 'tld server[:port]' entries\n"
        << "      --whois-require-match   registry 'not found' replies count as failures\n"
        << "      --fallback POLICY       dns-whois (default) or dns-only\n"
        << "  -h, --help                  show this help\n"
        << "Environment: LIVECHECK_INPUT, LIVECHECK_OUTPUT, LIVECHECK_EXCLUDE,\n"
        << "  LIVECHECK_CONCURRENCY, LIVECHECK_VERBOSE, LIVECHECK_WHOIS_SERVERS\n";
    return out.str();
}

} // namespace Livecheck
