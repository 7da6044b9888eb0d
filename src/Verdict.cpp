#include "Verdict.hpp"

#include <algorithm>
#include <cctype>

namespace Livecheck {

const char* verdictToString(Verdict v) {
    switch (v) {
        case Verdict::Active: return "ACTIVE";
        case Verdict::Inactive: return "INACTIVE";
    }
    return "UNKNOWN";
}

std::optional<Exclusion> parseExclusion(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper.empty()) return Exclusion::None;
    if (upper == "ACTIVE") return Exclusion::Active;
    if (upper == "INACTIVE") return Exclusion::Inactive;
    return std::nullopt;
}

bool isExcluded(Verdict v, Exclusion exclusion) {
    switch (exclusion) {
        case Exclusion::None: return false;
        case Exclusion::Active: return v == Verdict::Active;
        case Exclusion::Inactive: return v == Verdict::Inactive;
    }
    return false;
}

} // namespace Livecheck
