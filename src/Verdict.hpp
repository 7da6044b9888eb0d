// Verdict.hpp
// Final per-target classification and the output exclusion filter
#pragma once

#include <optional>
#include <string>

namespace Livecheck {

enum class Verdict {
    Active,
    Inactive
};

// Which verdict category to drop instead of writing it out.
enum class Exclusion {
    None,
    Active,
    Inactive
};

const char* verdictToString(Verdict v);

// "", "ACTIVE" or "INACTIVE" (case-insensitive). Anything else is nullopt.
std::optional<Exclusion> parseExclusion(const std::string& text);

bool isExcluded(Verdict v, Exclusion exclusion);

} // namespace Livecheck
