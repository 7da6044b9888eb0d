// Probe.hpp
// Success/Failure result shared by the DNS and WHOIS probers
#pragma once

#include <string>
#include <utility>

namespace Livecheck {

struct ProbeOutcome {
    bool success{false};
    std::string reason; // empty on success

    static ProbeOutcome ok() { return ProbeOutcome{true, {}}; }
    static ProbeOutcome failure(std::string why) { return ProbeOutcome{false, std::move(why)}; }

    explicit operator bool() const { return success; }
};

} // namespace Livecheck
