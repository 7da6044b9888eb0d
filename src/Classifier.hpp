// Classifier.hpp
// Combines the HTTP, DNS and WHOIS probe outcomes into one verdict
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "HttpProber.hpp"
#include "Probe.hpp"
#include "Verdict.hpp"

namespace Livecheck {

enum class ClassifierState {
    Start,
    AwaitingHttp,
    AwaitingDns,
    AwaitingWhois,
    ActiveFinal,
    InactiveFinal
};

const char* stateToString(ClassifierState s);

// What it takes for an HTTP-silent target to count as active.
enum class FallbackPolicy {
    DnsAndWhois, // DNS must resolve and WHOIS must return a record
    DnsOnly      // DNS resolution alone is enough; WHOIS is not queried
};

std::optional<FallbackPolicy> parseFallbackPolicy(const std::string& text);

// The probes a classification runs. Real probers in production, fakes in tests.
struct ProbeSuite {
    std::function<HttpProbeResult(const std::string& url)> http;
    std::function<ProbeOutcome(const std::string& host)> dns;
    std::function<ProbeOutcome(const std::string& host)> whois;
    // Optional. Run by each worker thread after its last target to release
    // per-thread probe state.
    std::function<void()> threadDone;
};

struct Classification {
    Verdict verdict{Verdict::Inactive};
    std::vector<ClassifierState> trace;   // every state visited, Start first
    HttpProbeResult http;
    std::optional<ProbeOutcome> dns;      // unset when DNS was not attempted
    std::optional<ProbeOutcome> whois;    // unset when WHOIS was not attempted

    ClassifierState finalState() const { return trace.empty() ? ClassifierState::Start : trace.back(); }
};

class Classifier {
public:
    explicit Classifier(ProbeSuite probes, FallbackPolicy policy = FallbackPolicy::DnsAndWhois);

    // HTTP first; then DNS gating WHOIS. An absent host ends the fallback as inactive.
    // Exceptions thrown by a probe propagate to the caller.
    Classification classify(const std::string& probeUrl, const std::optional<std::string>& host) const;

    FallbackPolicy policy() const { return m_policy; }

    void threadDone() const;

private:
    ProbeSuite m_probes;
    FallbackPolicy m_policy;
};

} // namespace Livecheck
