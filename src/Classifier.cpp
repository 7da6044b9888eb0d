#include "Classifier.hpp"

#include <utility>

namespace Livecheck {

const char* stateToString(ClassifierState s) {
    switch (s) {
        case ClassifierState::Start: return "START";
        case ClassifierState::AwaitingHttp: return "AWAITING_HTTP";
        case ClassifierState::AwaitingDns: return "AWAITING_DNS";
        case ClassifierState::AwaitingWhois: return "AWAITING_WHOIS";
        case ClassifierState::ActiveFinal: return "ACTIVE_FINAL";
        case ClassifierState::InactiveFinal: return "INACTIVE_FINAL";
    }
    return "UNKNOWN";
}

std::optional<FallbackPolicy> parseFallbackPolicy(const std::string& text) {
    if (text == "dns-whois") return FallbackPolicy::DnsAndWhois;
    if (text == "dns-only") return FallbackPolicy::DnsOnly;
    return std::nullopt;
}

Classifier::Classifier(ProbeSuite probes, FallbackPolicy policy)
    : m_probes(std::move(probes)), m_policy(policy) {}

void Classifier::threadDone() const {
    if (m_probes.threadDone) m_probes.threadDone();
}

Classification Classifier::classify(const std::string& probeUrl,
                                    const std::optional<std::string>& host) const {
    Classification result;
    ClassifierState state = ClassifierState::Start;
    result.trace.push_back(state);

    while (state != ClassifierState::ActiveFinal && state != ClassifierState::InactiveFinal) {
        switch (state) {
            case ClassifierState::Start:
                state = ClassifierState::AwaitingHttp;
                break;

            case ClassifierState::AwaitingHttp:
                result.http = m_probes.http(probeUrl);
                if (result.http.liveness()) {
                    state = ClassifierState::ActiveFinal;
                } else if (!host) {
                    state = ClassifierState::InactiveFinal;
                } else {
                    state = ClassifierState::AwaitingDns;
                }
                break;

            case ClassifierState::AwaitingDns:
                result.dns = m_probes.dns(*host);
                if (!*result.dns) {
                    state = ClassifierState::InactiveFinal;
                } else if (m_policy == FallbackPolicy::DnsOnly) {
                    state = ClassifierState::ActiveFinal;
                } else {
                    state = ClassifierState::AwaitingWhois;
                }
                break;

            case ClassifierState::AwaitingWhois:
                result.whois = m_probes.whois(*host);
                state = *result.whois ? ClassifierState::ActiveFinal : ClassifierState::InactiveFinal;
                break;

            case ClassifierState::ActiveFinal:
            case ClassifierState::InactiveFinal:
                break;
        }
        result.trace.push_back(state);
    }

    result.verdict = (state == ClassifierState::ActiveFinal) ? Verdict::Active : Verdict::Inactive;
    return result;
}

} // namespace Livecheck
