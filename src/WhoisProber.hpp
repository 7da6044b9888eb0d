// WhoisProber.hpp
// Registration lookup over the WHOIS protocol (TCP port 43), with the server
// chosen from a TLD -> server table
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "Probe.hpp"

namespace Livecheck {

struct WhoisServer {
    std::string host;
    int port{43};
};

class WhoisServerTable {
public:
    // Built-in table covering the common gTLDs and ccTLDs.
    static WhoisServerTable defaults();

    // Keys are lower-case suffixes without a leading dot ("com", "co.uk").
    void set(const std::string& suffix, WhoisServer server);

    // Merges "suffix server[:port]" lines; '#' starts a comment.
    // Throws std::runtime_error if the file cannot be read or a line is malformed.
    void loadFile(const std::string& path);

    // Longest matching suffix wins, so "co.uk" beats "uk".
    std::optional<WhoisServer> find(const std::string& domain) const;

    size_t size() const { return m_servers.size(); }

private:
    std::unordered_map<std::string, WhoisServer> m_servers;
};

// "host" or "host:port"; nullopt on a bad port.
std::optional<WhoisServer> parseWhoisServer(const std::string& text);

struct WhoisProberOptions {
    int timeoutMs{5000};              // connect + send + read, per probe
    bool requireMatch{false};         // treat registry "not found" replies as failures
    size_t maxResponseBytes{256 * 1024};
};

class WhoisProber {
public:
    WhoisProber(WhoisServerTable servers, WhoisProberOptions options = {});

    // Success on the first non-empty record. Never throws.
    ProbeOutcome probe(const std::string& host) const;

    const WhoisServerTable& servers() const { return m_servers; }

private:
    // Sends one query and reads until the server closes. Returns false with
    // `error` set on connect/read failure or timeout.
    bool query(const WhoisServer& server, const std::string& domain,
               std::string& response, std::string& error) const;

    WhoisServerTable m_servers;
    WhoisProberOptions m_options;
};

// True if the reply carries one of the registries' "no such domain" markers.
bool looksLikeNoMatch(const std::string& response);

} // namespace Livecheck
