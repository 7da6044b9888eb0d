// DnsProber.hpp
// Resolves a host through c-ares using the system resolver configuration
#pragma once

#include <string>
#include <vector>

#include <sys/socket.h>

#include "Probe.hpp"

namespace Livecheck {

struct DnsProberOptions {
    int timeoutMs{3000}; // hard bound for one probe, including c-ares' own timeout
};

class DnsProber {
public:
    explicit DnsProber(DnsProberOptions options = {});

    // Success on any answer c-ares returns without error. No retries.
    ProbeOutcome probe(const std::string& host) const;

private:
    DnsProberOptions m_options;
};

// One socket address returned by resolveAddresses.
struct ResolvedAddress {
    int family{AF_UNSPEC};
    int socktype{0};
    int protocol{0};
    sockaddr_storage addr{};
    socklen_t length{0};
};

// Stream-socket addresses for host:port through c-ares, bounded by timeoutMs.
// Returns an empty list and fills `error` when nothing resolves in time.
std::vector<ResolvedAddress> resolveAddresses(const std::string& host, int port, int timeoutMs,
                                              std::string& error);

// Scoped ares_library_init/ares_library_cleanup for the process.
class DnsLibrary {
public:
    DnsLibrary();
    ~DnsLibrary();
    DnsLibrary(const DnsLibrary&) = delete;
    DnsLibrary& operator=(const DnsLibrary&) = delete;
};

} // namespace Livecheck
