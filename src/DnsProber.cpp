#include "DnsProber.hpp"

#include "Log.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>

#include <ares.h>
#include <poll.h>

namespace Livecheck {

namespace {

using Clock = std::chrono::steady_clock;

struct Lookup {
    bool done{false};
    int status{ARES_ENOTFOUND};
    std::vector<ResolvedAddress>* addresses{nullptr}; // filled when set
};

void addrinfo_cb(void* arg, int status, int /*timeouts*/, struct ares_addrinfo* res) {
    auto* lookup = static_cast<Lookup*>(arg);
    lookup->done = true;
    lookup->status = status;
    if (res && lookup->addresses) {
        for (ares_addrinfo_node* node = res->nodes; node; node = node->ai_next) {
            if (!node->ai_addr || node->ai_addrlen > sizeof(sockaddr_storage)) continue;
            ResolvedAddress a;
            a.family = node->ai_family;
            a.socktype = node->ai_socktype ? node->ai_socktype : SOCK_STREAM;
            a.protocol = node->ai_protocol;
            std::memcpy(&a.addr, node->ai_addr, node->ai_addrlen);
            a.length = static_cast<socklen_t>(node->ai_addrlen);
            lookup->addresses->push_back(a);
        }
    }
    if (res) ares_freeaddrinfo(res);
}

// Drives one ares_getaddrinfo to completion or the deadline. Sockets are waited
// on with poll(), so descriptor numbers above FD_SETSIZE are fine.
void runLookup(ares_channel channel, const Lookup& lookup, Clock::time_point deadline) {
    while (!lookup.done) {
        auto now = Clock::now();
        if (now >= deadline) {
            // Fires the callback with ARES_ECANCELLED.
            ares_cancel(channel);
            break;
        }
        auto left = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now).count();
        struct timeval maxtv;
        maxtv.tv_sec = static_cast<long>(left / 1000000);
        maxtv.tv_usec = static_cast<long>(left % 1000000);
        struct timeval tv;
        struct timeval* tvp = ares_timeout(channel, &maxtv, &tv);
        int waitMs = static_cast<int>(tvp->tv_sec * 1000 + (tvp->tv_usec + 999) / 1000);

        ares_socket_t socks[ARES_GETSOCK_MAXNUM];
        int bits = ares_getsock(channel, socks, ARES_GETSOCK_MAXNUM);
        pollfd pfds[ARES_GETSOCK_MAXNUM];
        nfds_t count = 0;
        for (int i = 0; i < ARES_GETSOCK_MAXNUM; ++i) {
            short events = 0;
            if (ARES_GETSOCK_READABLE(bits, i)) events |= POLLIN;
            if (ARES_GETSOCK_WRITABLE(bits, i)) events |= POLLOUT;
            if (events == 0) continue;
            pfds[count++] = pollfd{socks[i], events, 0};
        }

        // With no sockets open this just sleeps until c-ares' next timeout.
        int rc = ::poll(pfds, count, waitMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            ares_cancel(channel);
            break;
        }
        if (rc == 0) {
            // Nothing ready: let c-ares handle its retransmit/timeouts.
            ares_process_fd(channel, ARES_SOCKET_BAD, ARES_SOCKET_BAD);
            continue;
        }
        for (nfds_t i = 0; i < count && !lookup.done; ++i) {
            if (pfds[i].revents == 0) continue;
            ares_socket_t r = (pfds[i].revents & (POLLIN | POLLERR | POLLHUP)) ? pfds[i].fd : ARES_SOCKET_BAD;
            ares_socket_t w = (pfds[i].revents & POLLOUT) ? pfds[i].fd : ARES_SOCKET_BAD;
            ares_process_fd(channel, r, w);
        }
    }
}

// Returns the ares status of a lookup of host (and service, when non-null).
int lookupHost(const std::string& host, const char* service, int socktype, int timeoutMs,
               std::vector<ResolvedAddress>* addresses, std::string& error) {
    struct ares_options opts;
    std::memset(&opts, 0, sizeof(opts));
    opts.timeout = std::max(timeoutMs, 1);
    opts.tries = 1;

    // Channel per lookup: nothing is shared between workflows.
    ares_channel channel = nullptr;
    int rc = ares_init_options(&channel, &opts, ARES_OPT_TIMEOUTMS | ARES_OPT_TRIES);
    if (rc != ARES_SUCCESS) {
        error = std::string("DNS resolver init failed: ") + ares_strerror(rc);
        return rc;
    }

    struct ares_addrinfo_hints hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = socktype;

    Lookup lookup;
    lookup.addresses = addresses;
    ares_getaddrinfo(channel, host.c_str(), service, &hints, addrinfo_cb, &lookup);
    runLookup(channel, lookup, Clock::now() + std::chrono::milliseconds(timeoutMs));
    ares_destroy(channel);

    if (lookup.status != ARES_SUCCESS) {
        error = (lookup.status == ARES_ECANCELLED) ? std::string("timed out") : std::string(ares_strerror(lookup.status));
    }
    return lookup.status;
}

} // anonymous namespace

DnsLibrary::DnsLibrary() {
    int rc = ares_library_init(ARES_LIB_INIT_ALL);
    if (rc != ARES_SUCCESS) {
        throw std::runtime_error(std::string("ares_library_init failed: ") + ares_strerror(rc));
    }
}

DnsLibrary::~DnsLibrary() {
    ares_library_cleanup();
}

std::vector<ResolvedAddress> resolveAddresses(const std::string& host, int port, int timeoutMs,
                                              std::string& error) {
    std::vector<ResolvedAddress> addresses;
    if (timeoutMs <= 0) {
        error = "timed out";
        return addresses;
    }
    const std::string service = std::to_string(port);
    int status = lookupHost(host, service.c_str(), SOCK_STREAM, timeoutMs, &addresses, error);
    if (status == ARES_SUCCESS && addresses.empty()) {
        error = "no addresses";
    }
    return addresses;
}

DnsProber::DnsProber(DnsProberOptions options)
    : m_options(options) {}

ProbeOutcome DnsProber::probe(const std::string& host) const {
    std::string error;
    int status = lookupHost(host, nullptr, 0, m_options.timeoutMs, nullptr, error);
    if (status == ARES_SUCCESS) {
        Log::info(2, "Dns", "DNS Lookup for " + host + " succeeded");
        return ProbeOutcome::ok();
    }
    std::string why = "DNS Lookup Failed: " + error;
    Log::info(2, "Dns", "DNS Lookup for " + host + " failed: " + why);
    return ProbeOutcome::failure(why);
}

} // namespace Livecheck
