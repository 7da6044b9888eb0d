#include "WhoisProber.hpp"

#include "DnsProber.hpp"
#include "Log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace Livecheck {

namespace {

using Clock = std::chrono::steady_clock;

struct Socket {
    int fd{-1};
    explicit Socket(int f) : fd(f) {}
    ~Socket() { if (fd >= 0) ::close(fd); }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
};

int msLeft(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Waits for `events` on fd until the deadline. Returns false on timeout or poll error.
bool waitFor(int fd, short events, Clock::time_point deadline) {
    for (;;) {
        int timeout = msLeft(deadline);
        if (timeout == 0) return false;
        pollfd pfd{fd, events, 0};
        int rc = ::poll(&pfd, 1, timeout);
        if (rc > 0) return true;
        if (rc == 0) return false;
        if (errno != EINTR) return false;
    }
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// Registry servers for the common TLDs.
const std::pair<const char*, const char*> kDefaultServers[] = {
    {"com", "whois.verisign-grs.com"},
    {"net", "whois.verisign-grs.com"},
    {"org", "whois.pir.org"},
    {"info", "whois.afilias.net"},
    {"biz", "whois.nic.biz"},
    {"io", "whois.nic.io"},
    {"co", "whois.nic.co"},
    {"me", "whois.nic.me"},
    {"tv", "whois.nic.tv"},
    {"cc", "ccwhois.verisign-grs.com"},
    {"app", "whois.nic.google"},
    {"dev", "whois.nic.google"},
    {"xyz", "whois.nic.xyz"},
    {"online", "whois.nic.online"},
    {"site", "whois.nic.site"},
    {"edu", "whois.educause.edu"},
    {"gov", "whois.dotgov.gov"},
    {"mobi", "whois.nic.mobi"},
    {"name", "whois.nic.name"},
    {"pro", "whois.nic.pro"},
    {"us", "whois.nic.us"},
    {"ca", "whois.cira.ca"},
    {"uk", "whois.nic.uk"},
    {"co.uk", "whois.nic.uk"},
    {"de", "whois.denic.de"},
    {"fr", "whois.nic.fr"},
    {"nl", "whois.domain-registry.nl"},
    {"be", "whois.dns.be"},
    {"eu", "whois.eu"},
    {"it", "whois.nic.it"},
    {"es", "whois.nic.es"},
    {"ch", "whois.nic.ch"},
    {"at", "whois.nic.at"},
    {"se", "whois.iis.se"},
    {"no", "whois.norid.no"},
    {"fi", "whois.fi"},
    {"dk", "whois.punktum.dk"},
    {"pl", "whois.dns.pl"},
    {"cz", "whois.nic.cz"},
    {"ru", "whois.tcinet.ru"},
    {"ua", "whois.ua"},
    {"jp", "whois.jprs.jp"},
    {"cn", "whois.cnnic.cn"},
    {"kr", "whois.kr"},
    {"in", "whois.registry.in"},
    {"au", "whois.auda.org.au"},
    {"com.au", "whois.auda.org.au"},
    {"nz", "whois.irs.net.nz"},
    {"br", "whois.registro.br"},
    {"mx", "whois.mx"},
    {"ar", "whois.nic.ar"},
    {"za", "whois.registry.net.za"},
};

const char* const kNoMatchMarkers[] = {
    "no match for",
    "not found",
    "no data found",
    "no entries found",
    "domain not found",
};

} // anonymous namespace

std::optional<WhoisServer> parseWhoisServer(const std::string& text) {
    WhoisServer server;
    auto colon = text.rfind(':');
    if (colon == std::string::npos) {
        server.host = text;
    } else {
        server.host = text.substr(0, colon);
        std::string port = text.substr(colon + 1);
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
        server.port = std::stoi(port);
        if (server.port <= 0 || server.port > 65535) return std::nullopt;
    }
    if (server.host.empty()) return std::nullopt;
    return server;
}

WhoisServerTable WhoisServerTable::defaults() {
    WhoisServerTable table;
    for (const auto& entry : kDefaultServers) {
        table.set(entry.first, WhoisServer{entry.second, 43});
    }
    return table;
}

void WhoisServerTable::set(const std::string& suffix, WhoisServer server) {
    std::string key = lower(suffix);
    while (!key.empty() && key.front() == '.') key.erase(key.begin());
    m_servers[key] = std::move(server);
}

void WhoisServerTable::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open WHOIS server file: " + path);
    }
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        std::istringstream fields(line);
        std::string suffix, server, extra;
        if (!(fields >> suffix)) continue;
        if (!(fields >> server) || (fields >> extra)) {
            throw std::runtime_error(path + ":" + std::to_string(lineNo) + ": expected 'suffix server[:port]'");
        }
        auto parsed = parseWhoisServer(server);
        if (!parsed) {
            throw std::runtime_error(path + ":" + std::to_string(lineNo) + ": bad server '" + server + "'");
        }
        set(suffix, std::move(*parsed));
    }
}

std::optional<WhoisServer> WhoisServerTable::find(const std::string& domain) const {
    std::string name = lower(domain);
    size_t pos = 0;
    // Walk suffixes from longest to shortest: "a.co.uk" -> "co.uk" -> "uk".
    while (pos != std::string::npos && pos < name.size()) {
        auto dot = name.find('.', pos);
        if (dot == std::string::npos) break;
        auto it = m_servers.find(name.substr(dot + 1));
        if (it != m_servers.end()) return it->second;
        pos = dot + 1;
    }
    return std::nullopt;
}

bool looksLikeNoMatch(const std::string& response) {
    std::string text = lower(response);
    for (const char* marker : kNoMatchMarkers) {
        if (text.find(marker) != std::string::npos) return true;
    }
    return false;
}

WhoisProber::WhoisProber(WhoisServerTable servers, WhoisProberOptions options)
    : m_servers(std::move(servers)), m_options(options) {}

bool WhoisProber::query(const WhoisServer& server, const std::string& domain,
                        std::string& response, std::string& error) const {
    const auto deadline = Clock::now() + std::chrono::milliseconds(m_options.timeoutMs);

    // Resolution shares the deadline with connect and read.
    std::string resolveError;
    auto addresses = resolveAddresses(server.host, server.port, msLeft(deadline), resolveError);
    if (addresses.empty()) {
        error = "cannot resolve " + server.host + ": " + resolveError;
        return false;
    }

    int fd = -1;
    error = "cannot connect to " + server.host;
    for (const auto& a : addresses) {
        int s = ::socket(a.family, a.socktype, a.protocol);
        if (s < 0) continue;
        int flags = fcntl(s, F_GETFL, 0);
        fcntl(s, F_SETFL, flags | O_NONBLOCK);

        int c = ::connect(s, reinterpret_cast<const sockaddr*>(&a.addr), a.length);
        if (c == 0) {
            fd = s;
            break;
        }
        if (errno == EINPROGRESS && waitFor(s, POLLOUT, deadline)) {
            int soerr = 0;
            socklen_t len = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &len) == 0 && soerr == 0) {
                fd = s;
                break;
            }
            if (soerr != 0) error = "connect to " + server.host + " failed: " + std::strerror(soerr);
        } else if (msLeft(deadline) == 0) {
            error = "connect to " + server.host + " timed out";
        }
        ::close(s);
    }
    if (fd < 0) return false;
    Socket sock(fd);

    const std::string request = domain + "\r\n";
    size_t sent = 0;
    while (sent < request.size()) {
        ssize_t n = ::send(sock.fd, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            if (!waitFor(sock.fd, POLLOUT, deadline)) {
                error = "send to " + server.host + " timed out";
                return false;
            }
            continue;
        }
        error = std::string("send to ") + server.host + " failed: " + std::strerror(errno);
        return false;
    }

    response.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = ::recv(sock.fd, buf, sizeof(buf), 0);
        if (n > 0) {
            response.append(buf, static_cast<size_t>(n));
            if (response.size() >= m_options.maxResponseBytes) break;
            continue;
        }
        if (n == 0) break; // server closed: record complete
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            if (!waitFor(sock.fd, POLLIN, deadline)) {
                error = "read from " + server.host + " timed out";
                return false;
            }
            continue;
        }
        error = std::string("read from ") + server.host + " failed: " + std::strerror(errno);
        return false;
    }
    return true;
}

ProbeOutcome WhoisProber::probe(const std::string& host) const {
    std::string domain = host;
    if (domain.rfind("www.", 0) == 0) domain.erase(0, 4);

    ProbeOutcome outcome;
    try {
        auto server = m_servers.find(domain);
        if (!server) {
            auto dot = domain.rfind('.');
            std::string tld = (dot == std::string::npos) ? domain : domain.substr(dot + 1);
            outcome = ProbeOutcome::failure("no server for TLD " + tld);
        } else {
            std::string response, error;
            if (!query(*server, domain, response, error)) {
                outcome = ProbeOutcome::failure("WHOIS Lookup Failed: " + error);
            } else if (isBlank(response)) {
                outcome = ProbeOutcome::failure("WHOIS Lookup Failed: No data found");
            } else if (m_options.requireMatch && looksLikeNoMatch(response)) {
                outcome = ProbeOutcome::failure("WHOIS Lookup Failed: domain not registered");
            } else {
                outcome = ProbeOutcome::ok();
            }
        }
    } catch (const std::exception& e) {
        outcome = ProbeOutcome::failure(std::string("WHOIS Lookup Failed: ") + e.what());
    }

    if (outcome) {
        Log::info(2, "Whois", "WHOIS Lookup for " + domain + " succeeded");
    } else {
        Log::info(2, "Whois", "WHOIS Lookup for " + domain + " failed: " + outcome.reason);
    }
    return outcome;
}

} // namespace Livecheck
