// Loopback-only checks of the real probers against in-process servers.
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include "../src/DnsProber.hpp"
#include "../src/HttpProber.hpp"
#include "../src/Log.hpp"
#include "../src/WhoisProber.hpp"

namespace fs = std::filesystem;
using namespace Livecheck;

namespace {

// Accepts connections on 127.0.0.1 and hands each to `handler` (request text in,
// reply text out). A handler returning "HANG" keeps the connection open silently
// until the server stops.
class LoopbackServer {
public:
    using Handler = std::function<std::string(const std::string& request)>;

    LoopbackServer(Handler handler, std::string terminator)
        : m_handler(std::move(handler)), m_terminator(std::move(terminator)) {
        m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len);
        m_port = ntohs(addr.sin_port);
        ::listen(m_fd, 64);
        m_acceptThread = std::thread([this] { acceptLoop(); });
    }

    ~LoopbackServer() {
        m_stop = true;
        m_acceptThread.join();
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& t : m_connThreads) t.join();
        ::close(m_fd);
    }

    int port() const { return m_port; }

private:
    void acceptLoop() {
        while (!m_stop) {
            pollfd pfd{m_fd, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            int client = ::accept(m_fd, nullptr, nullptr);
            if (client < 0) continue;
            std::lock_guard<std::mutex> lock(m_mutex);
            m_connThreads.emplace_back([this, client] { serve(client); });
        }
    }

    void serve(int client) {
        std::string request;
        char buf[1024];
        while (request.find(m_terminator) == std::string::npos && !m_stop) {
            pollfd pfd{client, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) break;
            request.append(buf, static_cast<size_t>(n));
        }
        std::string reply = m_handler(request);
        if (reply == "HANG") {
            while (!m_stop) std::this_thread::sleep_for(std::chrono::milliseconds(20));
        } else if (!reply.empty()) {
            ::send(client, reply.data(), reply.size(), MSG_NOSIGNAL);
        }
        ::close(client);
    }

    Handler m_handler;
    std::string m_terminator;
    int m_fd{-1};
    int m_port{0};
    std::atomic<bool> m_stop{false};
    std::thread m_acceptThread;
    std::mutex m_mutex;
    std::vector<std::thread> m_connThreads;
};

std::string httpReply(int code, const std::string& extraHeaders = "") {
    return "HTTP/1.1 " + std::to_string(code) + " Test\r\n" + extraHeaders +
           "Content-Length: 2\r\nConnection: close\r\n\r\nok";
}

// A port nothing listens on: bind, read the port back, close.
int closedPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

} // anonymous namespace

int main() {
    int failures = 0;
    HttpLibrary httpLib;
    DnsLibrary dnsLib;
    Log::setVerbosity(0);
    // libcurl honours proxy variables; loopback requests must go direct.
    for (const char* name : {"http_proxy", "HTTP_PROXY", "https_proxy", "HTTPS_PROXY", "all_proxy", "ALL_PROXY"}) {
        unsetenv(name);
    }

    // Test 1: HTTP prober against a loopback server. Runs on its own thread so
    // the thread's curl handle is released before curl_global_cleanup.
    std::thread httpTests([&failures] {
        LoopbackServer server([](const std::string& request) -> std::string {
            auto lineEnd = request.find("\r\n");
            std::string line = request.substr(0, lineEnd);
            if (line.find("GET /status/") == 0) {
                int code = std::stoi(line.substr(std::strlen("GET /status/")));
                return httpReply(code);
            }
            if (line.find("GET /moved") == 0) {
                return httpReply(302, "Location: /status/200\r\n");
            }
            if (line.find("GET /loop") == 0) {
                return httpReply(302, "Location: /loop\r\n");
            }
            if (line.find("GET /hang") == 0) {
                return "HANG";
            }
            return httpReply(404);
        }, "\r\n\r\n");
        const std::string base = "http://127.0.0.1:" + std::to_string(server.port());

        HttpProberOptions options;
        options.timeoutMs = 1500;
        HttpProber prober(options);

        auto ok = prober.probe(base + "/status/200");
        if (!ok.isActive || ok.statusCode != 200 || !ok.error.empty() || ok.redirectedToWWW) {
            std::cerr << "[FAIL] 200: active=" << ok.isActive << " code=" << ok.statusCode << " err=" << ok.error << "\n";
            ++failures;
        }
        auto forbidden = prober.probe(base + "/status/403");
        if (!forbidden.isActive || forbidden.category != StatusCategory::Active) {
            std::cerr << "[FAIL] 403 should count as active\n";
            ++failures;
        }
        auto missing = prober.probe(base + "/status/404");
        if (missing.isActive || missing.category != StatusCategory::Inactive || missing.statusCode != 404) {
            std::cerr << "[FAIL] 404 should be inactive\n";
            ++failures;
        }
        auto teapot = prober.probe(base + "/status/418");
        if (teapot.isActive || teapot.category != StatusCategory::Ambiguous) {
            std::cerr << "[FAIL] 418 should be ambiguous\n";
            ++failures;
        }
        auto moved = prober.probe(base + "/moved");
        if (!moved.isActive || moved.statusCode != 200 ||
            moved.finalUrl.find("/status/200") == std::string::npos) {
            std::cerr << "[FAIL] Redirect not followed: code=" << moved.statusCode << " final=" << moved.finalUrl << "\n";
            ++failures;
        }
        auto loop = prober.probe(base + "/loop");
        if (loop.isActive || loop.error.empty()) {
            std::cerr << "[FAIL] Redirect loop should stop at the hop limit with an error\n";
            ++failures;
        }
        auto start = std::chrono::steady_clock::now();
        auto hung = prober.probe(base + "/hang");
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        if (hung.isActive || hung.error.empty() || elapsed.count() > 4000) {
            std::cerr << "[FAIL] Hung server should time out, took " << elapsed.count() << " ms\n";
            ++failures;
        }
        auto refused = prober.probe("http://127.0.0.1:" + std::to_string(closedPort()) + "/");
        if (refused.isActive || refused.redirectedToWWW || refused.error.empty()) {
            std::cerr << "[FAIL] Refused connection should degrade to inactive\n";
            ++failures;
        }
        std::cout << "[TEST] HTTP prober" << std::endl;
    });
    httpTests.join();

    // Test 2: WHOIS server table
    {
        WhoisServerTable table = WhoisServerTable::defaults();
        auto com = table.find("example.com");
        auto couk = table.find("shop.example.co.uk");
        if (!com || com->host != "whois.verisign-grs.com" || com->port != 43 ||
            !couk || couk->host != "whois.nic.uk") {
            std::cerr << "[FAIL] Built-in TLD lookup\n";
            ++failures;
        }
        if (table.find("example.zzz") || table.find("localhost")) {
            std::cerr << "[FAIL] Unknown TLD should have no server\n";
            ++failures;
        }
        if (parseWhoisServer("whois.example:99999") || parseWhoisServer(":43") || !parseWhoisServer("whois.example")) {
            std::cerr << "[FAIL] Server address parsing\n";
            ++failures;
        }

        const fs::path file = fs::temp_directory_path() / ("livecheck_whois_" + std::to_string(::getpid()) + ".txt");
        {
            std::ofstream out(file);
            out << "# local overrides\nzzz whois.nic.zzz:4343\n\n.Com  whois.example.net # trailing\n";
        }
        table.loadFile(file.string());
        auto zzz = table.find("example.zzz");
        auto com2 = table.find("EXAMPLE.COM");
        if (!zzz || zzz->host != "whois.nic.zzz" || zzz->port != 4343 || !com2 || com2->host != "whois.example.net") {
            std::cerr << "[FAIL] Server file overrides\n";
            ++failures;
        }
        {
            std::ofstream out(file);
            out << "zzz\n";
        }
        bool threw = false;
        try {
            table.loadFile(file.string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "[FAIL] Malformed server file should throw\n";
            ++failures;
        }
        fs::remove(file);
        std::cout << "[TEST] WHOIS server table" << std::endl;
    }

    // Test 3: WHOIS prober against a loopback server
    {
        std::mutex seenMutex;
        std::vector<std::string> seen;
        LoopbackServer server([&](const std::string& request) -> std::string {
            std::string domain = request.substr(0, request.find("\r\n"));
            {
                std::lock_guard<std::mutex> lock(seenMutex);
                seen.push_back(domain);
            }
            if (domain == "registered.test") {
                return "Domain Name: REGISTERED.TEST\r\nRegistrar: Example Registrar\r\n";
            }
            if (domain == "missing.test") return "No match for \"MISSING.TEST\".\r\n";
            if (domain == "blank.test") return "  \r\n";
            if (domain == "slow.test") return "HANG";
            return "";
        }, "\r\n");

        WhoisServerTable table;
        table.set("test", WhoisServer{"127.0.0.1", server.port()});
        WhoisProberOptions options;
        options.timeoutMs = 800;
        WhoisProber prober(table, options);

        if (!prober.probe("registered.test")) {
            std::cerr << "[FAIL] Registered domain should succeed\n";
            ++failures;
        }
        if (!prober.probe("www.registered.test")) {
            std::cerr << "[FAIL] www. prefix should be stripped before the query\n";
            ++failures;
        }
        {
            std::lock_guard<std::mutex> lock(seenMutex);
            if (seen.size() < 2 || seen[1] != "registered.test") {
                std::cerr << "[FAIL] Server saw '" << (seen.size() > 1 ? seen[1] : "") << "'\n";
                ++failures;
            }
        }
        if (prober.probe("unknown.test") || prober.probe("blank.test")) {
            std::cerr << "[FAIL] Empty responses should fail\n";
            ++failures;
        }
        if (!prober.probe("missing.test")) {
            std::cerr << "[FAIL] Non-empty 'no match' reply counts as a record by default\n";
            ++failures;
        }
        WhoisProberOptions strict = options;
        strict.requireMatch = true;
        WhoisProber strictProber(table, strict);
        if (strictProber.probe("missing.test") || !strictProber.probe("registered.test")) {
            std::cerr << "[FAIL] requireMatch should reject 'no match' replies only\n";
            ++failures;
        }
        auto slow = prober.probe("slow.test");
        if (slow || slow.reason.find("timed out") == std::string::npos) {
            std::cerr << "[FAIL] Silent server should time out: " << slow.reason << "\n";
            ++failures;
        }
        auto unmapped = prober.probe("example.zzz");
        if (unmapped || unmapped.reason != "no server for TLD zzz") {
            std::cerr << "[FAIL] Unmapped TLD: " << unmapped.reason << "\n";
            ++failures;
        }

        WhoisServerTable down;
        down.set("test", WhoisServer{"127.0.0.1", closedPort()});
        auto refused = WhoisProber(down, options).probe("registered.test");
        if (refused) {
            std::cerr << "[FAIL] Refused WHOIS connection should fail\n";
            ++failures;
        }

        // Resolving the server's hostname counts against the same deadline.
        WhoisServerTable unresolvable;
        unresolvable.set("test", WhoisServer{"whois-host.invalid", 43});
        auto start = std::chrono::steady_clock::now();
        auto lost = WhoisProber(unresolvable, options).probe("registered.test");
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        if (lost || lost.reason.find("cannot resolve whois-host.invalid") == std::string::npos) {
            std::cerr << "[FAIL] Unresolvable WHOIS server: " << lost.reason << "\n";
            ++failures;
        }
        if (elapsed.count() > 2000) {
            std::cerr << "[FAIL] WHOIS server resolution ignored the deadline: " << elapsed.count() << " ms\n";
            ++failures;
        }
        std::cout << "[TEST] WHOIS prober" << std::endl;
    }

    // Test 4: DNS prober
    {
        DnsProberOptions options;
        options.timeoutMs = 1500;
        DnsProber prober(options);

        auto numeric = prober.probe("127.0.0.1");
        if (!numeric) {
            std::cerr << "[FAIL] Numeric address should resolve: " << numeric.reason << "\n";
            ++failures;
        }
        auto start = std::chrono::steady_clock::now();
        auto invalid = prober.probe("no-such-host.invalid");
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        if (invalid || invalid.reason.empty()) {
            std::cerr << "[FAIL] .invalid name should not resolve\n";
            ++failures;
        }
        if (elapsed.count() > 3000) {
            std::cerr << "[FAIL] DNS probe exceeded its timeout: " << elapsed.count() << " ms\n";
            ++failures;
        }
        std::cout << "[TEST] DNS prober" << std::endl;
    }

    // Test 5: DNS prober with descriptor numbers past FD_SETSIZE
    {
        rlimit limit{};
        getrlimit(RLIMIT_NOFILE, &limit);
        const rlim_t wanted = FD_SETSIZE + 256;
        if (limit.rlim_cur < wanted && (limit.rlim_max == RLIM_INFINITY || limit.rlim_max >= wanted)) {
            rlimit raised = limit;
            raised.rlim_cur = wanted;
            setrlimit(RLIMIT_NOFILE, &raised);
        }
        std::vector<int> filler;
        int highest = -1;
        while (highest < FD_SETSIZE + 64) {
            int fd = ::open("/dev/null", O_RDONLY);
            if (fd < 0) break;
            filler.push_back(fd);
            highest = fd;
        }

        if (highest < FD_SETSIZE) {
            std::cout << "[TEST] DNS prober with many descriptors (skipped: descriptor limit "
                      << limit.rlim_max << ")" << std::endl;
        } else {
            DnsProberOptions options;
            options.timeoutMs = 1000;
            DnsProber prober(options);
            auto numeric = prober.probe("127.0.0.1");
            if (!numeric) {
                std::cerr << "[FAIL] Numeric address with high descriptors: " << numeric.reason << "\n";
                ++failures;
            }
            auto start = std::chrono::steady_clock::now();
            auto invalid = prober.probe("no-such-host.invalid");
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            if (invalid || invalid.reason.empty() || elapsed.count() > 2500) {
                std::cerr << "[FAIL] .invalid lookup with high descriptors: ok=" << static_cast<bool>(invalid)
                          << " took " << elapsed.count() << " ms\n";
                ++failures;
            }
            std::cout << "[TEST] DNS prober with descriptors above " << FD_SETSIZE << std::endl;
        }
        for (int fd : filler) ::close(fd);
        setrlimit(RLIMIT_NOFILE, &limit);
    }

    // Test 6: HTTP probing on the main thread after releasing its handle
    {
        LoopbackServer server([](const std::string&) { return httpReply(200); }, "\r\n\r\n");
        const std::string url = "http://127.0.0.1:" + std::to_string(server.port()) + "/";
        HttpProberOptions options;
        options.timeoutMs = 1500;
        HttpProber prober(options);

        auto first = prober.probe(url);
        HttpProber::releaseThreadHandle();
        auto second = prober.probe(url);
        HttpProber::releaseThreadHandle();
        if (!first.isActive || !second.isActive || second.statusCode != 200) {
            std::cerr << "[FAIL] Probe after releasing the thread handle: code=" << second.statusCode
                      << " err=" << second.error << "\n";
            ++failures;
        }
        std::cout << "[TEST] HTTP handle release" << std::endl;
    }

    if (failures == 0) {
        std::cout << "ALL TESTS PASS" << std::endl;
        return 0;
    } else {
        std::cout << failures << " TEST(S) FAILED" << std::endl;
        return 1;
    }
}
