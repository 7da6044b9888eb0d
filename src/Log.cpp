#include "Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

#include <unistd.h>

namespace Livecheck {
namespace Log {

namespace {
std::atomic<int> g_verbosity{1};
std::mutex g_mutex;
} // anonymous namespace

void setVerbosity(int level) {
    g_verbosity.store(level);
}

int verbosity() {
    return g_verbosity.load();
}

void info(int level, const std::string& tag, const std::string& message) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_mutex);
    std::cout << "[" << tag << "] " << message << std::endl;
}

void line(int level, const std::string& message) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_mutex);
    std::cout << message << std::endl;
}

void error(const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_mutex);
    std::cerr << "[" << tag << "] " << message << std::endl;
}

std::string colored(Verdict v) {
    static const bool tty = ::isatty(STDOUT_FILENO) == 1;
    std::string name = verdictToString(v);
    if (!tty) return name;
    const char* color = (v == Verdict::Active) ? "\033[1;32m" : "\033[1;31m";
    return color + name + "\033[0m";
}

} // namespace Log
} // namespace Livecheck
