#include "ResultSink.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace Livecheck {

ResultSink::ResultSink(std::string outputPrefix, Exclusion exclusion)
    : m_prefix(std::move(outputPrefix)), m_exclusion(exclusion) {}

std::string ResultSink::pathFor(Verdict verdict) const {
    return m_prefix + "_" + verdictToString(verdict) + ".txt";
}

void ResultSink::reset() const {
    for (Verdict v : {Verdict::Active, Verdict::Inactive}) {
        std::error_code ec;
        fs::remove(pathFor(v), ec);
        if (ec) {
            throw std::runtime_error("cannot delete " + pathFor(v) + ": " + ec.message());
        }
    }
}

bool ResultSink::record(const std::string& target, Verdict verdict) {
    if (isExcluded(verdict, m_exclusion)) return false;

    const std::string path = pathFor(verdict);
    std::lock_guard<std::mutex> lock(m_mutex);
    std::ofstream out(path, std::ios::app);
    if (!out) {
        throw std::runtime_error("cannot open output file: " + path);
    }
    out << target << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("cannot write output file: " + path);
    }
    return true;
}

} // namespace Livecheck
