// ResultSink.hpp
// Appends targets to <prefix>_ACTIVE.txt / <prefix>_INACTIVE.txt
#pragma once

#include <mutex>
#include <string>

#include "Verdict.hpp"

namespace Livecheck {

class ResultSink {
public:
    ResultSink(std::string outputPrefix, Exclusion exclusion);

    // Deletes both output files if present. Throws std::runtime_error if one
    // exists and cannot be removed.
    void reset() const;

    // Appends `target` + '\n' to the verdict's file unless that verdict is
    // excluded. Returns whether a line was written. Throws std::runtime_error
    // when the file cannot be opened or written.
    bool record(const std::string& target, Verdict verdict);

    std::string pathFor(Verdict verdict) const;
    Exclusion exclusion() const { return m_exclusion; }

private:
    std::string m_prefix;
    Exclusion m_exclusion;
    std::mutex m_mutex; // serializes open-append-close across workers
};

} // namespace Livecheck
