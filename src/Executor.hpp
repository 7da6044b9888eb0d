// Executor.hpp
// Runs one classify-and-record workflow per target under a fixed slot budget
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "Classifier.hpp"
#include "ResultSink.hpp"
#include "Verdict.hpp"

namespace Livecheck {

struct TaskReport {
    std::string target;
    std::optional<Verdict> verdict; // unset when the workflow failed
    bool written{false};            // a line landed in an output file
    bool excluded{false};           // verdict dropped by the exclusion filter
    std::string error;              // why the workflow failed

    bool failed() const { return !verdict.has_value(); }
};

struct RunSummary {
    size_t active{0};
    size_t inactive{0};
    size_t excluded{0};
    size_t failed{0};
    size_t peakInFlight{0};
    std::vector<TaskReport> reports; // same order as the input targets

    size_t total() const { return reports.size(); }
};

class Executor {
public:
    // `concurrency` must be >= 1.
    Executor(const Classifier& classifier, ResultSink& sink, size_t concurrency = 10);

    // Returns once every target has finished, in no particular completion order.
    RunSummary run(const std::vector<std::string>& targets);

    // One workflow: normalize, classify, record. Never throws.
    TaskReport checkTarget(const std::string& raw);

    size_t concurrency() const { return m_concurrency; }

private:
    const Classifier& m_classifier;
    ResultSink& m_sink;
    size_t m_concurrency;
};

} // namespace Livecheck
