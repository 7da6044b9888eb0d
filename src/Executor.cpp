#include "Executor.hpp"

#include "Log.hpp"
#include "Target.hpp"
#include "WorkerSlots.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace Livecheck {

Executor::Executor(const Classifier& classifier, ResultSink& sink, size_t concurrency)
    : m_classifier(classifier), m_sink(sink), m_concurrency(concurrency) {
    if (m_concurrency == 0) {
        throw std::invalid_argument("concurrency must be at least 1");
    }
}

TaskReport Executor::checkTarget(const std::string& raw) {
    TaskReport report;
    report.target = raw;
    try {
        NormalizedTarget nt = normalizeTarget(raw);
        report.target = nt.target;
        Log::line(2, "Checking: " + nt.target);
        if (!nt.host) {
            Log::info(2, "Target", "cannot extract a host from " + nt.target + "; skipping DNS/WHOIS");
        }

        Classification c = m_classifier.classify(nt.probeUrl, nt.host);
        report.written = m_sink.record(nt.target, c.verdict);
        report.excluded = !report.written;
        report.verdict = c.verdict;

        Log::line(1, nt.target + ": " + Log::colored(c.verdict));
        Log::line(2, "Finished checking: " + nt.target);
    } catch (const std::exception& e) {
        report.verdict.reset();
        report.error = e.what();
        Log::error("Executor", "Error checking domain or URL " + report.target + ": " + report.error);
    } catch (...) {
        report.verdict.reset();
        report.error = "unknown exception";
        Log::error("Executor", "Error checking domain or URL " + report.target + ": " + report.error);
    }
    return report;
}

RunSummary Executor::run(const std::vector<std::string>& targets) {
    RunSummary summary;
    summary.reports.resize(targets.size());

    Semaphore slots(m_concurrency);
    std::atomic<size_t> cursor{0};

    // Each worker owns distinct report indices, so the vector needs no lock.
    auto worker = [&]() {
        for (;;) {
            size_t idx = cursor.fetch_add(1);
            if (idx >= targets.size()) break;
            SlotGuard slot(slots);
            summary.reports[idx] = checkTarget(targets[idx]);
        }
        try {
            m_classifier.threadDone();
        } catch (const std::exception& e) {
            Log::error("Executor", std::string("worker cleanup failed: ") + e.what());
        }
    };

    size_t threadCount = std::min(m_concurrency, targets.size());
    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            Log::error("Executor", std::string("could not start worker thread: ") + e.what());
            break;
        }
    }
    if (threads.empty() && !targets.empty()) {
        // Last resort: run the batch on the calling thread. The worker's
        // threadDone() releases the per-thread probe state before we return.
        worker();
    }
    for (auto& t : threads) t.join();

    for (const auto& r : summary.reports) {
        if (r.failed()) {
            ++summary.failed;
        } else if (r.excluded) {
            ++summary.excluded;
        } else if (*r.verdict == Verdict::Active) {
            ++summary.active;
        } else {
            ++summary.inactive;
        }
    }
    summary.peakInFlight = slots.peak();
    return summary;
}

} // namespace Livecheck
