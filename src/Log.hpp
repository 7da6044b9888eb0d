// Log.hpp
// Line-atomic console output shared by all worker threads
#pragma once

#include <string>

#include "Verdict.hpp"

namespace Livecheck {
namespace Log {

// 0 = errors only, 1 = per-target results, 2 = per-probe detail
void setVerbosity(int level);
int verbosity();

inline bool enabled(int level) { return verbosity() >= level; }

// Writes "[tag] message" to stdout when verbosity >= level.
void info(int level, const std::string& tag, const std::string& message);

// Writes an untagged line to stdout when verbosity >= level.
void line(int level, const std::string& message);

// Writes "[tag] message" to stderr regardless of verbosity.
void error(const std::string& tag, const std::string& message);

// "ACTIVE"/"INACTIVE", bold green/red when stdout is a terminal.
std::string colored(Verdict v);

} // namespace Log
} // namespace Livecheck
