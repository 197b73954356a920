#pragma once
#include <string>

namespace pcapfin {

// "<N>" -> N workers, "<N>C" -> N * available processing units (case-insensitive,
// surrounding whitespace ignored). Anything else, or a result below 1, throws
// JobException(ConfigurationError) quoting the raw value. No upper bound is applied.
unsigned resolve_thread_budget(const std::string& raw, unsigned available_units);

// Same, against std::thread::hardware_concurrency().
unsigned resolve_thread_budget(const std::string& raw);

unsigned available_processing_units();

} // namespace pcapfin
