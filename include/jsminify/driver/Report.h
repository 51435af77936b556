#pragma once

#include "jsminify/driver/MinificationStats.h"

#include <string>
#include <vector>

namespace jsminify::driver {

// Plain text block per file:
//   Processed <input>:
//     Output: <output>
//     Reduction: 12.34% (100 → 88 bytes)
//     Process time: 0.12 ms
std::string formatText(const MinificationStats& stats);
std::string formatText(const std::vector<MinificationStats>& stats);

// Two-space indented JSON: an object for one file, an array for many
std::string formatJson(const MinificationStats& stats);
std::string formatJson(const std::vector<MinificationStats>& stats);

} // namespace jsminify::driver
