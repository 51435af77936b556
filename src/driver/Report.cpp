#include "jsminify/driver/Report.h"

#include <iomanip>
#include <sstream>

namespace jsminify::driver {

namespace {

// File names need not be valid UTF-8; replace bad bytes instead of throwing
std::string dumpReport(const json& report) {
    return report.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace

std::string formatText(const MinificationStats& stats) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Processed " << stats.inputFile << ":\n"
        << "  Output: " << stats.outputFile << "\n"
        << "  Reduction: " << stats.reductionPercentage << "% (" << stats.originalSize << " → "
        << stats.minifiedSize << " bytes)\n"
        << "  Process time: " << stats.processTimeMs << " ms\n";
    return oss.str();
}

std::string formatText(const std::vector<MinificationStats>& stats) {
    std::string out;
    for (size_t i = 0; i < stats.size(); ++i) {
        if (i > 0) out += "\n";
        out += formatText(stats[i]);
    }
    return out;
}

std::string formatJson(const MinificationStats& stats) {
    return dumpReport(stats.toJson());
}

std::string formatJson(const std::vector<MinificationStats>& stats) {
    json array = json::array();
    for (const auto& entry : stats) {
        array.push_back(entry.toJson());
    }
    return dumpReport(array);
}

} // namespace jsminify::driver
