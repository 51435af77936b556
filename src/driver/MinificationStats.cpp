#include "jsminify/driver/MinificationStats.h"

namespace jsminify::driver {

json MinificationStats::toJson() const {
    return json{
        {"input_file", inputFile},
        {"output_file", outputFile},
        {"original_size", originalSize},
        {"minified_size", minifiedSize},
        {"reduction_percentage", reductionPercentage},
        {"process_time_ms", processTimeMs}
    };
}

double MinificationStats::reduction(size_t originalSize, size_t minifiedSize) {
    if (originalSize == 0) {
        return 0.0;
    }
    return (static_cast<double>(originalSize) - static_cast<double>(minifiedSize)) /
           static_cast<double>(originalSize) * 100.0;
}

} // namespace jsminify::driver
