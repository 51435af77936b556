#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace jsminify::driver {

using json = nlohmann::json;

struct MinificationStats {
    std::string inputFile;
    std::string outputFile;
    size_t originalSize = 0;
    size_t minifiedSize = 0;
    double reductionPercentage = 0.0;
    double processTimeMs = 0.0;

    // Keys: input_file, output_file, original_size, minified_size,
    // reduction_percentage, process_time_ms
    json toJson() const;

    // Percentage of bytes saved; 0 for an empty original
    static double reduction(size_t originalSize, size_t minifiedSize);
};

} // namespace jsminify::driver
