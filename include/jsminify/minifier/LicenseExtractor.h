#pragma once

#include <string>

namespace jsminify::minifier {

struct LicenseSplit {
    std::string license;    // captured block plus a trailing "\n", or empty
    std::string remainder;  // source with the block removed

    bool hasLicense() const { return !license.empty(); }
};

class LicenseExtractor {
public:
    static constexpr const char* MARKER = "/*!";

    // Captures a "/*! ... */" block that starts at offset 0 when preserve is set.
    // Anything else leaves the source untouched and captures nothing.
    static LicenseSplit extract(const std::string& source, bool preserve);
};

} // namespace jsminify::minifier
