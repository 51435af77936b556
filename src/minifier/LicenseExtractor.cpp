#include "jsminify/minifier/LicenseExtractor.h"

namespace jsminify::minifier {

LicenseSplit LicenseExtractor::extract(const std::string& source, bool preserve) {
    if (!preserve || source.rfind(MARKER, 0) != 0) {
        return {"", source};
    }

    size_t close = source.find("*/", 3);
    if (close == std::string::npos) {
        return {"", source};
    }

    size_t end = close + 2;
    return {source.substr(0, end) + "\n", source.substr(end)};
}

} // namespace jsminify::minifier
