#pragma once

#include <string>

namespace jsminify::minifier {

/**
 * Joins the code onto one line. In order:
 *   1. strip whitespace at both edges of every line,
 *   2. collapse runs of two or more whitespace characters into one space,
 *   3. drop the remaining line breaks.
 * A dropped line break between two identifier characters leaves a space.
 * Literal spans are copied unchanged.
 */
class WhitespaceNormalizer {
public:
    static std::string normalize(const std::string& source);

    static std::string trimLineEdges(const std::string& code, bool atStart, bool atEnd);
    static std::string collapseRuns(const std::string& code);
};

} // namespace jsminify::minifier
