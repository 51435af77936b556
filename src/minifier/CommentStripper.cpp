#include "jsminify/minifier/CommentStripper.h"
#include "jsminify/minifier/Lexer.h"

namespace jsminify::minifier {

std::string CommentStripper::strip(const std::string& source) {
    auto spans = tokenize(source);

    std::string out;
    out.reserve(source.size());

    for (size_t i = 0; i < spans.size(); ++i) {
        const Span& span = spans[i];
        if (span.kind == SpanKind::LineComment) {
            continue; // the line break after it is code and stays
        }
        if (span.kind == SpanKind::BlockComment) {
            // a/**/b must not become the single token ab
            char before = out.empty() ? '\0' : out.back();
            char after = (i + 1 < spans.size() && !spans[i + 1].text.empty()) ? spans[i + 1].text.front() : '\0';
            if (isIdentifierChar(before) && isIdentifierChar(after)) {
                out += ' ';
            }
            continue;
        }
        out += span.text;
    }

    return out;
}

} // namespace jsminify::minifier
