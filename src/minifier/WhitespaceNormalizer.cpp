#include "jsminify/minifier/WhitespaceNormalizer.h"
#include "jsminify/minifier/Lexer.h"

namespace jsminify::minifier {

namespace {

bool isLineBreak(char c) {
    return c == '\n' || c == '\r';
}

bool isInlineSpace(char c) {
    return isWhitespace(c) && c != '\n';
}

} // namespace

std::string WhitespaceNormalizer::trimLineEdges(const std::string& code, bool atStart, bool atEnd) {
    std::string out;
    out.reserve(code.size());

    size_t lineStart = 0;
    bool firstLine = true;
    while (true) {
        size_t lineEnd = code.find('\n', lineStart);
        bool lastLine = lineEnd == std::string::npos;
        if (lastLine) lineEnd = code.size();

        size_t begin = lineStart;
        size_t end = lineEnd;
        if (!firstLine || atStart) {
            while (begin < end && isInlineSpace(code[begin])) ++begin;
        }
        if (!lastLine || atEnd) {
            while (end > begin && isInlineSpace(code[end - 1])) --end;
        }
        out.append(code, begin, end - begin);

        if (lastLine) break;
        out += '\n';
        lineStart = lineEnd + 1;
        firstLine = false;
    }

    return out;
}

std::string WhitespaceNormalizer::collapseRuns(const std::string& code) {
    std::string out;
    out.reserve(code.size());

    size_t i = 0;
    while (i < code.size()) {
        if (!isWhitespace(code[i])) {
            out += code[i++];
            continue;
        }
        size_t runEnd = i;
        while (runEnd < code.size() && isWhitespace(code[runEnd])) ++runEnd;
        if (runEnd - i >= 2) {
            out += ' ';
        } else {
            out += code[i];
        }
        i = runEnd;
    }

    return out;
}

std::string WhitespaceNormalizer::normalize(const std::string& source) {
    auto spans = tokenize(source);

    for (size_t i = 0; i < spans.size(); ++i) {
        if (!spans[i].isCode()) continue;
        spans[i].text = collapseRuns(trimLineEdges(spans[i].text, i == 0, i + 1 == spans.size()));
    }

    std::string out;
    out.reserve(source.size());

    for (size_t i = 0; i < spans.size(); ++i) {
        const std::string& text = spans[i].text;
        if (!spans[i].isCode()) {
            out += text;
            continue;
        }

        for (size_t j = 0; j < text.size(); ++j) {
            if (!isLineBreak(text[j])) {
                out += text[j];
                continue;
            }
            char before = out.empty() ? '\0' : out.back();
            char after = '\0';
            if (j + 1 < text.size()) {
                after = text[j + 1];
            } else if (i + 1 < spans.size() && !spans[i + 1].text.empty()) {
                after = spans[i + 1].text.front();
            }
            if (isIdentifierChar(before) && isIdentifierChar(after)) {
                out += ' ';
            }
        }
    }

    return out;
}

} // namespace jsminify::minifier
