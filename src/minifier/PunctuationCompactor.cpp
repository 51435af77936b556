#include "jsminify/minifier/PunctuationCompactor.h"
#include "jsminify/minifier/Lexer.h"

#include <cstring>

namespace jsminify::minifier {

bool PunctuationCompactor::isPunctuation(char c) {
    return c != '\0' && (std::strchr(OPERATORS, c) != nullptr || std::strchr(BRACKETS, c) != nullptr);
}

bool PunctuationCompactor::wouldFuse(char before, char after) {
    return (before == '+' && after == '+') ||
           (before == '-' && after == '-') ||
           (before == '/' && (after == '/' || after == '*'));
}

std::string PunctuationCompactor::compact(const std::string& source) {
    auto spans = tokenize(source);

    std::string out;
    out.reserve(source.size());

    int parenDepth = 0;
    bool lastWasSemicolon = false;

    for (size_t i = 0; i < spans.size(); ++i) {
        const std::string& text = spans[i].text;
        if (!spans[i].isCode()) {
            out += text;
            lastWasSemicolon = false;
            continue;
        }

        std::string word; // identifier run ending at the current position
        size_t j = 0;
        while (j < text.size()) {
            char c = text[j];

            if (isWhitespace(c)) {
                size_t runEnd = j;
                while (runEnd < text.size() && isWhitespace(text[runEnd])) ++runEnd;

                char before = out.empty() ? '\0' : out.back();
                char after = '\0';
                if (runEnd < text.size()) {
                    after = text[runEnd];
                } else if (i + 1 < spans.size() && !spans[i + 1].text.empty()) {
                    after = spans[i + 1].text.front();
                }

                bool redundant = (isPunctuation(before) || isPunctuation(after)) && !wouldFuse(before, after);
                if (word == "function") {
                    if (after != '(' && after != '*' && after != '\0') out += ' ';
                } else if (!redundant) {
                    out.append(text, j, runEnd - j);
                    lastWasSemicolon = false;
                }

                word.clear();
                j = runEnd;
                continue;
            }

            if (c == ';') {
                if (lastWasSemicolon && parenDepth == 0) {
                    ++j;
                    continue;
                }
                lastWasSemicolon = true;
            } else {
                lastWasSemicolon = false;
            }

            if (c == '(') {
                ++parenDepth;
            } else if (c == ')' && parenDepth > 0) {
                --parenDepth;
            }

            if (isIdentifierChar(c)) {
                word += c;
            } else {
                word.clear();
            }

            out += c;
            ++j;
        }
    }

    return out;
}

} // namespace jsminify::minifier
