#include "jsminify/minifier/Lexer.h"

#include <algorithm>
#include <array>
#include <cstring>

namespace jsminify::minifier {

namespace {

// Characters after which a '/' opens a regular expression literal
constexpr const char* REGEX_PRECEDERS = "(,=:[!&|?+-~*/%<>^{};";

// Keywords after which a '/' opens a regular expression literal
constexpr std::array<const char*, 14> REGEX_KEYWORDS = {
    "return", "typeof", "instanceof", "in", "of", "new", "delete",
    "void", "throw", "case", "do", "else", "yield", "await"
};

bool isRegexKeyword(const std::string& word) {
    return std::any_of(REGEX_KEYWORDS.begin(), REGEX_KEYWORDS.end(),
                       [&](const char* keyword) { return word == keyword; });
}

} // namespace

std::vector<Span> Lexer::tokenize() {
    while (pos_ < input_.size()) {
        char c = input_[pos_];
        char next = pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';

        if (c == '/' && next == '/') {
            scanLineComment();
            continue;
        }
        if (c == '/' && next == '*') {
            scanBlockComment();
            continue;
        }
        if (c == '/' && regexAllowed() && scanRegex()) {
            continue;
        }
        if (c == '"' || c == '\'') {
            scanString(c);
            continue;
        }
        if (c == '`') {
            scanTemplate();
            continue;
        }

        // Inside ${ ... }: the closing brace resumes the template text
        if (!templateBraces_.empty()) {
            if (c == '{') {
                ++templateBraces_.back();
            } else if (c == '}') {
                if (templateBraces_.back() == 0) {
                    templateBraces_.pop_back();
                    scanTemplate();
                    continue;
                }
                --templateBraces_.back();
            }
        }

        consumeCode(c);
    }

    flushCode();
    return std::move(spans_);
}

void Lexer::scanLineComment() {
    flushCode();
    size_t end = input_.find('\n', pos_);
    if (end == std::string_view::npos) end = input_.size();
    emit(SpanKind::LineComment, std::string(input_.substr(pos_, end - pos_)));
    pos_ = end;
    inWord_ = false;
}

void Lexer::scanBlockComment() {
    flushCode();
    size_t close = input_.find("*/", pos_ + 2);
    size_t end = close == std::string_view::npos ? input_.size() : close + 2;
    emit(SpanKind::BlockComment, std::string(input_.substr(pos_, end - pos_)));
    pos_ = end;
    inWord_ = false;
}

void Lexer::scanString(char quote) {
    flushCode();
    size_t start = pos_++;
    while (pos_ < input_.size()) {
        char c = input_[pos_];
        if (c == '\\') {
            pos_ = std::min(pos_ + 2, input_.size());
            continue;
        }
        if (c == '\n') break; // unterminated, stop before the line break
        ++pos_;
        if (c == quote) break;
    }
    emit(SpanKind::String, std::string(input_.substr(start, pos_ - start)));
    inWord_ = false;
    afterLiteral_ = true;
}

// Starts on the opening backtick or on the '}' closing a ${ ... } expression.
void Lexer::scanTemplate() {
    flushCode();
    size_t start = pos_++;
    while (pos_ < input_.size()) {
        char c = input_[pos_];
        if (c == '\\') {
            pos_ = std::min(pos_ + 2, input_.size());
            continue;
        }
        if (c == '`') {
            ++pos_;
            emit(SpanKind::Template, std::string(input_.substr(start, pos_ - start)));
            inWord_ = false;
            afterLiteral_ = true;
            return;
        }
        if (c == '$' && pos_ + 1 < input_.size() && input_[pos_ + 1] == '{') {
            pos_ += 2;
            emit(SpanKind::Template, std::string(input_.substr(start, pos_ - start)));
            templateBraces_.push_back(0);
            inWord_ = false;
            afterLiteral_ = false;
            postfix_ = false;
            prevChar_ = '{';
            return;
        }
        ++pos_;
    }
    // Unterminated template runs to the end of input
    emit(SpanKind::Template, std::string(input_.substr(start)));
    inWord_ = false;
    afterLiteral_ = true;
}

bool Lexer::scanRegex() {
    size_t i = pos_ + 1;
    bool inClass = false;
    while (i < input_.size()) {
        char c = input_[i];
        if (c == '\n' || c == '\r') {
            return false;
        }
        if (c == '\\') {
            i += 2;
            continue;
        }
        if (c == '[') {
            inClass = true;
        } else if (c == ']') {
            inClass = false;
        } else if (c == '/' && !inClass) {
            ++i;
            while (i < input_.size() && isIdentifierChar(input_[i])) ++i; // flags
            flushCode();
            emit(SpanKind::Regex, std::string(input_.substr(pos_, i - pos_)));
            pos_ = i;
            inWord_ = false;
            afterLiteral_ = true;
            return true;
        }
        ++i;
    }
    return false;
}

void Lexer::consumeCode(char c) {
    code_ += c;
    ++pos_;

    if (isWhitespace(c)) {
        inWord_ = false;
        return;
    }

    // a++ / b is a division: remember postfix increments and decrements
    if (c == '+' || c == '-') {
        bool adjacent = code_.size() >= 2 && code_[code_.size() - 2] == c;
        if (adjacent && prevChar_ == c && signAfterOperand_ && !postfix_) {
            postfix_ = true;
        } else {
            signAfterOperand_ = endsOperand();
            postfix_ = false;
        }
    } else {
        postfix_ = false;
    }

    if (isIdentifierChar(c)) {
        if (!inWord_) prevWord_.clear();
        prevWord_ += c;
        inWord_ = true;
    } else {
        inWord_ = false;
    }
    prevChar_ = c;
    afterLiteral_ = false;
}

bool Lexer::endsOperand() const {
    if (afterLiteral_) return true;
    if (isIdentifierChar(prevChar_)) return !isRegexKeyword(prevWord_);
    return prevChar_ == ')' || prevChar_ == ']';
}

bool Lexer::regexAllowed() const {
    if (afterLiteral_ || postfix_) return false;
    if (prevChar_ == '\0') return true;
    if (isIdentifierChar(prevChar_)) return isRegexKeyword(prevWord_);
    return std::strchr(REGEX_PRECEDERS, prevChar_) != nullptr;
}

void Lexer::emit(SpanKind kind, std::string text) {
    spans_.push_back(Span{kind, std::move(text)});
}

void Lexer::flushCode() {
    if (!code_.empty()) {
        emit(SpanKind::Code, std::move(code_));
        code_.clear();
    }
}

std::vector<Span> tokenize(std::string_view input) {
    return Lexer(input).tokenize();
}

std::string join(const std::vector<Span>& spans) {
    std::string out;
    size_t total = 0;
    for (const auto& span : spans) total += span.text.size();
    out.reserve(total);
    for (const auto& span : spans) out += span.text;
    return out;
}

} // namespace jsminify::minifier
