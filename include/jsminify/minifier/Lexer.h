#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace jsminify::minifier {

enum class SpanKind {
    Code,
    LineComment,
    BlockComment,
    String,     // '...' or "..."
    Template,   // template literal text, split around ${ ... } expressions
    Regex
};

struct Span {
    SpanKind kind;
    std::string text;

    bool isCode() const { return kind == SpanKind::Code; }
    bool isComment() const { return kind == SpanKind::LineComment || kind == SpanKind::BlockComment; }
};

// Identifier characters as the minifier sees them. Bytes above 0x7E are
// treated as identifier characters so UTF-8 names stay intact.
inline bool isIdentifierStart(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' || u > 126;
}

inline bool isIdentifierChar(char c) {
    return isIdentifierStart(c) || (c >= '0' && c <= '9');
}

inline bool isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/**
 * One-pass classifying scanner. Splits JavaScript source into tagged spans
 * so later stages only rewrite code and never the inside of a literal.
 * Joining the span texts gives back the input unchanged.
 */
class Lexer {
public:
    explicit Lexer(std::string_view input) : input_(input) {}

    std::vector<Span> tokenize();

private:
    void scanLineComment();
    void scanBlockComment();
    void scanString(char quote);
    void scanTemplate();
    bool scanRegex();
    void consumeCode(char c);

    bool regexAllowed() const;
    bool endsOperand() const;
    void emit(SpanKind kind, std::string text);
    void flushCode();

    std::string_view input_;
    size_t pos_ = 0;
    std::vector<Span> spans_;
    std::string code_;

    // One entry per open ${ ... } expression: brace depth inside it
    std::vector<int> templateBraces_;

    char prevChar_ = '\0';      // last significant code character
    std::string prevWord_;      // last identifier-like word in code
    bool inWord_ = false;
    bool afterLiteral_ = false; // a string, template or regex ended last
    bool signAfterOperand_ = false; // last lone + or - followed an operand
    bool postfix_ = false;      // last code token was a postfix ++ or --
};

std::vector<Span> tokenize(std::string_view input);

std::string join(const std::vector<Span>& spans);

} // namespace jsminify::minifier
