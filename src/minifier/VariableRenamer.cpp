#include "jsminify/minifier/VariableRenamer.h"

#include <cstring>
#include <unordered_map>
#include <unordered_set>

namespace jsminify::minifier {

namespace {

constexpr char SHIELD_OPEN = '\x01';
constexpr char SHIELD_CLOSE = '\x02';
constexpr const char* ALPHABET = "abcdefghijklmnopqrstuvwxyz";
constexpr size_t ALPHABET_SIZE = 26;

struct Token {
    size_t start;
    size_t length;
};

// Identifier tokens in order. Numbers (and placeholder indices) are skipped.
std::vector<Token> identifierTokens(const std::string& buffer) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < buffer.size()) {
        char c = buffer[i];
        if (!isIdentifierChar(c)) {
            ++i;
            continue;
        }
        size_t end = i;
        while (end < buffer.size() && isIdentifierChar(buffer[end])) ++end;
        if (isIdentifierStart(c)) {
            tokens.push_back(Token{i, end - i});
        }
        i = end;
    }
    return tokens;
}

bool isDeclarationKeyword(const std::string& word) {
    return word == "var" || word == "let" || word == "const";
}

// obj.name and obj?.name are property accesses; ...name is a spread
bool isPropertyName(const std::string& buffer, size_t start) {
    if (start == 0 || buffer[start - 1] != '.') return false;
    return !(start >= 3 && buffer[start - 2] == '.' && buffer[start - 3] == '.');
}

char previousSignificant(const std::string& buffer, size_t start) {
    while (start > 0) {
        char c = buffer[--start];
        if (!isWhitespace(c)) return c;
    }
    return '\0';
}

char nextSignificant(const std::string& buffer, size_t end) {
    for (; end < buffer.size(); ++end) {
        if (!isWhitespace(buffer[end])) return buffer[end];
    }
    return '\0';
}

// Whether a '{' starts an object literal (or pattern) rather than a block
bool opensObjectLiteral(char prev, const std::string& prevWord) {
    static const std::unordered_set<std::string> EXPRESSION_KEYWORDS = {
        "return", "yield", "await", "case", "var", "let", "const",
        "in", "of", "typeof", "void", "delete", "throw"
    };
    if (!prevWord.empty()) return EXPRESSION_KEYWORDS.count(prevWord) != 0;
    return prev != '\0' && std::strchr("(,=:[!&|?+-*%<^~", prev) != nullptr;
}

// For every token: is its innermost open bracket an object literal brace?
std::vector<bool> objectLiteralContext(const std::string& buffer, const std::vector<Token>& tokens) {
    std::vector<bool> inObject(tokens.size(), false);
    std::vector<bool> open; // one entry per open bracket, true for object literal braces

    char prev = '\0';
    std::string prevWord;
    size_t t = 0;
    size_t i = 0;
    while (i < buffer.size()) {
        if (t < tokens.size() && tokens[t].start == i) {
            inObject[t] = !open.empty() && open.back();
            prevWord = buffer.substr(i, tokens[t].length);
            i += tokens[t].length;
            prev = buffer[i - 1];
            ++t;
            continue;
        }

        char c = buffer[i++];
        if (isWhitespace(c)) continue;

        if (c == '{') {
            open.push_back(opensObjectLiteral(prev, prevWord));
        } else if (c == '(' || c == '[') {
            open.push_back(false);
        } else if ((c == '}' || c == ')' || c == ']') && !open.empty()) {
            open.pop_back();
        }
        prev = c;
        prevWord.clear();
    }
    return inObject;
}

bool onlyWhitespace(const std::string& buffer, size_t from, size_t to) {
    if (from >= to) return false;
    for (size_t i = from; i < to; ++i) {
        if (!isWhitespace(buffer[i])) return false;
    }
    return true;
}

} // namespace

std::string StringShield::placeholder(size_t index) {
    return std::string(1, SHIELD_OPEN) + std::to_string(index) + SHIELD_CLOSE;
}

std::string StringShield::shield(const std::vector<Span>& spans) {
    std::string out;
    for (const auto& span : spans) {
        if (span.isCode()) {
            out += span.text;
            continue;
        }
        out += placeholder(literals_.size());
        literals_.push_back(span.text);
    }
    return out;
}

std::string StringShield::restore(const std::string& buffer) const {
    std::string out;
    out.reserve(buffer.size());

    size_t i = 0;
    while (i < buffer.size()) {
        if (buffer[i] != SHIELD_OPEN) {
            out += buffer[i++];
            continue;
        }

        size_t digitsEnd = i + 1;
        while (digitsEnd < buffer.size() && buffer[digitsEnd] >= '0' && buffer[digitsEnd] <= '9') ++digitsEnd;

        bool wellFormed = digitsEnd > i + 1 && digitsEnd < buffer.size() && buffer[digitsEnd] == SHIELD_CLOSE &&
                          digitsEnd - i - 1 <= 9;
        if (wellFormed) {
            size_t index = std::stoul(buffer.substr(i + 1, digitsEnd - i - 1));
            if (index < literals_.size()) {
                out += literals_[index];
                i = digitsEnd + 1;
                continue;
            }
        }

        // Not one of ours: copy through untouched
        out += buffer[i++];
    }

    return out;
}

std::string NameGenerator::nameAt(size_t index) {
    std::string name(1, ALPHABET[index % ALPHABET_SIZE]);
    size_t suffix = index / ALPHABET_SIZE;
    if (suffix != 0) {
        name += std::to_string(suffix);
    }
    return name;
}

std::string VariableRenamer::rename(const std::string& source) {
    table_.clear();

    StringShield shield;
    std::string buffer = shield.shield(tokenize(source));
    auto tokens = identifierTokens(buffer);

    std::unordered_set<std::string> existing;
    for (const auto& token : tokens) {
        existing.insert(buffer.substr(token.start, token.length));
    }

    // Declarations, in the order they appear
    NameGenerator generator;
    std::unordered_map<std::string, std::string> shortNames;
    for (size_t k = 0; k + 1 < tokens.size(); ++k) {
        if (!isDeclarationKeyword(buffer.substr(tokens[k].start, tokens[k].length))) continue;

        const Token& nameToken = tokens[k + 1];
        if (!onlyWhitespace(buffer, tokens[k].start + tokens[k].length, nameToken.start)) continue;

        std::string original = buffer.substr(nameToken.start, nameToken.length);
        if (isDeclarationKeyword(original) || shortNames.count(original) != 0) continue;

        // Never hand out a name the code already uses for something else
        std::string shortName = generator.next();
        while (shortName != original && existing.count(shortName) != 0) {
            shortName = generator.next();
        }
        shortNames.emplace(original, shortName);
        table_.emplace_back(original, shortName);
    }

    if (table_.empty()) {
        return source;
    }

    auto inObject = objectLiteralContext(buffer, tokens);

    // Single left-to-right pass: replaced text is never scanned again
    std::string out;
    out.reserve(buffer.size());
    size_t copied = 0;
    for (size_t k = 0; k < tokens.size(); ++k) {
        const Token& token = tokens[k];
        auto it = shortNames.find(buffer.substr(token.start, token.length));
        if (it == shortNames.end() || isPropertyName(buffer, token.start)) continue;

        // {name: value} and {name() {}} keep their keys; {name} becomes {name:a}
        bool shorthand = false;
        if (inObject[k]) {
            char before = previousSignificant(buffer, token.start);
            char after = nextSignificant(buffer, token.start + token.length);
            if (before == '{' || before == ',') {
                if (after == ':' || after == '(') continue;
                shorthand = after == '}' || after == ',' || after == '=';
            }
        }

        out.append(buffer, copied, token.start - copied);
        // Declaration sites read "keyword name" with exactly one space
        if (k > 0 && isDeclarationKeyword(buffer.substr(tokens[k - 1].start, tokens[k - 1].length)) &&
            onlyWhitespace(buffer, tokens[k - 1].start + tokens[k - 1].length, token.start)) {
            while (!out.empty() && isWhitespace(out.back())) out.pop_back();
            out += ' ';
        }
        if (shorthand) {
            out += it->first + ":";
        }
        out += it->second;
        copied = token.start + token.length;
    }
    out.append(buffer, copied, std::string::npos);

    return shield.restore(out);
}

} // namespace jsminify::minifier
