#pragma once

#include <string>

namespace jsminify::minifier {

/**
 * Removes the whitespace that punctuation makes redundant:
 *   - around the operators + - * / = < > ! ? : & | ; ,
 *   - around the brackets { } [ ] ( )
 *   - after "function" when "(" or "*" follows (otherwise one space is kept)
 * and collapses runs of ";" outside parentheses. Whitespace that keeps two
 * characters from fusing into another token ("+ +", "- -", "/ /", "/ *") stays.
 */
class PunctuationCompactor {
public:
    static constexpr const char* OPERATORS = "+-*/=<>!?:&|;,";
    static constexpr const char* BRACKETS = "{}[]()";

    static std::string compact(const std::string& source);

    static bool isPunctuation(char c);
    static bool wouldFuse(char before, char after);
};

} // namespace jsminify::minifier
