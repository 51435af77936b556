#pragma once

#include "jsminify/minifier/Lexer.h"

#include <string>
#include <utility>
#include <vector>

namespace jsminify::minifier {

/**
 * Swaps every literal and comment span for an opaque placeholder so that
 * identifier rewriting cannot reach into it. Placeholders look like
 * "\x01<index>\x02": no identifier can match them and no two are equal.
 */
class StringShield {
public:
    static std::string placeholder(size_t index);

    // Joins the spans, replacing every non-code span with a placeholder.
    std::string shield(const std::vector<Span>& spans);

    // Puts the original literal text back for every known placeholder.
    std::string restore(const std::string& buffer) const;

    size_t size() const { return literals_.size(); }
    const std::string& literal(size_t index) const { return literals_.at(index); }

private:
    std::vector<std::string> literals_;
};

// a, b, ..., z, a1, b1, ..., z1, a2, ...
class NameGenerator {
public:
    static std::string nameAt(size_t index);

    std::string next() { return nameAt(counter_++); }
    size_t count() const { return counter_; }

private:
    size_t counter_ = 0;
};

class VariableRenamer {
public:
    using RenameTable = std::vector<std::pair<std::string, std::string>>;

    // Renames identifiers declared with var/let/const to short names across
    // the whole buffer. Declarations are matched lexically; block scope is
    // not tracked, so the same name declared twice gets one short name.
    std::string rename(const std::string& source);

    // Original -> short name, in order of first declaration, from the last rename().
    const RenameTable& renameTable() const { return table_; }

private:
    RenameTable table_;
};

} // namespace jsminify::minifier
