#pragma once

#include <functional>
#include <string>

namespace jsminify::minifier {

// Called after every stage with the stage name and the buffer it produced.
using StageObserver = std::function<void(const std::string& stage, const std::string& buffer)>;

struct MinifyOptions {
    bool preserveLicense = false;
    bool shortenVariables = false;
    StageObserver stageObserver;
};

/**
 * JavaScript minification pipeline:
 *   license extraction -> comment stripping -> whitespace normalization ->
 *   punctuation compaction -> variable renaming (optional) -> license reinsertion
 *
 * minify() never fails: malformed input yields a best-effort result. All
 * working state lives inside one call, so a Minifier may be shared between
 * threads as long as its stage observer is thread-safe.
 */
class Minifier {
public:
    explicit Minifier(MinifyOptions options = {});

    std::string minify(const std::string& source) const;

    const MinifyOptions& options() const { return options_; }

private:
    void notify(const char* stage, const std::string& buffer) const;

    MinifyOptions options_;
};

std::string minify(const std::string& source, const MinifyOptions& options = {});

} // namespace jsminify::minifier
