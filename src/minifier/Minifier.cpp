#include "jsminify/minifier/Minifier.h"
#include "jsminify/minifier/CommentStripper.h"
#include "jsminify/minifier/LicenseExtractor.h"
#include "jsminify/minifier/PunctuationCompactor.h"
#include "jsminify/minifier/VariableRenamer.h"
#include "jsminify/minifier/WhitespaceNormalizer.h"

#include <utility>

namespace jsminify::minifier {

Minifier::Minifier(MinifyOptions options) : options_(std::move(options)) {}

std::string Minifier::minify(const std::string& source) const {
    LicenseSplit split = LicenseExtractor::extract(source, options_.preserveLicense);
    if (split.hasLicense()) notify("license", split.license);

    std::string result = CommentStripper::strip(split.remainder);
    notify("comments", result);

    result = WhitespaceNormalizer::normalize(result);
    notify("whitespace", result);

    result = PunctuationCompactor::compact(result);
    notify("punctuation", result);

    if (options_.shortenVariables) {
        VariableRenamer renamer;
        result = renamer.rename(result);
        notify("rename", result);
    }

    if (split.hasLicense()) {
        result = split.license + result;
    }
    return result;
}

void Minifier::notify(const char* stage, const std::string& buffer) const {
    if (options_.stageObserver) {
        options_.stageObserver(stage, buffer);
    }
}

std::string minify(const std::string& source, const MinifyOptions& options) {
    return Minifier(options).minify(source);
}

} // namespace jsminify::minifier
