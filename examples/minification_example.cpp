#include "jsminify/minifier/Minifier.h"
#include "jsminify/driver/MinificationStats.h"
#include <iostream>
#include <chrono>
#include <vector>

using namespace jsminify;

namespace {

const std::string SAMPLE_CODE = R"(/*! Sample Library v1.0.0 | MIT License */
// This is a sample JavaScript function
function calculateTotal(items) {
    let total = 0;
    for (let i = 0; i < items.length; i++) {
        total += items[i].price * items[i].quantity;
    }
    console.log('Total calculated:', total);
    return total;
}

/* Another function with debug info */
function debugInfo() {
    const message = 'Debug mode enabled';
    console.log(message);
    return 'debug-info';
}

const myLibrary = {
    version: '1.0.0',
    calculate: calculateTotal,
    debug: debugInfo
};
)";

} // namespace

void demonstrateOptions() {
    std::cout << "\n=== Minification Options ===" << std::endl;
    std::cout << "\nOriginal code (" << SAMPLE_CODE.length() << " bytes):\n" << SAMPLE_CODE << std::endl;

    struct Variant {
        std::string name;
        bool preserveLicense;
        bool shortenVariables;
    };
    std::vector<Variant> variants = {
        {"default", false, false},
        {"preserve-license", true, false},
        {"shorten-vars", false, true},
        {"all", true, true}
    };

    for (const auto& variant : variants) {
        minifier::MinifyOptions options;
        options.preserveLicense = variant.preserveLicense;
        options.shortenVariables = variant.shortenVariables;

        auto start = std::chrono::high_resolution_clock::now();
        std::string minified = minifier::minify(SAMPLE_CODE, options);
        auto end = std::chrono::high_resolution_clock::now();

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        double reduction = driver::MinificationStats::reduction(SAMPLE_CODE.length(), minified.length());

        std::cout << "\n--- " << variant.name << " ---" << std::endl;
        std::cout << "Compressed: " << SAMPLE_CODE.length() << " → " << minified.length()
                  << " bytes (" << reduction << "% reduction)" << std::endl;
        std::cout << "Processing time: " << duration.count() << "us" << std::endl;
        std::cout << "Result:\n" << minified << std::endl;
    }
}

void demonstrateStageObserver() {
    std::cout << "\n=== Pipeline Stages ===" << std::endl;

    minifier::MinifyOptions options;
    options.preserveLicense = true;
    options.shortenVariables = true;
    options.stageObserver = [](const std::string& stage, const std::string& buffer) {
        std::cout << "\n[" << stage << "] " << buffer.length() << " bytes\n" << buffer << std::endl;
    };

    minifier::Minifier minifier(options);
    minifier.minify(SAMPLE_CODE);
}

int main() {
    std::cout << "JavaScript Minification Examples" << std::endl;
    std::cout << "================================" << std::endl;

    demonstrateOptions();
    demonstrateStageObserver();

    return 0;
}
