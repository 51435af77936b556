#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "jsminify/driver/FileProcessor.h"
#include "TestHelpers.h"

namespace fs = std::filesystem;
using namespace jsminify::driver;
using jsminify::minifier::Minifier;

TEST_CASE("Default output path", "[FileProcessor]") {
    REQUIRE(defaultOutputPath("dir/app.js") == fs::path("dir/app.min.js"));
    REQUIRE(defaultOutputPath("app.test.js") == fs::path("app.test.min.js"));
    REQUIRE(defaultOutputPath("/tmp/bundle.mjs") == fs::path("/tmp/bundle.min.mjs"));
    REQUIRE(defaultOutputPath("noext") == fs::path("noext.min"));
}

TEST_CASE("processFile minifies a file", "[FileProcessor]") {
    const fs::path dir = makeTestDirectory("process_file");
    const fs::path input = dir / "input.js";
    const std::string source = "function test(a, b) {\n  // comment\n  return a + b;\n}\n";
    writeJsFile(input, source);

    SECTION("Default output path") {
        MinificationStats stats = processFile(input, {}, Minifier());

        REQUIRE(stats.inputFile == input.string());
        REQUIRE(stats.outputFile == (dir / "input.min.js").string());
        REQUIRE(readBack(dir / "input.min.js") == "function test(a,b){return a+b;}");
        REQUIRE(stats.originalSize == source.size());
        REQUIRE(stats.minifiedSize == 31);
        REQUIRE(stats.reductionPercentage == Catch::Approx(MinificationStats::reduction(source.size(), 31)));
        REQUIRE(stats.processTimeMs >= 0.0);
    }

    SECTION("Explicit output path") {
        const fs::path output = dir / "custom.js";
        MinificationStats stats = processFile(input, output, Minifier());
        REQUIRE(stats.outputFile == output.string());
        REQUIRE(fs::exists(output));
        REQUIRE_FALSE(fs::exists(dir / "input.min.js"));
    }

    SECTION("Missing input") {
        const fs::path missing = dir / "missing.js";
        REQUIRE_THROWS_AS(processFile(missing, {}, Minifier()), FileError);
        try {
            processFile(missing, {}, Minifier());
        } catch (const FileError& e) {
            REQUIRE(e.path() == missing);
        }
    }

    SECTION("Unwritable output") {
        REQUIRE_THROWS_AS(processFile(input, dir / "no_such_dir" / "out.js", Minifier()), FileError);
    }

    fs::remove_all(dir);
}

TEST_CASE("Reduction percentage", "[FileProcessor][stats]") {
    REQUIRE(MinificationStats::reduction(200, 50) == Catch::Approx(75.0));
    REQUIRE(MinificationStats::reduction(100, 100) == Catch::Approx(0.0));
    REQUIRE(MinificationStats::reduction(0, 0) == 0.0);
}

TEST_CASE("listSourceFiles picks plain .js files", "[FileProcessor][directory]") {
    const fs::path dir = makeTestDirectory("list_sources");
    writeJsFile(dir / "b.js", "var b;");
    writeJsFile(dir / "a.js", "var a;");
    writeJsFile(dir / "a.min.js", "var a;");
    writeJsFile(dir / "notes.txt", "text");
    fs::create_directories(dir / "nested");
    writeJsFile(dir / "nested" / "c.js", "var c;");
    fs::create_directories(dir / "folder.js");

    auto files = listSourceFiles(dir);
    REQUIRE(files == std::vector<fs::path>{dir / "a.js", dir / "b.js"});

    REQUIRE_THROWS_AS(listSourceFiles(dir / "missing"), FileError);
    REQUIRE_THROWS_AS(listSourceFiles(dir / "a.js"), FileError);

    fs::remove_all(dir);
}
