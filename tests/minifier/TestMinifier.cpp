#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "jsminify/minifier/Lexer.h"
#include "jsminify/minifier/Minifier.h"

#include <algorithm>
#include <fstream>
#include <sstream>

using namespace jsminify::minifier;

namespace {

std::string readFixture(const std::string& name) {
    std::ifstream file(std::string(JSMINIFY_TESTDATA_DIR) + "/" + name);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Bracket counts over everything except comments
std::string bracketSignature(const std::string& source) {
    std::string code;
    for (const auto& span : tokenize(source)) {
        if (!span.isComment()) code += span.text;
    }
    std::ostringstream oss;
    for (char c : std::string("{}[]()")) {
        oss << c << std::count(code.begin(), code.end(), c) << ' ';
    }
    return oss.str();
}

MinifyOptions withOptions(bool preserveLicense, bool shortenVariables) {
    MinifyOptions options;
    options.preserveLicense = preserveLicense;
    options.shortenVariables = shortenVariables;
    return options;
}

} // namespace

TEST_CASE("Minifier end-to-end examples", "[Minifier]") {
    SECTION("Function with a comment") {
        std::string input = "function test(a, b) {\n  // comment\n  return a + b;\n}";
        REQUIRE(minify(input) == "function test(a,b){return a+b;}");
    }

    SECTION("Variable shortening") {
        std::string input = "const longVariableName = 42;\nlet anotherLongName = longVariableName + 1;";
        std::string result = minify(input, withOptions(false, true));
        REQUIRE(result == "const a=42;let b=a+1;");
        REQUIRE(result.find("longVariableName") == std::string::npos);
        REQUIRE(result.find("anotherLongName") == std::string::npos);
    }

    SECTION("Object properties survive shortening") {
        REQUIRE(minify("const count = 1;\nconst o = {count: count};\nconsole.log(o.count);", withOptions(false, true)) ==
                "const a=1;const b={count:a};console.log(b.count);");
        REQUIRE(minify("const name = 'x';\nconst o = { name };\nreturn o.name;", withOptions(false, true)) ==
                "const a='x';const b={name:a};return b.name;");
    }

    SECTION("Division after a postfix operator keeps the next statement") {
        REQUIRE(minify("var r = i++ / 2; // half\nvar y = 1;") == "var r=i++/2;var y=1;");
        REQUIRE(minify("x = a-- / b; // ratio\ncall();") == "x=a--/b;call();");
    }

    SECTION("Without shortening the names stay") {
        std::string input = "const longVariableName = 42;\nlet anotherLongName = longVariableName + 1;";
        REQUIRE(minify(input) == "const longVariableName=42;let anotherLongName=longVariableName+1;");
    }
}

TEST_CASE("Minifier license handling", "[Minifier][license]") {
    std::string input = "/*!\n * License\n */\nfunction test() {}";

    SECTION("Preserved block is byte-identical at the front") {
        std::string result = minify(input, withOptions(true, false));
        REQUIRE(result == "/*!\n * License\n */\nfunction test(){}");
    }

    SECTION("Dropped when not requested") {
        REQUIRE(minify(input) == "function test(){}");
    }

    SECTION("Survives variable shortening untouched") {
        std::string withVar = "/*! keep var license */\nvar license = 1;";
        REQUIRE(minify(withVar, withOptions(true, true)) == "/*! keep var license */\nvar a=1;");
    }
}

TEST_CASE("Minifier edge cases", "[Minifier][edge]") {
    SECTION("Empty input") {
        REQUIRE(minify("").empty());
    }

    SECTION("Only comments") {
        REQUIRE(minify("// Just a comment\n/* Another comment */").empty());
    }

    SECTION("Escaped quotes in a string") {
        REQUIRE(minify(R"(const str = "This is a \"quoted\" string")") == R"(const str="This is a \"quoted\" string")");
    }

    SECTION("Regular expression literal") {
        REQUIRE(minify("const regex = /test/g;") == "const regex=/test/g;");
        REQUIRE(minify("const r = /\\/\\/x/; // c") == "const r=/\\/\\/x/;");
    }

    SECTION("Operators inside strings are kept") {
        REQUIRE(minify("s = \"a + b\" + c;") == "s=\"a + b\"+c;");
    }

    SECTION("Comment markers inside strings are kept") {
        REQUIRE(minify("url = 'http://example.com'; // link") == "url='http://example.com';");
    }

    SECTION("Malformed input never throws") {
        auto input = GENERATE(as<std::string>{}, "'unterminated", "/* open", "`${", "}}}{{{", "/", "\x01\x02\x01",
                              "var", "let let let");
        std::string result;
        REQUIRE_NOTHROW(result = minify(input, withOptions(true, true)));
        REQUIRE(result.size() <= input.size());
    }
}

TEST_CASE("Minifier stage observer", "[Minifier][observer]") {
    std::vector<std::string> stages;
    MinifyOptions options = withOptions(true, true);
    options.stageObserver = [&](const std::string& stage, const std::string&) { stages.push_back(stage); };

    Minifier minifier(options);
    minifier.minify("/*! L */ var x = 1;");
    REQUIRE(stages == std::vector<std::string>{"license", "comments", "whitespace", "punctuation", "rename"});

    stages.clear();
    Minifier(withOptions(false, false)).minify("var x = 1;");
    REQUIRE(stages.empty());
}

TEST_CASE("Minifier on fixture files", "[Minifier][fixtures]") {
    auto name = GENERATE("simple.js", "comments.js", "closure.js", "modern.js", "regex.js", "complex.js");
    std::string source = readFixture(name);
    REQUIRE_FALSE(source.empty());

    SECTION("Output is smaller and balanced") {
        std::string result = minify(source);
        REQUIRE(result.size() < source.size());
        REQUIRE(result.find('\n') == std::string::npos);
        REQUIRE(bracketSignature(result) == bracketSignature(source));
    }

    SECTION("All options") {
        std::string result = minify(source, withOptions(true, true));
        REQUIRE(result.size() < source.size());
        REQUIRE(bracketSignature(result) == bracketSignature(source));
    }

    SECTION("A further pass converges") {
        std::string once = minify(source);
        std::string twice = minify(once);
        REQUIRE(minify(twice) == twice);
    }
}

TEST_CASE("Minifier keeps literal text", "[Minifier][fixtures]") {
    std::string source = readFixture("regex.js");
    std::string result = minify(source, withOptions(false, true));

    REQUIRE(result.find("/^[^\\s@]+@[^\\s@]+\\.[^\\s@]+$/") != std::string::npos);
    REQUIRE(result.find("/\\/\\/ not a comment/g") != std::string::npos);
    REQUIRE(result.find("/\\/\\* also not a comment \\*\\//") != std::string::npos);
    REQUIRE(result.find("\"a  b\"") != std::string::npos);
}

TEST_CASE("Minifier keeps the license of a fixture", "[Minifier][fixtures]") {
    std::string source = readFixture("comments.js");
    std::string license = source.substr(0, source.find("*/") + 2);

    std::string result = minify(source, withOptions(true, false));
    REQUIRE(result.rfind(license + "\n", 0) == 0);
    REQUIRE(result.find("Secondary banner") == std::string::npos);
    REQUIRE(result.find("\"http://example.com/path\"") != std::string::npos);
    REQUIRE(result.find("'src/**/*.js'") != std::string::npos);
}
