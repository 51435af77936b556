#include <catch2/catch_test_macros.hpp>
#include "jsminify/driver/DirectoryWatcher.h"
#include "TestHelpers.h"

#include <thread>

namespace fs = std::filesystem;
using namespace jsminify::driver;
using namespace std::chrono_literals;

TEST_CASE("DirectoryWatcher minifies changed files only", "[DirectoryWatcher]") {
    const fs::path dir = makeTestDirectory("watch_poll");
    const fs::path source = dir / "app.js";
    writeJsFile(source, "var answer = 42; // the answer\n");

    DirectoryWatcher watcher(dir, {});

    auto first = watcher.pollOnce();
    REQUIRE(first.size() == 1);
    REQUIRE(first[0].inputFile == source.string());
    REQUIRE(readBack(dir / "app.min.js") == "var answer=42;");

    // Nothing changed, and the .min.js output is not a source
    REQUIRE(watcher.pollOnce().empty());

    writeJsFile(source, "var answer = 43;\n");
    fs::last_write_time(source, fs::last_write_time(source) + 2s);
    auto second = watcher.pollOnce();
    REQUIRE(second.size() == 1);
    REQUIRE(readBack(dir / "app.min.js") == "var answer=43;");

    SECTION("New files are picked up") {
        writeJsFile(dir / "extra.js", "let x = 1;");
        auto third = watcher.pollOnce();
        REQUIRE(third.size() == 1);
        REQUIRE(third[0].inputFile == (dir / "extra.js").string());
    }

    fs::remove_all(dir);
}

TEST_CASE("DirectoryWatcher on a missing directory", "[DirectoryWatcher]") {
    DirectoryWatcher watcher(fs::temp_directory_path() / "jsminify_test_no_such_dir", {});
    REQUIRE(watcher.pollOnce().empty());
}

TEST_CASE("DirectoryWatcher run stops on request", "[DirectoryWatcher]") {
    const fs::path dir = makeTestDirectory("watch_run");
    writeJsFile(dir / "main.js", "const message = 'hi';\n");

    jsminify::minifier::MinifyOptions options;
    options.shortenVariables = true;
    DirectoryWatcher watcher(dir, options, 50ms);
    REQUIRE_FALSE(watcher.isRunning());

    std::thread runner([&watcher]() { watcher.run(); });

    const fs::path output = dir / "main.min.js";
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!fs::exists(output) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }

    watcher.stop();
    runner.join();

    REQUIRE_FALSE(watcher.isRunning());
    REQUIRE(fs::exists(output));
    REQUIRE(readBack(output) == "const a='hi';");

    fs::remove_all(dir);
}

TEST_CASE("DirectoryWatcher stop before run", "[DirectoryWatcher]") {
    const fs::path dir = makeTestDirectory("watch_stop_early");
    writeJsFile(dir / "early.js", "var early = 1;\n");

    DirectoryWatcher watcher(dir, {}, 50ms);
    watcher.stop();
    watcher.run();

    REQUIRE_FALSE(watcher.isRunning());
    REQUIRE_FALSE(fs::exists(dir / "early.min.js"));

    fs::remove_all(dir);
}
