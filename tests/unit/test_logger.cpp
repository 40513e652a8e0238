#include <catch2/catch.hpp>
#include <tangle/log/logger.hpp>
#include <tangle/log/macros.hpp>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

using namespace tangle::log;

namespace {

// Read back everything written to a temporary file
std::string read_all(std::FILE* file) {
    std::string content;
    std::rewind(file);
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), file)) > 0) {
        content.append(buf, n);
    }
    return content;
}

// Redirects the logger to a temporary file for one test
class capture_output {
public:
    capture_output() : file_(std::tmpfile()), previous_(logger::instance().get_level()) {
        logger::instance().set_output(file_);
    }

    ~capture_output() {
        logger::instance().set_output(nullptr);
        logger::instance().set_level(previous_);
        if (file_) std::fclose(file_);
    }

    capture_output(const capture_output&) = delete;
    capture_output& operator=(const capture_output&) = delete;

    std::string text() { return read_all(file_); }

private:
    std::FILE* file_;
    level previous_;
};

} // namespace

TEST_CASE("Logger singleton", "[logger]") {
    auto& logger1 = logger::instance();
    auto& logger2 = logger::instance();

    REQUIRE(&logger1 == &logger2);
}

TEST_CASE("Log level filtering", "[logger]") {
    capture_output capture;
    auto& log = logger::instance();

    log.set_level(level::warning);
    REQUIRE(log.get_level() == level::warning);
    REQUIRE_FALSE(log.enabled(level::info));
    REQUIRE(log.enabled(level::error));

    TANGLE_LOG_INFO("filtered message");
    TANGLE_LOG_WARNING("warning message");
    TANGLE_LOG_ERROR("error message");

    auto text = capture.text();
    REQUIRE(text.find("filtered message") == std::string::npos);
    REQUIRE(text.find("[WARN]") != std::string::npos);
    REQUIRE(text.find("warning message") != std::string::npos);
    REQUIRE(text.find("[ERROR]") != std::string::npos);
}

TEST_CASE("Filtered lines do not evaluate their arguments", "[logger]") {
    capture_output capture;
    auto& log = logger::instance();
    log.set_level(level::error);

    int evaluated = 0;
    auto count = [&evaluated]() { return ++evaluated; };

    TANGLE_LOG_INFO("skipped {}", count());
    TANGLE_LOG_WARNING("skipped {}", count());
    REQUIRE(evaluated == 0);

    TANGLE_LOG(level::error, "kept {}", count());
    REQUIRE(evaluated == 1);

    auto text = capture.text();
    REQUIRE(text.find("skipped") == std::string::npos);
    REQUIRE(text.find("kept 1") != std::string::npos);
    log.set_level(level::info);
}

TEST_CASE("Log lines carry file and line", "[logger]") {
    capture_output capture;
    logger::instance().set_level(level::info);

    TANGLE_LOG_INFO("located {}", 7);

    auto text = capture.text();
    REQUIRE(text.find("test_logger.cpp:") != std::string::npos);
    REQUIRE(text.find("located 7") != std::string::npos);
}

TEST_CASE("Log level conversion", "[logger]") {
    REQUIRE(std::string(level_to_string(level::debug)) == "DEBUG");
    REQUIRE(std::string(level_to_string(level::info)) == "INFO");
    REQUIRE(std::string(level_to_string(level::warning)) == "WARN");
    REQUIRE(std::string(level_to_string(level::error)) == "ERROR");
}

TEST_CASE("Log level parsing", "[logger]") {
    REQUIRE(level_from_string("debug") == level::debug);
    REQUIRE(level_from_string("info") == level::info);
    REQUIRE(level_from_string("warning") == level::warning);
    REQUIRE(level_from_string("warn") == level::warning);
    REQUIRE(level_from_string("error") == level::error);
    REQUIRE_FALSE(level_from_string("verbose").has_value());
    REQUIRE_FALSE(level_from_string("").has_value());
}

TEST_CASE("Concurrent logging", "[logger]") {
    capture_output capture;
    logger::instance().set_level(level::info);

    std::vector<std::thread> threads;
    constexpr int num_threads = 4;
    constexpr int logs_per_thread = 50;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                TANGLE_LOG_INFO("Thread {} log {}", i, j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    auto text = capture.text();
    size_t lines = 0;
    for (char c : text) {
        if (c == '\n') ++lines;
    }
    REQUIRE(lines == static_cast<size_t>(num_threads * logs_per_thread));
}

#ifdef TANGLE_DEBUG
TEST_CASE("Debug logging enabled", "[logger]") {
    capture_output capture;
    logger::instance().set_level(level::debug);

    TANGLE_LOG_DEBUG("Debug message: {}", 123);

    REQUIRE(capture.text().find("Debug message: 123") != std::string::npos);
}
#else
TEST_CASE("Debug logging disabled", "[logger]") {
    capture_output capture;
    logger::instance().set_level(level::debug);

    // Compiled out without TANGLE_DEBUG
    TANGLE_LOG_DEBUG("This should be optimized away");

    REQUIRE(capture.text().empty());
}
#endif
