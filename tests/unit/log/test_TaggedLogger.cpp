#include <doctest/doctest.h>
#include <hnmd/log/TaggedLogger.hpp>

#ifdef HN_LOG_DEBUG

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Sets or clears one environment variable and puts it back on destruction.
class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str()))
            original = std::string(existing);
        if (value)
            setenv(this->key.c_str(), value, 1);
        else
            unsetenv(this->key.c_str());
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original)
            setenv(key.c_str(), original->c_str(), 1);
        else
            unsetenv(key.c_str());
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

// Clears every logger variable for the lifetime of the block.
struct QuietEnvironment {
    EnvGuard enabled{"HNMD_LOG_ENABLED", nullptr};
    EnvGuard log{"HNMD_LOG", nullptr};
    EnvGuard clear{"HNMD_LOG_CLEAR_DEFAULT_SKIPS", nullptr};
    EnvGuard enable{"HNMD_LOG_ENABLE_TAGS", nullptr};
    EnvGuard skip{"HNMD_LOG_SKIP_TAGS", nullptr};
};

auto captureStderr(std::function<void(HN::TaggedLogger&)> const& fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    {
        HN::TaggedLogger logger;
        fn(logger);
        std::this_thread::sleep_for(20ms);
    }
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("Output is off unless enabled") {
    QuietEnvironment env;
    auto output = captureStderr([](HN::TaggedLogger& logger) { logger.log_impl("dropped", std::source_location::current(), "Loader"); });
    CHECK(output.empty());
}

TEST_CASE("Environment switches") {
    QuietEnvironment env;

    SUBCASE("HNMD_LOG_ENABLED") {
        EnvGuard on("HNMD_LOG_ENABLED", "1");
        auto output = captureStderr([](HN::TaggedLogger& logger) { logger.log_impl("fetching 3 keys", std::source_location::current(), "LoaderCache"); });
        CHECK(output.find("[LoaderCache]") != std::string::npos);
        CHECK(output.find("fetching 3 keys") != std::string::npos);
        CHECK(output.find("Thread 0") != std::string::npos);
    }

    SUBCASE("HNMD_LOG") {
        EnvGuard on("HNMD_LOG", "yes");
        auto output = captureStderr([](HN::TaggedLogger& logger) { logger.log_impl("pass 4", std::source_location::current(), "Runtime"); });
        CHECK(output.find("pass 4") != std::string::npos);
    }

    SUBCASE("Zero keeps output off") {
        EnvGuard off("HNMD_LOG", "0");
        auto output = captureStderr([](HN::TaggedLogger& logger) { logger.log_impl("pass 5", std::source_location::current(), "Runtime"); });
        CHECK(output.empty());
    }
}

TEST_CASE("Tag filtering") {
    QuietEnvironment env;
    EnvGuard         on("HNMD_LOG_ENABLED", "1");

    SUBCASE("Default skips drop task chatter") {
        auto output = captureStderr([](HN::TaggedLogger& logger) {
            logger.log_impl("worker idle", std::source_location::current(), "TaskPool");
            logger.log_impl("info line", std::source_location::current(), "INFO");
        });
        CHECK(output.empty());
    }

    SUBCASE("Default skips can be cleared") {
        EnvGuard clear("HNMD_LOG_CLEAR_DEFAULT_SKIPS", "1");
        auto output = captureStderr([](HN::TaggedLogger& logger) { logger.log_impl("worker idle", std::source_location::current(), "TaskPool"); });
        CHECK(output.find("worker idle") != std::string::npos);
    }

    SUBCASE("Enabled tags must cover every tag of a message") {
        EnvGuard enable("HNMD_LOG_ENABLE_TAGS", "Reconcile");
        auto output = captureStderr([](HN::TaggedLogger& logger) {
            logger.log_impl("diff done", std::source_location::current(), "Reconcile");
            logger.log_impl("leaf failed", std::source_location::current(), "Reconcile", "Error");
        });
        CHECK(output.find("diff done") != std::string::npos);
        CHECK(output.find("leaf failed") == std::string::npos);
    }

    SUBCASE("Extra skip tags are trimmed") {
        EnvGuard skip("HNMD_LOG_SKIP_TAGS", " Snapshot , Filter ");
        auto output = captureStderr([](HN::TaggedLogger& logger) {
            logger.log_impl("mounted", std::source_location::current(), "Snapshot");
            logger.log_impl("compiled", std::source_location::current(), "Filter");
            logger.log_impl("opened", std::source_location::current(), "Subscription");
        });
        CHECK(output.find("mounted") == std::string::npos);
        CHECK(output.find("compiled") == std::string::npos);
        CHECK(output.find("opened") != std::string::npos);
    }
}

TEST_CASE("Runtime controls") {
    QuietEnvironment env;
    EnvGuard         on("HNMD_LOG_ENABLED", "1");

    SUBCASE("Thread names") {
        auto output = captureStderr([](HN::TaggedLogger& logger) {
            logger.setThreadName("Render");
            logger.log_impl("named", std::source_location::current(), "Runtime");
        });
        CHECK(output.find("[Render]") != std::string::npos);
    }

    SUBCASE("setLoggingEnabled overrides the environment") {
        auto output = captureStderr([](HN::TaggedLogger& logger) {
            logger.setLoggingEnabled(false);
            CHECK_FALSE(logger.loggingEnabled());
            logger.log_impl("muted", std::source_location::current(), "Runtime");
        });
        CHECK(output.empty());
    }

    SUBCASE("Source locations keep the parent directory") {
        auto output = captureStderr([](HN::TaggedLogger& logger) {
#line 42 "src/loader/LoaderCacheFetch.cpp"
            logger.log_impl("located", std::source_location::current(), "Loader");
#line 170 "tests/unit/log/test_TaggedLogger.cpp"
        });
        CHECK(output.find("loader/LoaderCacheFetch.cpp:42") != std::string::npos);
    }
}

TEST_CASE("Global logger and macro") {
    QuietEnvironment env;
    std::ostringstream buffer;
    auto*              original   = std::cerr.rdbuf(buffer.rdbuf());
    bool const         wasEnabled = HN::logger().loggingEnabled();
    HN::set_thread_name("MacroThread");
    HN::set_logging_enabled(true);
    hn_log("via macro", "QueryStore", "Error");
    std::this_thread::sleep_for(50ms);
    HN::set_logging_enabled(wasEnabled);
    std::cerr.rdbuf(original);

    auto output = buffer.str();
    CHECK(output.find("Error][QueryStore") != std::string::npos);
    CHECK(output.find("[MacroThread]") != std::string::npos);
}

} // TEST_SUITE

#endif // HN_LOG_DEBUG
