#include <doctest/doctest.h>
#include <hnmd/runtime/RuntimeOptions.hpp>

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

using namespace HN;
using namespace std::chrono_literals;

namespace {

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

struct CleanEnvironment {
    EnvGuard workers{"HNMD_WORKERS", nullptr};
    EnvGuard debounce{"HNMD_RENDER_DEBOUNCE_MS", nullptr};
    EnvGuard fetch{"HNMD_FETCH_TIMEOUT_MS", nullptr};
    EnvGuard poll{"HNMD_STREAM_POLL_MS", nullptr};
};

} // namespace

TEST_SUITE("runtime.options") {

TEST_CASE("Defaults survive an empty environment") {
    CleanEnvironment env;
    auto             options = RuntimeOptions::FromEnvironment();
    REQUIRE(options);
    CHECK(options->workers == 4);
    CHECK(options->renderDebounce == 16ms);
    CHECK(options->fetchTimeout == 5000ms);
    CHECK(options->streamPoll == 100ms);

    RuntimeOptions custom;
    custom.fetchTimeout = 250ms;
    auto kept           = RuntimeOptions::FromEnvironment(custom);
    REQUIRE(kept);
    CHECK(kept->fetchTimeout == 250ms);
}

TEST_CASE("Environment overrides") {
    CleanEnvironment env;
    EnvGuard         workers("HNMD_WORKERS", "8");
    EnvGuard         debounce("HNMD_RENDER_DEBOUNCE_MS", "0");
    EnvGuard         fetch("HNMD_FETCH_TIMEOUT_MS", "1500");
    EnvGuard         poll("HNMD_STREAM_POLL_MS", "25");

    auto options = RuntimeOptions::FromEnvironment();
    REQUIRE(options);
    CHECK(options->workers == 8);
    CHECK(options->renderDebounce == 0ms);
    CHECK(options->fetchTimeout == 1500ms);
    CHECK(options->streamPoll == 25ms);
}

TEST_CASE("Malformed values are configuration errors") {
    CleanEnvironment env;

    SUBCASE("Zero workers") {
        EnvGuard workers("HNMD_WORKERS", "0");
        auto     options = RuntimeOptions::FromEnvironment();
        REQUIRE_FALSE(options);
        CHECK(options.error().code == Error::Code::InvalidConfiguration);
    }

    SUBCASE("Trailing text") {
        EnvGuard fetch("HNMD_FETCH_TIMEOUT_MS", "100ms");
        CHECK(RuntimeOptions::FromEnvironment().error().code == Error::Code::InvalidConfiguration);
    }

    SUBCASE("Negative values") {
        EnvGuard debounce("HNMD_RENDER_DEBOUNCE_MS", "-5");
        CHECK_FALSE(RuntimeOptions::FromEnvironment());
    }

    SUBCASE("Empty values") {
        EnvGuard poll("HNMD_STREAM_POLL_MS", "");
        CHECK_FALSE(RuntimeOptions::FromEnvironment());
    }
}

} // TEST_SUITE
