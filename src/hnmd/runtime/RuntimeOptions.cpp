#include <hnmd/runtime/RuntimeOptions.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace HN {

namespace {

auto env_count(char const* name) -> Expected<std::optional<std::uint64_t>> {
    char const* raw = std::getenv(name);
    if (raw == nullptr)
        return std::optional<std::uint64_t>{};
    std::string_view text{raw};
    std::uint64_t    value = 0;
    auto [end, ec]         = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size())
        return std::unexpected(Error{Error::Code::InvalidConfiguration, std::string{name} + " must be a non-negative integer, got '" + raw + "'"});
    return std::optional<std::uint64_t>{value};
}

auto apply_millis(char const* name, std::chrono::milliseconds& target) -> Expected<void> {
    auto value = env_count(name);
    if (!value)
        return std::unexpected(value.error());
    if (*value)
        target = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(**value)};
    return {};
}

} // namespace

auto RuntimeOptions::FromEnvironment(RuntimeOptions defaults) -> Expected<RuntimeOptions> {
    RuntimeOptions options = defaults;

    auto workers = env_count("HNMD_WORKERS");
    if (!workers)
        return std::unexpected(workers.error());
    if (*workers) {
        if (**workers == 0)
            return std::unexpected(Error{Error::Code::InvalidConfiguration, "HNMD_WORKERS must be at least 1"});
        options.workers = static_cast<std::size_t>(**workers);
    }

    if (auto applied = apply_millis("HNMD_RENDER_DEBOUNCE_MS", options.renderDebounce); !applied)
        return std::unexpected(applied.error());
    if (auto applied = apply_millis("HNMD_FETCH_TIMEOUT_MS", options.fetchTimeout); !applied)
        return std::unexpected(applied.error());
    if (auto applied = apply_millis("HNMD_STREAM_POLL_MS", options.streamPoll); !applied)
        return std::unexpected(applied.error());
    return options;
}

} // namespace HN
