#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/core/Value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace HN {

using Tag = std::vector<std::string>;

/**
 * Record: one event delivered by the data source.
 *
 * The runtime keys records by `id`, orders them by `created_at` and groups them
 * by `pubkey`/`kind`; `content` is never interpreted.
 */
struct Record {
    std::string      id;
    std::string      pubkey;
    std::int64_t     created_at = 0;
    std::uint32_t    kind       = 0;
    std::string      content;
    std::vector<Tag> tags;
    std::string      sig;

    // First value of the first tag named `name` ("d", "e", "p", ...).
    [[nodiscard]] auto tagValue(std::string_view name) const -> std::optional<std::string>;
    [[nodiscard]] auto tagValues(std::string_view name) const -> std::vector<std::string>;

    bool operator==(Record const&) const = default;
};

// Feed order: newest first, identity ascending on ties.
[[nodiscard]] auto recordPrecedes(Record const& lhs, Record const& rhs) -> bool;

[[nodiscard]] auto recordToJson(Record const& record) -> Value;
[[nodiscard]] auto recordFromJson(Value const& value) -> Expected<Record>;

void to_json(Value& json, Record const& record);

} // namespace HN
