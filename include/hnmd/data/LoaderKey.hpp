#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/data/Filter.hpp>
#include <hnmd/data/Record.hpp>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace HN {

/**
 * LoaderKey: canonical identity of a one-shot loadable resource.
 *
 * The canonical form is `kind:pubkey:identifier`, the identifier being the
 * record's `d` tag for addressable kinds (30000 to 39999) and empty for every
 * other kind, e.g. profiles are `0:<pubkey>:`. Two requests with the same canonical string are the same
 * logical resource.
 */
class LoaderKey {
public:
    LoaderKey() = default;
    LoaderKey(std::uint32_t kind, std::string pubkey, std::string identifier = {});

    [[nodiscard]] static auto Parse(std::string_view canonical) -> Expected<LoaderKey>;
    [[nodiscard]] static constexpr auto IsAddressable(std::uint32_t kind) -> bool { return kind >= 30000 && kind < 40000; }
    // Key under which `record` answers a request.
    [[nodiscard]] static auto ForRecord(Record const& record) -> LoaderKey;

    [[nodiscard]] auto kind() const -> std::uint32_t { return this->kind_; }
    [[nodiscard]] auto pubkey() const -> std::string const& { return this->pubkey_; }
    [[nodiscard]] auto identifier() const -> std::string const& { return this->identifier_; }
    [[nodiscard]] auto str() const -> std::string const& { return this->canonical; }

    // One-shot filter that selects the record(s) answering this key.
    [[nodiscard]] auto toFilter() const -> Filter;

    auto operator==(LoaderKey const& other) const -> bool { return this->canonical == other.canonical; }
    auto operator<=>(LoaderKey const& other) const -> std::strong_ordering { return this->canonical <=> other.canonical; }

private:
    std::uint32_t kind_ = 0;
    std::string   pubkey_;
    std::string   identifier_;
    std::string   canonical;
};

} // namespace HN
