#include <hnmd/data/LoaderKey.hpp>

#include <charconv>

namespace HN {

LoaderKey::LoaderKey(std::uint32_t kind, std::string pubkey, std::string identifier)
    : kind_(kind), pubkey_(std::move(pubkey)), identifier_(std::move(identifier)) {
    this->canonical = std::to_string(this->kind_) + ":" + this->pubkey_ + ":" + this->identifier_;
}

auto LoaderKey::Parse(std::string_view canonical) -> Expected<LoaderKey> {
    auto first = canonical.find(':');
    if (first == std::string_view::npos)
        return std::unexpected(Error{Error::Code::MalformedInput, "loader key '" + std::string{canonical} + "' has no kind separator"});
    auto second = canonical.find(':', first + 1);
    if (second == std::string_view::npos)
        return std::unexpected(Error{Error::Code::MalformedInput, "loader key '" + std::string{canonical} + "' has no pubkey separator"});

    auto          kindText = canonical.substr(0, first);
    std::uint32_t kind     = 0;
    auto [ptr, ec]         = std::from_chars(kindText.data(), kindText.data() + kindText.size(), kind);
    if (ec != std::errc{} || ptr != kindText.data() + kindText.size())
        return std::unexpected(Error{Error::Code::MalformedInput, "loader key '" + std::string{canonical} + "' has a non-numeric kind"});

    auto pubkey = canonical.substr(first + 1, second - first - 1);
    if (pubkey.empty())
        return std::unexpected(Error{Error::Code::MalformedInput, "loader key '" + std::string{canonical} + "' has an empty pubkey"});

    // The identifier may itself contain ':' (d tags are free-form).
    return LoaderKey{kind, std::string{pubkey}, std::string{canonical.substr(second + 1)}};
}

auto LoaderKey::ForRecord(Record const& record) -> LoaderKey {
    if (!IsAddressable(record.kind))
        return LoaderKey{record.kind, record.pubkey};
    return LoaderKey{record.kind, record.pubkey, record.tagValue("d").value_or(std::string{})};
}

auto LoaderKey::toFilter() const -> Filter {
    Filter filter;
    filter.kinds   = std::vector<std::uint32_t>{this->kind_};
    filter.authors = std::vector<std::string>{this->pubkey_};
    if (!this->identifier_.empty())
        filter.tags["d"] = {this->identifier_};
    return filter;
}

} // namespace HN
