#include <hnmd/data/Record.hpp>

namespace HN {

auto Record::tagValue(std::string_view name) const -> std::optional<std::string> {
    for (auto const& tag : this->tags) {
        if (tag.size() >= 2 && tag[0] == name)
            return tag[1];
    }
    return std::nullopt;
}

auto Record::tagValues(std::string_view name) const -> std::vector<std::string> {
    std::vector<std::string> values;
    for (auto const& tag : this->tags) {
        if (tag.size() >= 2 && tag[0] == name)
            values.push_back(tag[1]);
    }
    return values;
}

auto recordPrecedes(Record const& lhs, Record const& rhs) -> bool {
    if (lhs.created_at != rhs.created_at)
        return lhs.created_at > rhs.created_at;
    return lhs.id < rhs.id;
}

auto recordToJson(Record const& record) -> Value {
    Value tags = Value::array();
    for (auto const& tag : record.tags)
        tags.push_back(tag);
    return Value{{"id", record.id},
                 {"pubkey", record.pubkey},
                 {"created_at", record.created_at},
                 {"kind", record.kind},
                 {"content", record.content},
                 {"tags", std::move(tags)},
                 {"sig", record.sig}};
}

void to_json(Value& json, Record const& record) {
    json = recordToJson(record);
}

auto recordFromJson(Value const& value) -> Expected<Record> {
    if (!value.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "record must be a JSON object"});

    auto idIt = value.find("id");
    if (idIt == value.end() || !idIt->is_string())
        return std::unexpected(Error{Error::Code::MalformedInput, "record is missing a string id"});

    Record record;
    record.id = idIt->get<std::string>();
    if (auto it = value.find("pubkey"); it != value.end() && it->is_string())
        record.pubkey = it->get<std::string>();
    if (auto it = value.find("created_at"); it != value.end()) {
        if (!it->is_number_integer())
            return std::unexpected(Error{Error::Code::MalformedInput, "record created_at must be an integer"});
        record.created_at = it->get<std::int64_t>();
    }
    if (auto it = value.find("kind"); it != value.end()) {
        if (!it->is_number_unsigned() && !it->is_number_integer())
            return std::unexpected(Error{Error::Code::MalformedInput, "record kind must be an integer"});
        record.kind = it->get<std::uint32_t>();
    }
    if (auto it = value.find("content"); it != value.end() && it->is_string())
        record.content = it->get<std::string>();
    if (auto it = value.find("sig"); it != value.end() && it->is_string())
        record.sig = it->get<std::string>();
    if (auto it = value.find("tags"); it != value.end()) {
        if (!it->is_array())
            return std::unexpected(Error{Error::Code::MalformedInput, "record tags must be an array"});
        for (auto const& tag : *it) {
            if (!tag.is_array())
                return std::unexpected(Error{Error::Code::MalformedInput, "record tag must be an array of strings"});
            Tag entry;
            for (auto const& part : tag) {
                if (!part.is_string())
                    return std::unexpected(Error{Error::Code::MalformedInput, "record tag must be an array of strings"});
                entry.push_back(part.get<std::string>());
            }
            record.tags.push_back(std::move(entry));
        }
    }
    return record;
}

} // namespace HN
