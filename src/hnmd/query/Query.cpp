#include <hnmd/query/Query.hpp>

namespace HN {

auto Query::toJson() const -> Value {
    if (this->kind == Kind::Derived)
        return this->value;
    Value out = Value::array();
    for (auto const& record : this->items)
        out.push_back(recordToJson(record));
    return out;
}

auto queryKindToString(Query::Kind kind) -> std::string_view {
    switch (kind) {
        case Query::Kind::Raw:
            return "Raw";
        case Query::Kind::Derived:
            return "Derived";
    }
    return "Unknown";
}

} // namespace HN
