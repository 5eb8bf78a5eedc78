#include <hnmd/pipe/PathExpressionEvaluator.hpp>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>

namespace HN {

namespace {

class Parser {
public:
    Parser(std::string_view text, Value const& context)
        : text(text), context(context) {}

    auto run() -> Expected<Value> {
        auto value = this->alternative();
        if (!value)
            return value;
        this->skipSpace();
        if (this->consume("|")) {
            this->skipSpace();
            if (!this->consumeWord("length"))
                return this->fail("only '| length' is supported after a pipe");
            value = length_of(*value);
            if (!value)
                return value;
        }
        this->skipSpace();
        if (this->pos != this->text.size())
            return this->fail("unexpected trailing input");
        return value;
    }

private:
    auto alternative() -> Expected<Value> {
        auto value = this->term();
        if (!value)
            return value;
        while (true) {
            this->skipSpace();
            if (!this->consume("//"))
                return value;
            auto fallback = this->term();
            if (!fallback)
                return fallback;
            if (!isTruthy(*value))
                value = std::move(fallback);
        }
    }

    auto term() -> Expected<Value> {
        this->skipSpace();
        if (this->pos >= this->text.size())
            return this->fail("expected an expression");
        char c = this->text[this->pos];
        if (c == '"')
            return this->stringLiteral();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)))
            return this->numberLiteral();
        if (this->consumeWord("true"))
            return Value(true);
        if (this->consumeWord("false"))
            return Value(false);
        if (this->consumeWord("null"))
            return Value(nullptr);
        return this->path();
    }

    auto path() -> Expected<Value> {
        Value current = this->context;
        bool  leadingDot = this->consume(".");
        if (leadingDot && (this->atEnd() || !is_ident_start(this->text[this->pos])) && !this->peek('['))
            return current;
        if (!leadingDot && !is_ident_start(this->text[this->pos]))
            return this->fail("expected a path");

        bool first = true;
        while (!this->atEnd()) {
            if (this->peek('[')) {
                auto next = this->index(current);
                if (!next)
                    return next;
                current = std::move(*next);
            } else if (first || this->consume(".")) {
                auto name = this->identifier();
                if (name.empty())
                    return this->fail("expected a field name");
                auto next = field_of(current, name);
                if (!next)
                    return next;
                current = std::move(*next);
            } else {
                break;
            }
            first = false;
        }
        return current;
    }

    auto index(Value const& current) -> Expected<Value> {
        ++this->pos;
        auto start = this->pos;
        if (this->peek('-'))
            ++this->pos;
        while (!this->atEnd() && std::isdigit(static_cast<unsigned char>(this->text[this->pos])))
            ++this->pos;
        std::int64_t at = 0;
        auto [ptr, ec]  = std::from_chars(this->text.data() + start, this->text.data() + this->pos, at);
        if (ec != std::errc{} || ptr != this->text.data() + this->pos || !this->consume("]"))
            return this->fail("malformed index");
        if (current.is_null())
            return Value(nullptr);
        if (!current.is_array())
            return this->fail("cannot index " + std::string{current.type_name()} + " with a number");
        auto size = static_cast<std::int64_t>(current.size());
        if (at < 0)
            at += size;
        if (at < 0 || at >= size)
            return Value(nullptr);
        return current[static_cast<std::size_t>(at)];
    }

    auto field_of(Value const& current, std::string const& name) -> Expected<Value> {
        if (current.is_null())
            return Value(nullptr);
        if (!current.is_object())
            return this->fail("cannot index " + std::string{current.type_name()} + " with \"" + name + "\"");
        auto it = current.find(name);
        return it == current.end() ? Value(nullptr) : *it;
    }

    auto length_of(Value const& value) -> Expected<Value> {
        if (value.is_null())
            return Value(0);
        if (value.is_string())
            return Value(value.get_ref<std::string const&>().size());
        if (value.is_array() || value.is_object())
            return Value(value.size());
        if (value.is_number())
            return Value(value.get<double>() < 0 ? -value.get<double>() : value.get<double>());
        return this->fail(std::string{value.type_name()} + " has no length");
    }

    auto stringLiteral() -> Expected<Value> {
        ++this->pos;
        std::string out;
        while (!this->atEnd() && this->text[this->pos] != '"') {
            if (this->text[this->pos] == '\\' && this->pos + 1 < this->text.size())
                ++this->pos;
            out.push_back(this->text[this->pos++]);
        }
        if (!this->consume("\""))
            return this->fail("unterminated string");
        return Value(std::move(out));
    }

    auto numberLiteral() -> Expected<Value> {
        auto start = this->pos;
        if (this->peek('-'))
            ++this->pos;
        while (!this->atEnd() && (std::isdigit(static_cast<unsigned char>(this->text[this->pos])) || this->text[this->pos] == '.'))
            ++this->pos;
        auto parsed = Value::parse(std::string{this->text.substr(start, this->pos - start)}, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_number())
            return this->fail("malformed number");
        return parsed;
    }

    auto identifier() -> std::string {
        auto start = this->pos;
        while (!this->atEnd() && is_ident_char(this->text[this->pos]))
            ++this->pos;
        return std::string{this->text.substr(start, this->pos - start)};
    }

    static auto is_ident_start(char c) -> bool {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
    }
    static auto is_ident_char(char c) -> bool {
        return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
    }

    auto skipSpace() -> void {
        while (!this->atEnd() && std::isspace(static_cast<unsigned char>(this->text[this->pos])))
            ++this->pos;
    }
    auto atEnd() const -> bool { return this->pos >= this->text.size(); }
    auto peek(char c) const -> bool { return !this->atEnd() && this->text[this->pos] == c; }
    auto consume(std::string_view token) -> bool {
        if (this->text.substr(this->pos, token.size()) != token)
            return false;
        this->pos += token.size();
        return true;
    }
    auto consumeWord(std::string_view word) -> bool {
        if (this->text.substr(this->pos, word.size()) != word)
            return false;
        auto end = this->pos + word.size();
        if (end < this->text.size() && is_ident_char(this->text[end]))
            return false;
        this->pos = end;
        return true;
    }
    auto fail(std::string message) const -> Expected<Value> {
        return std::unexpected(Error{Error::Code::EvalError, std::move(message) + " in '" + std::string{this->text} + "'"});
    }

    std::string_view text;
    Value const&     context;
    std::size_t      pos = 0;
};

} // namespace

auto PathExpressionEvaluator::evaluate(std::string_view expression, Value const& context) -> Expected<Value> {
    return Parser{expression, context}.run();
}

} // namespace HN
