#include "stanza/deserializer.hpp"

#include <utility>


namespace Stanza {

    namespace {
        struct DepthGuard {
            size_t& depth;

            explicit DepthGuard(size_t& d) : depth(d) { depth++; }
            ~DepthGuard() { depth--; }

            DepthGuard(const DepthGuard&) = delete;
            DepthGuard& operator=(const DepthGuard&) = delete;
        };
    } // namespace

    Deserializer::Deserializer(std::string_view input, const ParseOptions& opts, std::pmr::memory_resource* res) noexcept
        : m_Tokenizer{ input, res }, m_Opts{ opts }, m_MemRes{ res } {}

    ParseResult Deserializer::parse() {
        auto v = parse_value();
        if (!v) return std::unexpected(std::move(v.error()));

        if (!m_Opts.allow_trailing_characters) {
            m_Tokenizer.eat_whitespaces();
            if (!m_Tokenizer.eof()) return std::unexpected(m_Tokenizer.make_error(ParseError::code::trailing_characters, "Trailing characters after top-level JSON value"));
        }
        return *std::move(v);
    }

    ParseResult Deserializer::parse_value() {
        m_Tokenizer.eat_whitespaces();

        // Grammar errors point at the start of the offending token, not past it.
        const size_t off = m_Tokenizer.offset(), ln = m_Tokenizer.line(), col = m_Tokenizer.column();
        auto tok = m_Tokenizer.next();
        if (!tok) return std::unexpected(std::move(tok.error()));

        switch (tok->kind) {
        case token_kind::left_brace: return parse_object();
        case token_kind::left_bracket: return parse_array();
        case token_kind::string: return value{ std::move(tok->text()), m_MemRes };
        case token_kind::number: return value{ number{ std::move(tok->text()) }, m_MemRes };
        case token_kind::boolean: return value{ tok->boolean(), m_MemRes };
        case token_kind::null: return value{ nullptr, m_MemRes };
        case token_kind::right_brace:
        case token_kind::right_bracket:
        case token_kind::comma:
        case token_kind::colon:
            break;
        }
        return std::unexpected(ParseError::make(ParseError::code::invalid_token, off, ln, col, "Expected a JSON value"));
    }

    // Entered with '{' already consumed.
    ParseResult Deserializer::parse_object() {
        if (m_Opts.max_depth != 0 && m_Depth >= m_Opts.max_depth) return std::unexpected(m_Tokenizer.make_error(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded"));
        DepthGuard guard{ m_Depth };

        object obj{ std::less<>{}, allocator_type(m_MemRes) };

        m_Tokenizer.eat_whitespaces();
        if (m_Tokenizer.eat_token(token_kind::right_brace)) return value{ std::move(obj), m_MemRes };

        while (true) {
            m_Tokenizer.eat_whitespaces();

            const size_t off = m_Tokenizer.offset(), ln = m_Tokenizer.line(), col = m_Tokenizer.column();
            auto key = m_Tokenizer.next();
            if (!key) return std::unexpected(std::move(key.error()));
            if (key->kind != token_kind::string) return std::unexpected(ParseError::make(ParseError::code::invalid_token, off, ln, col, "Expected string key in object"));

            m_Tokenizer.eat_whitespaces();
            if (!m_Tokenizer.eat_token(token_kind::colon)) return std::unexpected(m_Tokenizer.make_error(ParseError::code::invalid_token, "Expected ':' after object key"));

            auto val = parse_value();
            if (!val) return std::unexpected(std::move(val.error()));
            obj.insert_or_assign(std::move(key->text()), std::move(*val)); // last one wins

            m_Tokenizer.eat_whitespaces();
            if (m_Tokenizer.eat_token(token_kind::right_brace)) return value{ std::move(obj), m_MemRes };
            if (!m_Tokenizer.eat_token(token_kind::comma)) return std::unexpected(m_Tokenizer.make_error(ParseError::code::invalid_token, "Expected ',' or '}' in object"));
        }
    }

    // Entered with '[' already consumed.
    ParseResult Deserializer::parse_array() {
        if (m_Opts.max_depth != 0 && m_Depth >= m_Opts.max_depth) return std::unexpected(m_Tokenizer.make_error(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded"));
        DepthGuard guard{ m_Depth };

        array arr{ allocator_type(m_MemRes) };

        m_Tokenizer.eat_whitespaces();
        if (m_Tokenizer.eat_token(token_kind::right_bracket)) return value{ std::move(arr), m_MemRes };

        while (true) {
            auto elem = parse_value();
            if (!elem) return std::unexpected(std::move(elem.error()));
            arr.emplace_back(std::move(*elem));

            m_Tokenizer.eat_whitespaces();
            if (m_Tokenizer.eat_token(token_kind::right_bracket)) return value{ std::move(arr), m_MemRes };
            if (!m_Tokenizer.eat_token(token_kind::comma)) return std::unexpected(m_Tokenizer.make_error(ParseError::code::invalid_token, "Expected ',' or ']' in array"));
        }
    }

} // namespace Stanza
