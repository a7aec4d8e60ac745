#include "stanza/tokenizer.hpp"

#include <cctype>
#include <utility>


namespace Stanza {

    namespace {
        bool is_digit(char c) noexcept {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        bool is_whitespace(char c) noexcept {
            return c == ' ' || c == '\n' || c == '\r' || c == '\t';
        }
    } // namespace

    Tokenizer::Tokenizer(std::string_view input, std::pmr::memory_resource* res) noexcept
        : m_Text{ input }, m_MemRes{ res } {}

    TokenResult Tokenizer::next() {
        if (eof()) return std::unexpected(make_error(ParseError::code::eof, "Unexpected end of input, expected a token"));

        char c = peek();
        switch (c) {
        case '{': get(); return token::punct(token_kind::left_brace);
        case '}': get(); return token::punct(token_kind::right_brace);
        case '[': get(); return token::punct(token_kind::left_bracket);
        case ']': get(); return token::punct(token_kind::right_bracket);
        case ',': get(); return token::punct(token_kind::comma);
        case ':': get(); return token::punct(token_kind::colon);
        case '"': return scan_string();
        case 't':
        case 'f':
            return scan_boolean();
        case 'n': return scan_null();
        default:
            if (c == '-' || is_digit(c)) return scan_number();
            return std::unexpected(make_error(ParseError::code::invalid_token, "Unexpected character"));
        }
    }

    bool Tokenizer::eat_whitespaces() {
        bool consumed = false;
        while (is_whitespace(peek())) {
            get();
            consumed = true;
        }
        return consumed;
    }

    bool Tokenizer::eat_token(token_kind expected) {
        char c = to_char(expected);
        if (c == '\0') return false;
        return eatc(c);
    }

    ParseError Tokenizer::make_error(ParseError::code code, std::string_view msg) const {
        return ParseError::make(code, m_Idx, m_Line, m_Column, msg);
    }

    char Tokenizer::get() {
        if (eof()) return '\0';
        char c = m_Text[m_Idx++];
        if (c == '\n') {
            m_Line++;
            m_Column = 1;
        } else m_Column++;
        return c;
    }

    bool Tokenizer::eatc(char c) {
        if (eof() || peek() != c) return false;
        get();
        return true;
    }

    // All-or-nothing: on mismatch the cursor does not move.
    bool Tokenizer::eats(std::string_view literal) {
        if (!m_Text.substr(m_Idx).starts_with(literal)) return false;
        for (size_t i = 0; i < literal.size(); i++) get();
        return true;
    }

    TokenResult Tokenizer::scan_string() {
        if (!eatc('"')) return std::unexpected(make_error(ParseError::code::invalid_string, "Expected '\"' to start a string"));

        string out{ m_MemRes };

        while (!eof()) {
            char c = get();
            if (c == '"') return token::make_string(std::move(out));
            if (c != '\\') {
                out.push_back(c);
                continue;
            }

            if (eof()) break;
            switch (peek()) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': return std::unexpected(make_error(ParseError::code::invalid_escape_char, "Unicode escapes are not supported"));
            default: return std::unexpected(make_error(ParseError::code::invalid_escape_char, "Invalid escape sequence"));
            }
            get();
        }

        return std::unexpected(make_error(ParseError::code::eof, "Nonterminated string"));
    }

    TokenResult Tokenizer::scan_number() {
        string out{ m_MemRes };

        if (auto r = scan_integer(out); !r) return std::unexpected(r.error());

        if (peek() == '.') {
            out.push_back(get());
            if (auto r = scan_fraction(out); !r) return std::unexpected(r.error());
        }

        if (peek() == 'e' || peek() == 'E') {
            out.push_back(get());
            if (auto r = scan_exponent(out); !r) return std::unexpected(r.error());
        }

        return token::make_number(std::move(out));
    }

    std::expected<void, ParseError> Tokenizer::scan_integer(string& out) {
        if (peek() == '-') out.push_back(get());
        if (!is_digit(peek())) return std::unexpected(make_error(ParseError::code::invalid_number, "Expected digit"));

        if (peek() == '0') {
            out.push_back(get());
            if (is_digit(peek())) return std::unexpected(make_error(ParseError::code::invalid_number, "Leading zeros disallowed"));
            return {};
        }

        while (is_digit(peek())) out.push_back(get());
        return {};
    }

    std::expected<void, ParseError> Tokenizer::scan_fraction(string& out) {
        if (!is_digit(peek())) return std::unexpected(make_error(ParseError::code::invalid_number, "Expected digit after '.'"));
        while (is_digit(peek())) out.push_back(get());
        return {};
    }

    std::expected<void, ParseError> Tokenizer::scan_exponent(string& out) {
        if (peek() == '+' || peek() == '-') out.push_back(get());
        if (!is_digit(peek())) return std::unexpected(make_error(ParseError::code::invalid_number, "Expected digit in exponent"));
        while (is_digit(peek())) out.push_back(get());
        return {};
    }

    TokenResult Tokenizer::scan_boolean() {
        if (eats("true")) return token::make_bool(true);
        if (eats("false")) return token::make_bool(false);
        return std::unexpected(make_error(ParseError::code::invalid_token, "Invalid boolean literal"));
    }

    TokenResult Tokenizer::scan_null() {
        if (eats("null")) return token::make_null();
        return std::unexpected(make_error(ParseError::code::invalid_token, "Invalid 'null' literal"));
    }

} // namespace Stanza
