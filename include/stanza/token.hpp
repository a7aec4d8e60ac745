#pragma once


/*
    ----------------------------------------
    Stanza::token - Lexical unit of the input
    ----------------------------------------
    A `token` is what `Stanza::Tokenizer::next()` hands to the parser:

        - structural punctuation: `{ } [ ] , :` (no payload)
        - string:  fully unescaped contents, without the surrounding quotes
        - number:  the verbatim numeric literal (sign, fraction and exponent
                   characters included), never converted to a numeric type
        - boolean: `true` / `false`
        - null

    Tokens have no lifetime beyond being consumed by the caller. String and
    number payloads are allocated from the tokenizer's memory resource so they
    can be moved straight into a `Stanza::value` tree without copying.
*/

#include <cstdint>
#include <utility>
#include <variant>

#include "stanza/config.hpp"
#include "stanza/value.hpp"

namespace Stanza {

    /// @brief Enumerates the token kinds produced by the tokenizer
    enum class token_kind : uint8_t {
        left_brace,    ///< `{`
        right_brace,   ///< `}`
        left_bracket,  ///< `[`
        right_bracket, ///< `]`
        comma,         ///< `,`
        colon,         ///< `:`
        string,        ///< Quoted string, payload is the unescaped text
        number,        ///< Number literal, payload is the literal text
        boolean,       ///< `true` or `false`
        null,          ///< `null`
    };

    /// @brief Returns the character of a structural token kind, or `'\0'`
    ///        for kinds that carry a payload.
    [[nodiscard]] constexpr char to_char(token_kind k) noexcept {
        switch (k) {
        case token_kind::left_brace:    return '{';
        case token_kind::right_brace:   return '}';
        case token_kind::left_bracket:  return '[';
        case token_kind::right_bracket: return ']';
        case token_kind::comma:         return ',';
        case token_kind::colon:         return ':';
        case token_kind::string:
        case token_kind::number:
        case token_kind::boolean:
        case token_kind::null:
            return '\0';
        }
        return '\0';
    }

    /// @brief A single lexical token.
    ///
    /// @details
    /// The payload variant holds `std::monostate` for punctuation and `null`,
    /// `bool` for booleans and a `Stanza::string` for strings and numbers.
    struct token {
        using payload_t = std::variant<std::monostate, bool, string>;

        token_kind kind{};
        payload_t payload{};

        [[nodiscard]] static token punct(token_kind k) { return token{ k, std::monostate{} }; }
        [[nodiscard]] static token make_string(string s) { return token{ token_kind::string, std::move(s) }; }
        [[nodiscard]] static token make_number(string s) { return token{ token_kind::number, std::move(s) }; }
        [[nodiscard]] static token make_bool(bool b) { return token{ token_kind::boolean, b }; }
        [[nodiscard]] static token make_null() { return token{ token_kind::null, std::monostate{} }; }

        /// @pre `kind` is `token_kind::string` or `token_kind::number`
        [[nodiscard]] const string& text() const { return std::get<string>(payload); }
        [[nodiscard]] string& text() { return std::get<string>(payload); }

        /// @pre `kind` is `token_kind::boolean`
        [[nodiscard]] bool boolean() const { return std::get<bool>(payload); }

        friend bool operator==(const token& lhs, const token& rhs) = default;
    };

} // namespace Stanza
