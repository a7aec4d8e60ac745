#pragma once


/*
    -----------------------------------------
    Stanza::Tokenizer - Character-level lexer
    -----------------------------------------
    `Tokenizer` turns raw JSON text into one lexical token per call to
    `next()`. It keeps a single forward-only cursor into the input and
    never looks further ahead than the next character, except when matching
    the `true`/`false`/`null` literals, which either match entirely or leave
    the cursor untouched.

    - `next()` does not skip whitespace. The caller decides when whitespace
      may appear and calls `eat_whitespaces()` explicitly
    - `eat_token(kind)` consumes a structural character only if it is the
      next one; this is how the parser makes its lookahead decisions
    - The cursor tracks byte offset, line and column so every `ParseError`
      points at where it was detected

    Input is UTF-8. Multi-byte sequences inside strings are copied through
    unchanged; every grammar decision is made on ASCII characters.
*/

#include <cstddef>
#include <expected>
#include <memory_resource>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/token.hpp"

namespace Stanza {

    /// @brief Result of a single `Tokenizer::next()` call
    using TokenResult = std::expected<token, ParseError>;

    class Tokenizer {
    public:
        /// @param input Text to scan; must outlive the tokenizer
        /// @param res Memory resource for string and number payloads
        STANZA_API explicit Tokenizer(std::string_view input, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Scans the next token.
        ///
        /// @details
        /// Dispatches on the next unconsumed character:
        ///  - `{ } [ ] , :` yield the matching structural token
        ///  - `"` starts a string, a digit or `-` starts a number
        ///  - `t`/`f` start a boolean literal, `n` the null literal
        ///  - any other character fails with `invalid_token`
        ///  - end of input fails with `eof`
        ///
        /// Exactly the characters of the returned token are consumed.
        [[nodiscard]] STANZA_API TokenResult next();

        /// @brief Consumes a maximal run of space, `\n`, `\r` and `\t`.
        /// @return true if at least one character was consumed
        STANZA_API bool eat_whitespaces();

        /// @brief Consumes the structural character of @p expected if it is next.
        /// @return false, without moving the cursor, if the next character does
        ///         not match or @p expected is not a structural kind
        STANZA_API bool eat_token(token_kind expected);

        [[nodiscard]] bool eof() const noexcept { return m_Idx >= m_Text.size(); }
        [[nodiscard]] size_t offset() const noexcept { return m_Idx; }
        [[nodiscard]] size_t line() const noexcept { return m_Line; }
        [[nodiscard]] size_t column() const noexcept { return m_Column; }

        /// @brief Builds an error located at the current cursor position
        [[nodiscard]] STANZA_API ParseError make_error(ParseError::code code, std::string_view msg) const;

    private:
        std::string_view m_Text;
        std::pmr::memory_resource* m_MemRes;
        size_t m_Idx = 0;
        size_t m_Line = 1;
        size_t m_Column = 1;

        [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : m_Text[m_Idx]; }
        char get();
        bool eatc(char c);
        bool eats(std::string_view literal);

        TokenResult scan_string();
        TokenResult scan_number();
        TokenResult scan_boolean();
        TokenResult scan_null();

        // Number fragments; each appends its characters to `out`
        std::expected<void, ParseError> scan_integer(string& out);
        std::expected<void, ParseError> scan_fraction(string& out);
        std::expected<void, ParseError> scan_exponent(string& out);
    };

} // namespace Stanza
