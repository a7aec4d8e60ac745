#pragma once


/*
    -----------------------------------------------------
    Stanza::ParseError - Structured parse error reporting
    -----------------------------------------------------
    `Stanza::ParseError` describes a failure that occurred while tokenizing
    or parsing JSON. The tokenizer and the deserializer share this single
    type, so callers never need to tell a lexical failure apart from a
    grammatical one structurally.

    ------
    Fields
    ------
    - `code errc`:
        * Closed enumeration describing the failure category:
            - `eof`
            - `invalid_token`
            - `invalid_string`
            - `invalid_escape_char`
            - `invalid_number`
            - `trailing_characters`
            - `depth_limit_exceeded`
    - `size_t offset`:
        * Byte offset from the start of the input where the error was detected
        * Always in the range `[0, input.size()]`
    - `size_t line`:
        * 1-based line number at which the error occurred
    - `size_t column`:
        * 1-based column number (in bytes) within the current line
    - `std::string msg`:
        * Human-readable description of the error
        * Intended for debugging and logging; not stable for programmatic use

    -----
    Usage
    -----
    - `Tokenizer::next()` returns `std::expected<token, ParseError>`
    - `Deserializer::parse()` and `Stanza::parse(...)` return
      `std::expected<value, ParseError>`
    - Parsing is all-or-nothing: the first error aborts the parse and no
      partial value is ever returned alongside it

    This header defines the error reporting structure and its error code
    enum; it does not contain parsing logic
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Parsing Errors
/// @ingroup Stanza
/// @brief Error codes and structures produced by the tokenizer and parser
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced during tokenizing or parsing.
    ///
    /// @details
    /// Each error contains:
    ///
    /// - **errc**: a classification of the error
    /// - **offset**: byte offset from the start of input where the error occurred
    /// - **line**: 1-based line number of the error position
    /// - **column**: 1-based column number (UTF-8 byte offset within the line)
    /// - **msg**: human-readable explanation of the error
    struct ParseError {
        /// @ingroup StanzaError
        /// @brief Enumeration of possible error categories.
        ///
        /// @details
        /// Members:
        /// - `eof`
        ///     Input ended while a token or value was still expected, e.g. `[1,`
        ///     or an unterminated string.
        ///
        /// - `invalid_token`
        ///     A character or token did not match any lexical or grammatical
        ///     alternative at that position. Example: `@`, `nul`, `{"a" 1}`.
        ///
        /// - `invalid_string`
        ///     String scanning was entered without an opening quote.
        ///
        /// - `invalid_escape_char`
        ///     Unrecognized escape inside a string (e.g. `\q`). `\u` escapes are
        ///     not decoded and are reported with this code as well.
        ///
        /// - `invalid_number`
        ///     Numeric literal does not match the JSON number grammar. Examples:
        ///     leading zeros (`01`), a bare `-`, missing digits after `.` or `e`.
        ///
        /// - `trailing_characters`
        ///     A complete top-level value was parsed, but non-whitespace
        ///     characters remain and the options require full consumption.
        ///
        /// - `depth_limit_exceeded`
        ///     Objects/arrays are nested deeper than `ParseOptions::max_depth`.
        enum class code : uint8_t {
            eof,                    ///< Input ended prematurely.
            invalid_token,          ///< Unexpected character or token.
            invalid_string,         ///< String not opened by a quote.
            invalid_escape_char,    ///< Unsupported escape sequence.
            invalid_number,         ///< Malformed numeric literal.
            trailing_characters,    ///< Extra characters after the value.
            depth_limit_exceeded,   ///< Maximum depth limit exceeded.
        };

        code errc{};          ///< The classification of the error.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup StanzaError
        /// @brief Constructs a fully-populated `ParseError` instance.
        ///
        /// @details
        /// Used internally by the tokenizer and deserializer so every error
        /// is built with consistent formatting.
        ///
        /// @param c    The error code describing the category of failure.
        /// @param o    Byte offset from the start of the input.
        /// @param l    Line number (1-based).
        /// @param col  Column number (1-based).
        /// @param m    Human-readable error message.
        /// @return A fully constructed `ParseError`.
        STANZA_API static ParseError make(code c, size_t o, size_t l, size_t col, std::string_view m);
    };

    /// @ingroup StanzaError
    /// @brief Returns a short, stable name for an error code (e.g. `"invalid_number"`).
    [[nodiscard]] STANZA_API std::string_view to_string(ParseError::code c) noexcept;

} // namespace Stanza
