#pragma once


/*
    --------------------------------------------------
    Stanza - Small embeddable C++ JSON reader
    --------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - The value tree type:          `Stanza::value`
        - Error reporting types:        `Stanza::ParseError`
        - Configuration options:        `Stanza::ParseOptions`
        - The lexer:                    `Stanza::Tokenizer`, `Stanza::token`
        - The parser:                   `Stanza::Deserializer`
        - A one-call entry point:       `Stanza::parse(...)`

    -------------------
    High-Level Overview
    -------------------
    - Tokenizer:
        * Scans one token per `next()` call: punctuation, strings (escapes
          resolved), numbers (kept as literal text), booleans and null
    - Deserializer:
        * Recursive-descent parser that drives the tokenizer and builds the
          value tree bottom-up
    - Value tree:
        * `Stanza::value` uses `std::pmr` allocators; numbers are stored as
          their literal text, never coerced
    - Errors:
        * A single closed `ParseError::code` taxonomy for lexing and parsing,
          returned through `std::expected`

    Not provided: serialization back to text, `\uXXXX` decoding, numeric
    conversion, streaming input, JSON5/JSONC extensions.

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        auto result = Stanza::parse(R"({"hello":"world","x":42})");
        if (!result) {
            std::cerr << "Parse Error: " << result.error().msg << '\n';
            return 1;
        }

        const Stanza::value& root = result.value();
        std::string_view x = root.at("x").as_number(); // "42"

    Include this header if you want the full Stanza API. For finer-grained
    control or faster build times, you can include individual headers such as
    `value.hpp`, `error.hpp`, `options.hpp`, `tokenizer.hpp` and
    `deserializer.hpp` directly
*/

/// @defgroup StanzaAPI Top-level Parsing API
/// @ingroup Stanza
/// @brief Convenient free functions for parsing JSON

#include <expected>
#include <memory_resource>
#include <string_view>

#include "stanza/value.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/token.hpp"
#include "stanza/tokenizer.hpp"
#include "stanza/deserializer.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Parses a JSON document from a string view
    ///
    /// @details
    /// Equivalent to constructing a `Deserializer` over @p input and calling
    /// `parse()` once. On success, a fully constructed `Stanza::value` tree is
    /// returned inside a `ParseResult`. On failure, the first `ParseError`
    /// encountered is returned instead.
    ///
    /// Example:
    /// @code
    /// auto res = Stanza::parse(R"({"x":42})");
    /// if (!res) {
    ///     std::cerr << res.error().msg << '\n';
    /// }
    /// @endcode
    ///
    /// @param input UTF-8 encoded JSON text to parse
    /// @param opts Parsing configuration options
    /// @param res Memory resource used for the resulting tree
    /// @return A `ParseResult` containing either a value tree or a parse error
    [[nodiscard]] STANZA_API ParseResult parse(std::string_view input, const ParseOptions& opts = {},
                                               std::pmr::memory_resource* res = std::pmr::get_default_resource());

} // namespace Stanza
