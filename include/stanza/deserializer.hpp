#pragma once


/*
    ---------------------------------------------------
    Stanza::Deserializer - Recursive-descent JSON parser
    ---------------------------------------------------
    `Deserializer` drives a `Stanza::Tokenizer` through the JSON value grammar
    and builds a `Stanza::value` tree bottom-up:

        value  := object | array | string | number | true | false | null
        object := '{' ws '}' | '{' member (',' member)* '}'
        member := ws string ws ':' value ws
        array  := '[' ws ']' | '[' value ws (',' value ws)* ']'

    - The first lexical or grammatical error aborts the whole parse; no
      partial tree is ever returned
    - Duplicate object keys keep the last value
    - Nesting is bounded by `ParseOptions::max_depth`
    - Unless `ParseOptions::allow_trailing_characters` is set, only
      whitespace may follow the top-level value

    A `Deserializer` owns its cursor over one input buffer and is not meant to
    be shared between threads; independent instances may run concurrently.
*/

#include <cstddef>
#include <expected>
#include <memory_resource>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/tokenizer.hpp"
#include "stanza/value.hpp"

namespace Stanza {

    /// @brief Result of a parse: either a complete tree or the first error
    using ParseResult = std::expected<value, ParseError>;

    class Deserializer {
    public:
        /// @param input Text to parse; must outlive the deserializer
        /// @param opts Parsing configuration (copied)
        /// @param res Memory resource used for every node of the resulting tree
        STANZA_API explicit Deserializer(std::string_view input, const ParseOptions& opts = {},
                                         std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Parses one value starting at the current cursor position.
        ///
        /// @details
        /// With default options this is the whole input. When
        /// `allow_trailing_characters` is set, the cursor stops right after the
        /// value and a later call parses the next one.
        [[nodiscard]] STANZA_API ParseResult parse();

        /// @brief Number of input bytes consumed so far
        [[nodiscard]] size_t offset() const noexcept { return m_Tokenizer.offset(); }

    private:
        Tokenizer m_Tokenizer;
        ParseOptions m_Opts;
        std::pmr::memory_resource* m_MemRes;
        size_t m_Depth = 0;

        ParseResult parse_value();
        ParseResult parse_object();
        ParseResult parse_array();
    };

} // namespace Stanza
