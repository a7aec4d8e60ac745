#pragma once


/*
    ------------------------
    Stanza parsing options
    ------------------------
    This header defines the configuration structure that controls the
    behavior of parsing (JSON -> value tree)

    --------------------------------------
    Parsing Options - Stanza::ParseOptions
    --------------------------------------
    `ParseOptions` tunes how `Stanza::parse(...)` and `Stanza::Deserializer`
    behave:

    - `size_t max_depth`:
        * Limit on nesting depth of arrays/objects
        * If exceeded, the parser fails with `depth_limit_exceeded` instead
          of growing the native stack further
        * A value of 0 is treated as no explicit limit
    - `bool allow_trailing_characters`:
        * When false (default), the whole input must be consumed: after the
          top-level value only whitespace may remain, otherwise the parse
          fails with `trailing_characters`
        * When true, only a prefix of the input is parsed and the rest is
          left untouched; `Deserializer::offset()` tells how much was read

    -----
    Usage
    -----
        auto result = Stanza::parse(text, ParseOptions{ .max_depth = 64 });

    The structure is a plain aggregate suitable for brace-initialization
*/


#include <cstddef>

/// @defgroup StanzaOptions Parsing Options
/// @ingroup Stanza
/// @brief Configuration objects controlling parsing

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Default nesting limit applied by `ParseOptions`.
    inline constexpr std::size_t default_max_depth = 512;

    /// @ingroup StanzaOptions
    /// @brief Configuration controlling JSON parsing behavior
    ///
    /// @details
    /// By default the parser requires the entire input to be a single JSON
    /// value surrounded by optional whitespace, and bounds the nesting depth
    /// to `default_max_depth`.
    ///
    /// Example:
    /// @code
    /// ParseOptions opts;
    /// opts.max_depth = 32;
    /// opts.allow_trailing_characters = true;
    /// Stanza::Deserializer de{ text, opts };
    /// auto result = de.parse();
    /// @endcode
    struct ParseOptions {
        std::size_t max_depth = default_max_depth; ///< Maximum allowed nesting depth (0 = unlimited)
        bool allow_trailing_characters = false;    ///< Permit input after the top-level value if true
    };

} // namespace Stanza
