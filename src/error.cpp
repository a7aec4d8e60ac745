#include "stanza/error.hpp"

namespace Stanza {

    ParseError ParseError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view to_string(ParseError::code c) noexcept {
        switch (c) {
        case ParseError::code::eof: return "eof";
        case ParseError::code::invalid_token: return "invalid_token";
        case ParseError::code::invalid_string: return "invalid_string";
        case ParseError::code::invalid_escape_char: return "invalid_escape_char";
        case ParseError::code::invalid_number: return "invalid_number";
        case ParseError::code::trailing_characters: return "trailing_characters";
        case ParseError::code::depth_limit_exceeded: return "depth_limit_exceeded";
        }
        return "unknown";
    }

} // namespace Stanza
