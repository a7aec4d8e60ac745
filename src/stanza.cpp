#include "stanza/stanza.hpp"


namespace Stanza {

    ParseResult parse(std::string_view input, const ParseOptions& opts, std::pmr::memory_resource* res) {
        Deserializer de{ input, opts, res };
        return de.parse();
    }

} // namespace Stanza
