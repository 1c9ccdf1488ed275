#pragma once

#include <string>

namespace dbx {

/**
 * @brief Render a URI as an N-Triples IRI reference (`<...>`)
 *
 * Control characters, space and the characters `<>"{}|^`\` are not allowed
 * inside an IRIREF and are written as `\uXXXX` escapes. Other bytes,
 * including UTF-8 sequences, are copied unchanged.
 */
std::string iri_ref(const std::string& uri);

/**
 * @brief Format one N-Triples statement line (without the newline)
 */
std::string format_triple(
    const std::string& subject,
    const std::string& predicate,
    const std::string& object
);

} // namespace dbx
