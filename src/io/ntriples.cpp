#include "io/ntriples.hpp"
#include <cstdio>

namespace dbx {

namespace {

bool needs_escape(unsigned char c) {
    if (c <= 0x20) return true;
    switch (c) {
        case '<': case '>': case '"': case '{': case '}':
        case '|': case '^': case '`': case '\\':
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

std::string iri_ref(const std::string& uri) {
    std::string out;
    out.reserve(uri.size() + 2);
    out.push_back('<');
    for (unsigned char c : uri) {
        if (needs_escape(c)) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(c));
            out += buf;
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    out.push_back('>');
    return out;
}

std::string format_triple(
    const std::string& subject,
    const std::string& predicate,
    const std::string& object
) {
    return iri_ref(subject) + " " + iri_ref(predicate) + " " + iri_ref(object) + " .";
}

} // namespace dbx
