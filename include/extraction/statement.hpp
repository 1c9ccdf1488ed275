#pragma once

#include "index/entity_index.hpp"
#include <string>

namespace dbx {

/**
 * @brief A (subject, predicate, object) triple of entity URIs
 */
struct Statement {
    std::string subject;
    std::string predicate;
    std::string object;

    bool operator==(const Statement& other) const {
        return subject == other.subject &&
               predicate == other.predicate &&
               object == other.object;
    }
    bool operator!=(const Statement& other) const { return !(*this == other); }
};

/**
 * @brief Ids assigned to the three parts of a statement
 */
struct ResolvedStatement {
    EntityId subject = 0;
    EntityId predicate = 0;
    EntityId object = 0;
};

} // namespace dbx
