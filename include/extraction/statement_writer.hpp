#pragma once

#include "extraction/statement.hpp"
#include "index/entity_index.hpp"
#include "io/line_writer.hpp"
#include "io/tsv_writer.hpp"

namespace dbx {

/**
 * @brief Persists statements as id triples and as N-Triples
 *
 * Subject and object are indexed as relevant entities, the predicate as a
 * non-relevant one, in the order subject, predicate, object. Statements are
 * not deduplicated: writing the same triple twice produces two rows in each
 * table.
 */
class StatementWriter {
public:
    /**
     * @brief Constructor
     *
     * @param index Entity index used to resolve ids
     * @param tsv_out Receives `(subject id, predicate id, object id)` rows
     * @param nt_out Receives N-Triples lines
     */
    StatementWriter(EntityIndex& index, LineWriter& tsv_out, LineWriter& nt_out);

    /**
     * @brief Index and write one statement
     *
     * @return The ids assigned to subject, predicate and object
     */
    ResolvedStatement write(const Statement& statement);

    /**
     * @brief Number of statements written
     */
    size_t written() const { return written_; }

private:
    EntityIndex& index_;
    TsvWriter tsv_writer_;
    LineWriter& nt_out_;
    size_t written_ = 0;
};

} // namespace dbx
