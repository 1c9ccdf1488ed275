#include "extraction/statement_writer.hpp"
#include "io/ntriples.hpp"

namespace dbx {

StatementWriter::StatementWriter(EntityIndex& index, LineWriter& tsv_out, LineWriter& nt_out)
    : index_(index), tsv_writer_(tsv_out), nt_out_(nt_out) {}

ResolvedStatement StatementWriter::write(const Statement& statement) {
    ResolvedStatement ids;
    ids.subject = index_.resolve(statement.subject, true);
    ids.predicate = index_.resolve(statement.predicate, false);
    ids.object = index_.resolve(statement.object, true);

    tsv_writer_.write_row({
        std::to_string(ids.subject),
        std::to_string(ids.predicate),
        std::to_string(ids.object)
    });
    nt_out_.write_line(format_triple(statement.subject, statement.predicate, statement.object));

    ++written_;
    return ids;
}

} // namespace dbx
