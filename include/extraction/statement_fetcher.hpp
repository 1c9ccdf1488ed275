#pragma once

#include "extraction/statement.hpp"
#include "graph/query_session.hpp"
#include <memory>
#include <string>

namespace dbx {

/**
 * @brief Lazy, forward-only sequence of statements
 */
class StatementStream {
public:
    virtual ~StatementStream() = default;

    /**
     * @brief Fetch the next statement
     *
     * @return false once the sequence is exhausted; it cannot be restarted
     */
    virtual bool next(Statement& statement) = 0;

    /**
     * @brief Number of non-empty result pages received so far
     */
    virtual size_t pages_fetched() const = 0;

    /**
     * @brief Number of queries the database answered so far
     */
    virtual size_t queries_issued() const = 0;
};

/**
 * @brief Convert a record with fields `subj`, `pred`, `obj` to a statement
 *
 * @throws DataContractError if a field is missing or null
 */
Statement statement_from_record(const Record& record);

/**
 * @brief Fetches statements page by page with a skip/limit cursor
 *
 * The query receives the parameters `skip` and `limit`. After a page is
 * drained, `skip` advances by the page size and the next page is requested.
 * The sequence ends with the first page that has no rows.
 */
class PagedStatementFetcher : public StatementStream {
public:
    static constexpr size_t kDefaultPageSize = 1000000;

    PagedStatementFetcher(
        QuerySession& session,
        std::string query,
        size_t page_size = kDefaultPageSize
    );

    bool next(Statement& statement) override;

    size_t pages_fetched() const override { return pages_fetched_; }
    size_t queries_issued() const override { return queries_issued_; }

    size_t page_size() const { return page_size_; }

private:
    QuerySession& session_;
    std::string query_;
    size_t page_size_;
    size_t skip_ = 0;
    size_t pages_fetched_ = 0;
    size_t queries_issued_ = 0;
    bool exhausted_ = false;
    std::unique_ptr<QueryResult> page_;
    Record record_;

    /**
     * @brief Request the page at the current cursor
     *
     * @return false if the page is empty
     */
    bool open_page();
};

/**
 * @brief Streams the result of one query, for samples small enough to be
 * fetched in a single round trip
 */
class SingleQueryStatementFetcher : public StatementStream {
public:
    SingleQueryStatementFetcher(QuerySession& session, std::string query);

    bool next(Statement& statement) override;

    size_t pages_fetched() const override { return pages_fetched_; }
    size_t queries_issued() const override { return result_ ? 1 : 0; }

private:
    QuerySession& session_;
    std::string query_;
    std::unique_ptr<QueryResult> result_;
    size_t pages_fetched_ = 0;
    Record record_;
};

} // namespace dbx
