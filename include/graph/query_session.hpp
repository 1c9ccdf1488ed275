#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dbx {

/**
 * @brief Named query parameters (a JSON object, e.g. {"skip": 0, "limit": 10})
 */
using QueryParameters = nlohmann::json;

// ============================================================================
// Record
// ============================================================================

/**
 * @brief One row of a query result with named fields
 *
 * Values are kept as text; a null value is an empty optional. The column
 * list is shared between all records of a result.
 */
class Record {
public:
    Record() = default;
    Record(
        std::shared_ptr<const std::vector<std::string>> columns,
        std::vector<std::optional<std::string>> values
    );

    /**
     * @brief Whether the result has a column with this name
     */
    bool has_field(const std::string& name) const;

    /**
     * @brief Value of a field, empty if the value is null
     *
     * @throws DataContractError if there is no such column
     */
    std::optional<std::string> get(const std::string& name) const;

    /**
     * @brief Value of a field that must be present and non-null
     *
     * @throws DataContractError if the column is missing or the value is null
     */
    std::string require(const std::string& name) const;

    const std::vector<std::string>& columns() const;
    size_t size() const { return values_.size(); }

private:
    std::shared_ptr<const std::vector<std::string>> columns_;
    std::vector<std::optional<std::string>> values_;

    size_t column_index(const std::string& name) const;
};

// ============================================================================
// Query Result
// ============================================================================

/**
 * @brief Forward-only cursor over the records of one query
 */
class QueryResult {
public:
    virtual ~QueryResult() = default;

    /**
     * @brief Look at the next record without consuming it
     *
     * @return The next record, or nullptr if the result is exhausted
     */
    virtual const Record* peek() = 0;

    /**
     * @brief Move the next record into `record`
     *
     * @return false if the result is exhausted
     */
    virtual bool next(Record& record) = 0;
};

/**
 * @brief Query result whose records are all held in memory
 */
class BufferedResult : public QueryResult {
public:
    BufferedResult() = default;
    explicit BufferedResult(std::vector<Record> records)
        : records_(std::move(records)) {}

    const Record* peek() override;
    bool next(Record& record) override;

    size_t remaining() const { return records_.size() - position_; }

private:
    std::vector<Record> records_;
    size_t position_ = 0;
};

// ============================================================================
// Query Session
// ============================================================================

/**
 * @brief Executes parameterized queries against a graph database
 *
 * Implementations raise ConnectionError when the database is unreachable or
 * rejects the credentials, and QueryError when it rejects a query.
 */
class QuerySession {
public:
    virtual ~QuerySession() = default;

    /**
     * @brief Run a query
     *
     * @param query Query text
     * @param parameters JSON object with the query parameters
     * @return Cursor over the result records
     */
    virtual std::unique_ptr<QueryResult> run(
        const std::string& query,
        const QueryParameters& parameters = QueryParameters::object()
    ) = 0;
};

} // namespace dbx
