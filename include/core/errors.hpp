#pragma once

#include <stdexcept>
#include <string>

namespace dbx {

/**
 * @brief Base class of every failure that aborts an extraction run
 */
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The graph database could not be reached or rejected the credentials
 */
class ConnectionError : public ExtractionError {
public:
    explicit ConnectionError(const std::string& message)
        : ExtractionError("Connection error: " + message) {}
};

/**
 * @brief The graph database reported an error for a query, or answered with
 * something that is not a query result
 */
class QueryError : public ExtractionError {
public:
    explicit QueryError(const std::string& message)
        : ExtractionError("Query error: " + message) {}
};

/**
 * @brief Writing to one of the output files failed
 */
class OutputError : public ExtractionError {
public:
    explicit OutputError(const std::string& message)
        : ExtractionError("Output error: " + message) {}
};

/**
 * @brief A result record lacks a field the caller depends on
 */
class DataContractError : public ExtractionError {
public:
    explicit DataContractError(const std::string& message)
        : ExtractionError("Data contract violation: " + message) {}
};

} // namespace dbx
