#pragma once

#include "graph/query_session.hpp"
#include <memory>
#include <string>

namespace dbx {

/**
 * @brief Connection settings for a Neo4j server
 */
struct Neo4jConfig {
    std::string scheme = "http";            ///< "http" or "https"
    std::string host = "localhost";         ///< Server host name
    int port = 7474;                        ///< HTTP(S) port
    std::string username = "neo4j";         ///< Basic auth user
    std::string password = "neo4j";         ///< Basic auth password
    std::string database = "neo4j";         ///< Database name
    int timeout_seconds = 0;                ///< Request timeout, 0 = none
    bool verbose = false;                   ///< Log every request

    /**
     * @brief URL of the transactional auto-commit endpoint
     */
    std::string commit_url() const;
};

/**
 * @brief Query session talking to Neo4j's transactional Cypher HTTP API
 *
 * Every call to run() is one auto-commit request; the complete result is
 * received before run() returns.
 */
class Neo4jHttpSession : public QuerySession {
public:
    explicit Neo4jHttpSession(const Neo4jConfig& config);

    std::unique_ptr<QueryResult> run(
        const std::string& query,
        const QueryParameters& parameters = QueryParameters::object()
    ) override;

    /**
     * @brief Run a trivial query to check reachability and credentials
     *
     * @throws ConnectionError on failure
     */
    void verify_connectivity();

    const Neo4jConfig& get_config() const { return config_; }

private:
    Neo4jConfig config_;

    /**
     * @brief Build the JSON request body for one statement
     */
    std::string build_payload(
        const std::string& query,
        const QueryParameters& parameters
    ) const;
};

/**
 * @brief Parse a response of the transactional endpoint into a result
 *
 * @throws ConnectionError for security errors reported by the server
 * @throws QueryError for any other reported error or a malformed body
 */
std::unique_ptr<QueryResult> parse_neo4j_response(const std::string& body);

} // namespace dbx
