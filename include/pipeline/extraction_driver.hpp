#pragma once

#include "extraction/dataset.hpp"
#include "extraction/statement_fetcher.hpp"
#include "graph/neo4j_session.hpp"
#include "graph/query_session.hpp"
#include "index/entity_index.hpp"
#include "index/label_store.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace dbx {

// ============================================================================
// Extractor Configuration
// ============================================================================

/**
 * @brief Configuration for an extraction run
 */
struct ExtractorConfig {
    // Neo4j connection
    std::string neo4j_scheme = "http";      ///< "http" or "https"
    std::string neo4j_host = "localhost";   ///< Host of the Neo4j instance
    int neo4j_port = 7474;                  ///< HTTP port of the Neo4j instance
    std::string neo4j_username = "neo4j";   ///< Username
    std::string neo4j_password = "neo4j";   ///< Password
    std::string neo4j_database = "neo4j";   ///< Database holding the DBpedia KG
    int timeout_seconds = 0;                ///< Per-request timeout, 0 = none

    // Extraction
    std::string data_dir;                   ///< Output directory (empty = data/<dataset>)
    std::string query_dir;                  ///< Directory with the .query files
    size_t page_size = PagedStatementFetcher::kDefaultPageSize;

    // Logging
    bool verbose = true;                    ///< Progress logging

    /**
     * @brief Load configuration from JSON file, on top of the environment
     */
    static ExtractorConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file (password redacted)
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from environment variables
     *
     * Reads NEO4J_HOSTNAME, NEO4J_HTTP_PORT, NEO4J_USERNAME, NEO4J_PASSWORD,
     * NEO4J_DATABASE, NEO4J_SCHEME, DBX_QUERY_DIR and LOG_LEVEL.
     */
    static ExtractorConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    /**
     * @brief Connection settings for the graph client
     */
    Neo4jConfig neo4j_config() const;
};

// ============================================================================
// Extraction Statistics
// ============================================================================

/**
 * @brief Counters of one extraction run
 */
struct ExtractionStatistics {
    size_t statements = 0;
    size_t entities = 0;
    size_t relevant_entities = 0;

    size_t label_lookups = 0;
    size_t labels_written = 0;
    size_t labels_missing = 0;

    size_t pages_fetched = 0;
    size_t queries_issued = 0;

    double total_time_seconds = 0.0;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    /**
     * @brief Export to JSON
     */
    nlohmann::json to_json() const;
};

// ============================================================================
// Progress Callbacks
// ============================================================================

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    size_t statements,
    const std::string& message
)>;

// ============================================================================
// Extraction Driver
// ============================================================================

/**
 * @brief Lifecycle of a driver; Completed and Failed are final
 */
enum class DriverState {
    Idle,
    Running,
    Completed,
    Failed
};

std::string driver_state_to_string(DriverState state);

/**
 * @brief Runs one extraction: statements → index, labels and output files
 *
 * For every fetched statement the driver writes the statement, then looks up
 * and writes the label of its subject and object unless the entity was
 * handled before. A label lookup without a row marks the entity as unlabeled
 * so it is not queried again.
 *
 * A driver runs once. Any failure closes the output files before the
 * exception reaches the caller; the files keep what was written up to that
 * point.
 */
class ExtractionDriver {
public:
    /**
     * @brief Constructor
     *
     * @param session Graph database session, used for statements and labels
     * @param profile Dataset profile (pagination, progress, file names)
     * @param queries Label and statement queries of the profile
     * @param config Run configuration; `data_dir` must be set
     */
    ExtractionDriver(
        QuerySession& session,
        const DatasetProfile& profile,
        DatasetQueries queries,
        const ExtractorConfig& config
    );

    /**
     * @brief Run the extraction
     *
     * @return Statistics of the completed run
     * @throws std::logic_error if the driver already ran
     */
    ExtractionStatistics run();

    DriverState state() const { return state_; }

    /**
     * @brief Set progress callback
     */
    void set_progress_callback(ProgressCallback callback);

    /**
     * @brief Get run statistics (partial while running or after failure)
     */
    ExtractionStatistics get_statistics() const { return stats_; }

private:
    QuerySession& session_;
    DatasetProfile profile_;
    DatasetQueries queries_;
    ExtractorConfig config_;
    DriverState state_ = DriverState::Idle;
    ExtractionStatistics stats_;
    ProgressCallback progress_callback_;

    /**
     * @brief Create the statement source for the profile
     */
    std::unique_ptr<StatementStream> create_fetcher();

    /**
     * @brief Copy the index, label and fetcher counters into the statistics
     */
    void collect_statistics(
        const EntityIndex& index,
        const LabelStore& labels,
        const StatementStream& fetcher
    );

    /**
     * @brief Label an entity unless it was handled before
     */
    void label_entity(LabelStore& labels, const std::string& uri, EntityId id);

    /**
     * @brief Run the label query for one entity
     *
     * @return The first row, or std::nullopt if there is none
     */
    std::optional<LabelRecord> fetch_label(const std::string& uri);

    /**
     * @brief Report progress
     */
    void report_progress(
        const std::string& stage,
        size_t statements,
        const std::string& message = ""
    );
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Default data directory for a dataset: <cwd>/data/<dataset>
 */
std::string default_data_dir(const std::string& dataset_name);

/**
 * @brief Map a LOG_LEVEL value to the verbose flag
 */
bool log_level_is_verbose(const std::string& level);

} // namespace dbx
