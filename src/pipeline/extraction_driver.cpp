#include "pipeline/extraction_driver.hpp"
#include "extraction/statement_writer.hpp"
#include "io/output_streams.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#ifndef DBX_DEFAULT_QUERY_DIR
#define DBX_DEFAULT_QUERY_DIR "queries"
#endif

using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

int parse_port(const std::string& text, const std::string& source) {
    try {
        size_t used = 0;
        int port = std::stoi(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return port;
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid port in " + source + ": " + text);
    }
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

}  // namespace

namespace dbx {

// ============================================================================
// ExtractorConfig
// ============================================================================

ExtractorConfig ExtractorConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    ExtractorConfig config = from_environment();

    try {
        // Connection - both "neo4j_host" and the short "host" are accepted
        if (j.contains("neo4j_scheme")) config.neo4j_scheme = j["neo4j_scheme"];
        else if (j.contains("scheme")) config.neo4j_scheme = j["scheme"];

        if (j.contains("neo4j_host")) config.neo4j_host = j["neo4j_host"];
        else if (j.contains("host")) config.neo4j_host = j["host"];

        if (j.contains("neo4j_port")) config.neo4j_port = j["neo4j_port"];
        else if (j.contains("port")) config.neo4j_port = j["port"];

        if (j.contains("neo4j_username")) config.neo4j_username = j["neo4j_username"];
        else if (j.contains("username")) config.neo4j_username = j["username"];

        if (j.contains("neo4j_password")) config.neo4j_password = j["neo4j_password"];
        else if (j.contains("password")) config.neo4j_password = j["password"];

        if (j.contains("neo4j_database")) config.neo4j_database = j["neo4j_database"];
        else if (j.contains("database")) config.neo4j_database = j["database"];

        if (j.contains("timeout_seconds")) config.timeout_seconds = j["timeout_seconds"];

        // Extraction
        if (j.contains("data_dir")) config.data_dir = j["data_dir"];
        if (j.contains("query_dir")) config.query_dir = j["query_dir"];
        if (j.contains("page_size")) {
            const json& page_size = j["page_size"];
            if (!page_size.is_number_unsigned() || page_size.get<size_t>() == 0) {
                throw std::runtime_error(
                    "Invalid config file " + path + ": page_size must be a positive integer"
                );
            }
            config.page_size = page_size.get<size_t>();
        }

        // Logging
        if (j.contains("verbose")) config.verbose = j["verbose"];
    } catch (const json::type_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    return config;
}

void ExtractorConfig::to_json_file(const std::string& path) const {
    json j;

    j["neo4j_scheme"] = neo4j_scheme;
    j["neo4j_host"] = neo4j_host;
    j["neo4j_port"] = neo4j_port;
    j["neo4j_username"] = neo4j_username;
    j["neo4j_password"] = "***REDACTED***";
    j["neo4j_database"] = neo4j_database;
    j["timeout_seconds"] = timeout_seconds;

    j["data_dir"] = data_dir;
    j["query_dir"] = query_dir;
    j["page_size"] = page_size;

    j["verbose"] = verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << j.dump(2);
}

ExtractorConfig ExtractorConfig::from_environment() {
    ExtractorConfig config;
    config.query_dir = DBX_DEFAULT_QUERY_DIR;

    const char* host = std::getenv("NEO4J_HOSTNAME");
    if (host) config.neo4j_host = host;

    const char* port = std::getenv("NEO4J_HTTP_PORT");
    if (port) config.neo4j_port = parse_port(port, "NEO4J_HTTP_PORT");

    const char* username = std::getenv("NEO4J_USERNAME");
    if (username) config.neo4j_username = username;

    const char* password = std::getenv("NEO4J_PASSWORD");
    if (password) config.neo4j_password = password;

    const char* database = std::getenv("NEO4J_DATABASE");
    if (database) config.neo4j_database = database;

    const char* scheme = std::getenv("NEO4J_SCHEME");
    if (scheme) config.neo4j_scheme = scheme;

    const char* query_dir = std::getenv("DBX_QUERY_DIR");
    if (query_dir) config.query_dir = query_dir;

    const char* log_level = std::getenv("LOG_LEVEL");
    if (log_level) config.verbose = log_level_is_verbose(log_level);

    return config;
}

bool ExtractorConfig::validate(std::string& error_message) const {
    if (neo4j_scheme != "http" && neo4j_scheme != "https") {
        error_message = "Neo4j scheme must be 'http' or 'https'";
        return false;
    }

    if (neo4j_host.empty()) {
        error_message = "Neo4j host is required";
        return false;
    }

    if (neo4j_port <= 0 || neo4j_port > 65535) {
        error_message = "Neo4j port must be between 1 and 65535";
        return false;
    }

    if (neo4j_database.empty()) {
        error_message = "Neo4j database name is required";
        return false;
    }

    if (timeout_seconds < 0) {
        error_message = "Timeout must not be negative";
        return false;
    }

    if (data_dir.empty()) {
        error_message = "Data directory is required";
        return false;
    }

    if (query_dir.empty()) {
        error_message = "Query directory is required";
        return false;
    }

    if (page_size == 0) {
        error_message = "Page size must be positive";
        return false;
    }

    return true;
}

Neo4jConfig ExtractorConfig::neo4j_config() const {
    Neo4jConfig neo4j;
    neo4j.scheme = neo4j_scheme;
    neo4j.host = neo4j_host;
    neo4j.port = neo4j_port;
    neo4j.username = neo4j_username;
    neo4j.password = neo4j_password;
    neo4j.database = neo4j_database;
    neo4j.timeout_seconds = timeout_seconds;
    return neo4j;
}

// ============================================================================
// ExtractionStatistics
// ============================================================================

void ExtractionStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Extraction Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Statements:\n";
    std::cout << "  Written: " << statements << "\n";
    std::cout << "  Pages fetched: " << pages_fetched << "\n";
    std::cout << "  Queries issued: " << queries_issued << "\n\n";

    std::cout << "Entities:\n";
    std::cout << "  Indexed: " << entities << "\n";
    std::cout << "  Relevant: " << relevant_entities << "\n\n";

    std::cout << "Labels:\n";
    std::cout << "  Lookups: " << label_lookups << "\n";
    std::cout << "  Written: " << labels_written << "\n";
    std::cout << "  Without label: " << labels_missing << "\n\n";

    std::cout << "Total time: " << total_time_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json ExtractionStatistics::to_json() const {
    json j;

    j["statements"] = statements;
    j["entities"] = entities;
    j["relevant_entities"] = relevant_entities;

    j["label_lookups"] = label_lookups;
    j["labels_written"] = labels_written;
    j["labels_missing"] = labels_missing;

    j["pages_fetched"] = pages_fetched;
    j["queries_issued"] = queries_issued;

    j["total_time_seconds"] = total_time_seconds;

    return j;
}

// ============================================================================
// ExtractionDriver
// ============================================================================

std::string driver_state_to_string(DriverState state) {
    switch (state) {
        case DriverState::Idle: return "idle";
        case DriverState::Running: return "running";
        case DriverState::Completed: return "completed";
        case DriverState::Failed: return "failed";
        default: return "unknown";
    }
}

ExtractionDriver::ExtractionDriver(
    QuerySession& session,
    const DatasetProfile& profile,
    DatasetQueries queries,
    const ExtractorConfig& config
) : session_(session),
    profile_(profile),
    queries_(std::move(queries)),
    config_(config) {
    if (config_.data_dir.empty()) {
        throw std::invalid_argument("Invalid configuration: data directory is required");
    }
    if (config_.page_size == 0) {
        throw std::invalid_argument("Invalid configuration: page size must be positive");
    }
}

ExtractionStatistics ExtractionDriver::run() {
    if (state_ != DriverState::Idle) {
        throw std::logic_error(
            "extraction driver is " + driver_state_to_string(state_) +
            "; a new run needs a new driver"
        );
    }

    state_ = DriverState::Running;
    stats_ = ExtractionStatistics();
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        OutputLayout layout;
        layout.labels_file = profile_.labels_file;
        OutputStreams outputs(config_.data_dir, layout);

        report_progress("Extracting", 0, profile_.name + " -> " + config_.data_dir);

        EntityIndex index(outputs.index(), outputs.relevant());
        LabelStore labels(outputs.labels());
        StatementWriter writer(index, outputs.statements_tsv(), outputs.statements_nt());
        auto fetcher = create_fetcher();

        const size_t interval = std::max<size_t>(profile_.progress_interval, 1);
        Statement statement;
        try {
            while (fetcher->next(statement)) {
                ResolvedStatement ids = writer.write(statement);
                label_entity(labels, statement.subject, ids.subject);
                label_entity(labels, statement.object, ids.object);

                stats_.statements++;
                if (stats_.statements % interval == 0) {
                    report_progress("Loaded", stats_.statements, "statements");
                }
            }
        } catch (const std::exception&) {
            collect_statistics(index, labels, *fetcher);
            throw;
        }

        collect_statistics(index, labels, *fetcher);
        outputs.close();
    } catch (const std::exception& e) {
        // The output group has already released its files at this point
        state_ = DriverState::Failed;
        stats_.total_time_seconds = std::chrono::duration<double>(
            std::chrono::high_resolution_clock::now() - start_time
        ).count();
        std::cerr << "Extraction failed after " << stats_.statements
                  << " statements: " << e.what() << "\n";
        throw;
    }

    stats_.total_time_seconds = std::chrono::duration<double>(
        std::chrono::high_resolution_clock::now() - start_time
    ).count();
    state_ = DriverState::Completed;

    report_progress("Completed", stats_.statements, "Successfully loaded statements");
    return stats_;
}

void ExtractionDriver::collect_statistics(
    const EntityIndex& index,
    const LabelStore& labels,
    const StatementStream& fetcher
) {
    stats_.entities = index.size();
    stats_.relevant_entities = index.relevant_count();
    stats_.labels_written = labels.labeled_count();
    stats_.pages_fetched = fetcher.pages_fetched();
    stats_.queries_issued = fetcher.queries_issued();
}

std::unique_ptr<StatementStream> ExtractionDriver::create_fetcher() {
    if (profile_.paginated) {
        return std::make_unique<PagedStatementFetcher>(
            session_,
            queries_.statement_query,
            config_.page_size
        );
    }
    return std::make_unique<SingleQueryStatementFetcher>(session_, queries_.statement_query);
}

void ExtractionDriver::label_entity(LabelStore& labels, const std::string& uri, EntityId id) {
    if (labels.has_label(id)) return;

    stats_.label_lookups++;
    std::optional<LabelRecord> record = fetch_label(uri);
    if (record) {
        labels.write_label(id, record->label, record->description, record->depiction);
    } else {
        labels.mark_unlabeled(id);
        stats_.labels_missing++;
    }
}

std::optional<LabelRecord> ExtractionDriver::fetch_label(const std::string& uri) {
    auto result = session_.run(queries_.label_query, {{"uri", uri}});

    Record row;
    if (!result->next(row)) {
        return std::nullopt;
    }

    LabelRecord record;
    record.label = row.get("label").value_or("");
    record.description = row.get("description").value_or("");
    record.depiction = row.get("depiction").value_or("");
    return record;
}

void ExtractionDriver::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void ExtractionDriver::report_progress(
    const std::string& stage,
    size_t statements,
    const std::string& message
) {
    if (progress_callback_) {
        progress_callback_(stage, statements, message);
    } else if (config_.verbose) {
        std::cout << "[" << stage << "] " << statements;
        if (!message.empty()) {
            std::cout << " - " << message;
        }
        std::cout << "\n";
    }
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string default_data_dir(const std::string& dataset_name) {
    return (fs::current_path() / "data" / dataset_name).string();
}

bool log_level_is_verbose(const std::string& level) {
    std::string normalized = upper(level);
    return normalized != "WARNING" && normalized != "WARN" &&
           normalized != "ERROR" && normalized != "CRITICAL";
}

} // namespace dbx
