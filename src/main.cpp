#include "cli/cli.hpp"
#include "extraction/dataset.hpp"
#include "graph/neo4j_session.hpp"
#include "pipeline/extraction_driver.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

using namespace dbx;

// ============== Helper Functions ==============

// Defaults < environment < config file < command line
ExtractorConfig build_config(const DatasetProfile& profile, const Args& args) {
    ExtractorConfig config = args.has("config")
        ? ExtractorConfig::from_json_file(args.get("config"))
        : ExtractorConfig::from_environment();

    if (args.has("data-dir")) config.data_dir = args.get("data-dir");
    if (args.has("host")) config.neo4j_host = args.get("host");
    if (args.has("port")) {
        long long port = args.get_integer("port");
        if (port <= 0 || port > 65535) {
            throw std::invalid_argument("--port must be between 1 and 65535");
        }
        config.neo4j_port = static_cast<int>(port);
    }
    if (args.has("username")) config.neo4j_username = args.get("username");
    if (args.has("password")) config.neo4j_password = args.get("password");
    if (args.has("database")) config.neo4j_database = args.get("database");
    if (args.has("query-dir")) config.query_dir = args.get("query-dir");
    if (args.has("quiet")) config.verbose = false;

    if (args.has("page-size")) {
        long long page_size = args.get_integer("page-size");
        if (page_size <= 0) {
            throw std::invalid_argument("--page-size must be positive");
        }
        config.page_size = static_cast<size_t>(page_size);
    }

    if (config.data_dir.empty()) {
        config.data_dir = default_data_dir(profile.name);
    }

    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    return config;
}

void write_statistics(const ExtractionStatistics& stats, const std::string& path) {
    fs::path out_path(path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write statistics: " + path);
    }
    file << stats.to_json().dump(2);
    std::cout << "Saved statistics: " << path << "\n";
}

// ============== dbx <dataset> ==============
int cmd_extract(const DatasetProfile& profile, const Args& args) {
    ExtractorConfig config = build_config(profile, args);

    DatasetQueries queries = load_dataset_queries(profile, config.query_dir);

    Neo4jConfig neo4j = config.neo4j_config();
    if (config.verbose) {
        std::cout << "Connecting to " << neo4j.commit_url()
                  << " as " << neo4j.username << "\n";
    }
    Neo4jHttpSession session(neo4j);
    session.verify_connectivity();

    ExtractionDriver driver(session, profile, std::move(queries), config);
    ExtractionStatistics stats = driver.run();

    if (config.verbose) {
        stats.print_summary();
    }
    if (args.has("stats-output")) {
        write_statistics(stats, args.get("stats-output"));
    }
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("dbx", "1.0.0");

    for (const DatasetProfile& profile : dataset_profiles()) {
        cli.register_command({
            profile.name,
            profile.description,
            {
                {"data-dir", "d", "Directory for the output files (default: data/" + profile.name + ")"},
                {"host", "H", "Neo4j host (default: $NEO4J_HOSTNAME or localhost)"},
                {"port", "P", "Neo4j HTTP port (default: $NEO4J_HTTP_PORT or 7474)"},
                {"username", "u", "Neo4j username (default: $NEO4J_USERNAME or neo4j)"},
                {"password", "w", "Neo4j password (default: $NEO4J_PASSWORD or neo4j)"},
                {"database", "b", "Neo4j database (default: $NEO4J_DATABASE or neo4j)"},
                {"query-dir", "q", "Directory with the .query files (default: $DBX_QUERY_DIR)"},
                {"page-size", "s", "Statements fetched per page (default: 1000000)"},
                {"config", "c", "JSON config file (optional)"},
                {"stats-output", "o", "Write run statistics as JSON to this file"},
                {"quiet", "Q", "Only report errors", true}
            },
            [profile](const Args& args) { return cmd_extract(profile, args); }
        });
    }

    return cli.run(argc, argv);
}
