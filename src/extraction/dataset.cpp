#include "extraction/dataset.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace dbx {

namespace {

DatasetProfile make_profile(
    const std::string& name,
    const std::string& description,
    bool paginated,
    size_t progress_interval,
    const std::string& labels_file
) {
    DatasetProfile profile;
    profile.name = name;
    profile.description = description;
    profile.statement_query_file = name + "_statements.query";
    profile.paginated = paginated;
    profile.progress_interval = progress_interval;
    profile.labels_file = labels_file;
    return profile;
}

} // anonymous namespace

const std::vector<DatasetProfile>& dataset_profiles() {
    static const std::vector<DatasetProfile> profiles = {
        make_profile("dbpedia35m", "Extract the DBpedia35M subgraph",
                     true, 1000000, "index_labels.tsv.gz"),
        make_profile("dbpedia1m", "Extract the DBpedia1M subgraph",
                     true, 1000000, "index_labels.tsv.gz"),
        make_profile("dbpedia500k", "Extract the DBpedia500K subgraph",
                     true, 1000000, "index_labels.tsv.gz"),
        make_profile("dbpedia250k", "Extract the DBpedia250K subgraph",
                     true, 1000000, "index_labels.tsv.gz"),
        make_profile("dbpediaA240", "Extract the DBpediaA240 subgraph",
                     true, 1000000, "index_labels.tsv.gz"),
        make_profile("sample1m", "Sample 1M statements with a single query",
                     false, 100000, "labels.tsv.gz")
    };
    return profiles;
}

std::optional<DatasetProfile> find_dataset_profile(const std::string& name) {
    for (const auto& profile : dataset_profiles()) {
        if (profile.name == name) return profile;
    }
    return std::nullopt;
}

std::string load_query_text(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open query file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();

    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw std::runtime_error("Query file is empty: " + path);
    }
    return text;
}

DatasetQueries load_dataset_queries(
    const DatasetProfile& profile,
    const std::string& query_dir
) {
    DatasetQueries queries;
    queries.label_query = load_query_text(
        (fs::path(query_dir) / profile.label_query_file).string()
    );
    queries.statement_query = load_query_text(
        (fs::path(query_dir) / profile.statement_query_file).string()
    );
    return queries;
}

} // namespace dbx
