#pragma once

#include <optional>
#include <string>
#include <vector>

namespace dbx {

/**
 * @brief The two queries an extraction run needs
 *
 * The statement query returns the columns `subj`, `pred`, `obj` (and takes
 * `skip`/`limit` when paginated); the label query takes `uri` and returns
 * `label`, `description`, `depiction`.
 */
struct DatasetQueries {
    std::string label_query;
    std::string statement_query;
};

/**
 * @brief A named extraction target
 */
struct DatasetProfile {
    std::string name;                           ///< Command name, e.g. "dbpedia1m"
    std::string description;                    ///< One-line help text
    std::string statement_query_file;           ///< File in the query directory
    std::string label_query_file = "label.query";
    bool paginated = true;                      ///< Use the skip/limit cursor
    size_t progress_interval = 1000000;         ///< Statements between progress lines
    std::string labels_file = "index_labels.tsv.gz";
};

/**
 * @brief All built-in dataset profiles
 */
const std::vector<DatasetProfile>& dataset_profiles();

/**
 * @brief Look up a profile by name
 */
std::optional<DatasetProfile> find_dataset_profile(const std::string& name);

/**
 * @brief Read a query file into memory
 *
 * @throws std::runtime_error if the file cannot be read or is empty
 */
std::string load_query_text(const std::string& path);

/**
 * @brief Load the label and statement queries of a profile
 *
 * @param profile Dataset profile
 * @param query_dir Directory containing the `.query` files
 */
DatasetQueries load_dataset_queries(
    const DatasetProfile& profile,
    const std::string& query_dir
);

} // namespace dbx
