#pragma once

#include "io/gzip_writer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dbx {

/**
 * @brief File names of the five output tables, relative to the data directory
 */
struct OutputLayout {
    std::string index_file = "index.tsv.gz";                    ///< (id, uri)
    std::string relevant_file = "relevant_entities.tsv.gz";     ///< (id)
    std::string labels_file = "index_labels.tsv.gz";            ///< (id, label, description, depiction)
    std::string statements_tsv_file = "statements.tsv.gz";      ///< (subject id, predicate id, object id)
    std::string statements_nt_file = "statements.nt.gz";        ///< N-Triples
};

/**
 * @brief The output files of one extraction run, acquired and released together
 *
 * All five files are opened by the constructor, which creates the data
 * directory if needed. If any of them cannot be opened, the ones already
 * opened are closed again before the error propagates. The destructor closes
 * whatever is still open, so no file handle outlives the group on any exit
 * path.
 */
class OutputStreams {
public:
    explicit OutputStreams(
        const std::string& data_dir,
        const OutputLayout& layout = OutputLayout()
    );
    ~OutputStreams();

    OutputStreams(const OutputStreams&) = delete;
    OutputStreams& operator=(const OutputStreams&) = delete;

    GzipLineWriter& index() { return *index_; }
    GzipLineWriter& relevant() { return *relevant_; }
    GzipLineWriter& labels() { return *labels_; }
    GzipLineWriter& statements_tsv() { return *statements_tsv_; }
    GzipLineWriter& statements_nt() { return *statements_nt_; }

    /**
     * @brief Flush and close every file
     *
     * All files are closed even if one of them fails; the first failure is
     * rethrown afterwards.
     */
    void close();

    /**
     * @brief Best-effort close used on failure paths; never throws
     */
    void close_quietly() noexcept;

    /**
     * @brief Full paths of the five files, in layout order
     */
    std::vector<std::string> paths() const;

    const std::string& data_dir() const { return data_dir_; }

private:
    std::string data_dir_;
    std::unique_ptr<GzipLineWriter> index_;
    std::unique_ptr<GzipLineWriter> relevant_;
    std::unique_ptr<GzipLineWriter> labels_;
    std::unique_ptr<GzipLineWriter> statements_tsv_;
    std::unique_ptr<GzipLineWriter> statements_nt_;

    std::vector<GzipLineWriter*> writers();
};

} // namespace dbx
