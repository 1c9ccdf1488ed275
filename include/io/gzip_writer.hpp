#pragma once

#include "io/line_writer.hpp"
#include <zlib.h>
#include <string>

namespace dbx {

/**
 * @brief Line writer backed by a gzip-compressed file
 *
 * The file is created (or truncated) on construction and closed on
 * destruction. Failures raise OutputError, except in the destructor, which
 * only reports them on stderr.
 */
class GzipLineWriter : public LineWriter {
public:
    /**
     * @brief Open a gzip file for writing
     *
     * @param path Destination file; its parent directory must exist
     */
    explicit GzipLineWriter(const std::string& path);
    ~GzipLineWriter() override;

    GzipLineWriter(const GzipLineWriter&) = delete;
    GzipLineWriter& operator=(const GzipLineWriter&) = delete;

    void write_line(const std::string& line) override;

    /**
     * @brief Flush compressed data written so far to the file
     */
    void flush();

    /**
     * @brief Finish the gzip member and close the file
     *
     * Calling close on an already closed writer does nothing.
     */
    void close();

    bool is_open() const { return file_ != nullptr; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    gzFile file_ = nullptr;

    std::string last_error() const;
};

} // namespace dbx
