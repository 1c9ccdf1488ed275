#pragma once

#include <string>

namespace dbx {

/**
 * @brief Sink for newline-terminated text rows
 *
 * Every output table of an extraction run is written through this
 * interface, one row per call.
 */
class LineWriter {
public:
    virtual ~LineWriter() = default;

    /**
     * @brief Append one row; the terminating newline is added by the writer
     */
    virtual void write_line(const std::string& line) = 0;
};

} // namespace dbx
