#pragma once

#include "io/line_writer.hpp"
#include <string>
#include <vector>

namespace dbx {

/**
 * @brief Writes tab-separated rows to a line writer
 *
 * Cells containing a tab, a double quote or a line break are wrapped in
 * double quotes with inner quotes doubled. Line breaks inside a quoted cell
 * are kept as they are, so such a row spans several physical lines; CSV
 * readers with quote handling read it back as one record.
 */
class TsvWriter {
public:
    explicit TsvWriter(LineWriter& out) : out_(out) {}

    void write_row(const std::vector<std::string>& cells);

    /**
     * @brief Format a row without writing it
     */
    static std::string format_row(const std::vector<std::string>& cells);

    /**
     * @brief Quote a single cell if it needs quoting
     */
    static std::string quote_cell(const std::string& cell);

private:
    LineWriter& out_;
};

} // namespace dbx
