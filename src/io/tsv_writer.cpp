#include "io/tsv_writer.hpp"

namespace dbx {

void TsvWriter::write_row(const std::vector<std::string>& cells) {
    out_.write_line(format_row(cells));
}

std::string TsvWriter::format_row(const std::vector<std::string>& cells) {
    std::string row;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) row.push_back('\t');
        row += quote_cell(cells[i]);
    }
    return row;
}

std::string TsvWriter::quote_cell(const std::string& cell) {
    if (cell.find_first_of("\t\"\r\n") == std::string::npos) {
        return cell;
    }

    std::string quoted = "\"";
    for (char c : cell) {
        if (c == '"') quoted.push_back('"');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

} // namespace dbx
