#include "io/gzip_writer.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <cerrno>
#include <cstring>

namespace dbx {

GzipLineWriter::GzipLineWriter(const std::string& path)
    : path_(path) {
    file_ = gzopen(path_.c_str(), "wb");
    if (!file_) {
        throw OutputError("Failed to open " + path_ + ": " + std::strerror(errno));
    }
}

GzipLineWriter::~GzipLineWriter() {
    if (!file_) return;
    int rc = gzclose(file_);
    file_ = nullptr;
    if (rc != Z_OK) {
        std::cerr << "Failed to close " << path_ << " (zlib code " << rc << ")\n";
    }
}

void GzipLineWriter::write_line(const std::string& line) {
    if (!file_) {
        throw OutputError("Write to closed file: " + path_);
    }

    std::string row = line;
    row.push_back('\n');

    int written = gzwrite(file_, row.data(), static_cast<unsigned>(row.size()));
    if (written <= 0 || static_cast<size_t>(written) != row.size()) {
        throw OutputError("Failed to write " + path_ + ": " + last_error());
    }
}

void GzipLineWriter::flush() {
    if (!file_) return;
    if (gzflush(file_, Z_SYNC_FLUSH) != Z_OK) {
        throw OutputError("Failed to flush " + path_ + ": " + last_error());
    }
}

void GzipLineWriter::close() {
    if (!file_) return;
    gzFile file = file_;
    file_ = nullptr;
    int rc = gzclose(file);
    if (rc != Z_OK) {
        throw OutputError("Failed to close " + path_ + " (zlib code " +
                          std::to_string(rc) + ")");
    }
}

std::string GzipLineWriter::last_error() const {
    int errnum = Z_OK;
    const char* message = gzerror(file_, &errnum);
    if (errnum == Z_ERRNO) {
        return std::strerror(errno);
    }
    return message ? message : "unknown zlib error";
}

} // namespace dbx
