#include "io/output_streams.hpp"
#include "core/errors.hpp"
#include <filesystem>
#include <exception>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace dbx {

namespace {

std::string join_path(const std::string& dir, const std::string& file) {
    return (fs::path(dir) / file).string();
}

} // anonymous namespace

OutputStreams::OutputStreams(const std::string& data_dir, const OutputLayout& layout)
    : data_dir_(data_dir) {
    std::error_code ec;
    fs::create_directories(data_dir_, ec);
    if (ec) {
        throw OutputError("Failed to create data directory " + data_dir_ + ": " + ec.message());
    }

    index_ = std::make_unique<GzipLineWriter>(join_path(data_dir_, layout.index_file));
    relevant_ = std::make_unique<GzipLineWriter>(join_path(data_dir_, layout.relevant_file));
    labels_ = std::make_unique<GzipLineWriter>(join_path(data_dir_, layout.labels_file));
    statements_tsv_ = std::make_unique<GzipLineWriter>(join_path(data_dir_, layout.statements_tsv_file));
    statements_nt_ = std::make_unique<GzipLineWriter>(join_path(data_dir_, layout.statements_nt_file));
}

OutputStreams::~OutputStreams() {
    close_quietly();
}

void OutputStreams::close() {
    std::exception_ptr first_error;

    // Every file gets closed even after a failure; the first one is reported
    for (GzipLineWriter* writer : writers()) {
        try {
            writer->flush();
        } catch (const std::exception&) {
            if (!first_error) first_error = std::current_exception();
        }
        try {
            writer->close();
        } catch (const std::exception&) {
            if (!first_error) first_error = std::current_exception();
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

void OutputStreams::close_quietly() noexcept {
    for (GzipLineWriter* writer : writers()) {
        try {
            writer->close();
        } catch (const std::exception& e) {
            std::cerr << "Warning: " << e.what() << "\n";
        }
    }
}

std::vector<std::string> OutputStreams::paths() const {
    return {
        index_->path(),
        relevant_->path(),
        labels_->path(),
        statements_tsv_->path(),
        statements_nt_->path()
    };
}

std::vector<GzipLineWriter*> OutputStreams::writers() {
    std::vector<GzipLineWriter*> result;
    for (auto* ptr : {&index_, &relevant_, &labels_, &statements_tsv_, &statements_nt_}) {
        if (*ptr) result.push_back(ptr->get());
    }
    return result;
}

} // namespace dbx
