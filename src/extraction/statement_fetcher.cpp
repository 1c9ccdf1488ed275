#include "extraction/statement_fetcher.hpp"
#include <stdexcept>

namespace dbx {

Statement statement_from_record(const Record& record) {
    Statement statement;
    statement.subject = record.require("subj");
    statement.predicate = record.require("pred");
    statement.object = record.require("obj");
    return statement;
}

// ============================================================================
// PagedStatementFetcher
// ============================================================================

PagedStatementFetcher::PagedStatementFetcher(
    QuerySession& session,
    std::string query,
    size_t page_size
) : session_(session), query_(std::move(query)), page_size_(page_size) {
    if (page_size_ == 0) {
        throw std::invalid_argument("page size must be positive");
    }
}

bool PagedStatementFetcher::open_page() {
    QueryParameters parameters = {
        {"skip", skip_},
        {"limit", page_size_}
    };

    auto result = session_.run(query_, parameters);
    ++queries_issued_;

    if (result->peek() == nullptr) {
        return false;
    }

    ++pages_fetched_;
    page_ = std::move(result);
    return true;
}

bool PagedStatementFetcher::next(Statement& statement) {
    while (!exhausted_) {
        if (!page_ && !open_page()) {
            exhausted_ = true;
            break;
        }

        if (page_->next(record_)) {
            statement = statement_from_record(record_);
            return true;
        }

        // Page drained, move the cursor
        page_.reset();
        skip_ += page_size_;
    }
    return false;
}

// ============================================================================
// SingleQueryStatementFetcher
// ============================================================================

SingleQueryStatementFetcher::SingleQueryStatementFetcher(
    QuerySession& session,
    std::string query
) : session_(session), query_(std::move(query)) {}

bool SingleQueryStatementFetcher::next(Statement& statement) {
    if (!result_) {
        result_ = session_.run(query_);
        if (result_->peek() != nullptr) {
            pages_fetched_ = 1;
        }
    }

    if (!result_->next(record_)) {
        return false;
    }
    statement = statement_from_record(record_);
    return true;
}

} // namespace dbx
