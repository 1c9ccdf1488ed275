#include "graph/query_session.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace dbx {

// ============================================================================
// Record
// ============================================================================

Record::Record(
    std::shared_ptr<const std::vector<std::string>> columns,
    std::vector<std::optional<std::string>> values
) : columns_(std::move(columns)), values_(std::move(values)) {
    if (!columns_) {
        columns_ = std::make_shared<const std::vector<std::string>>();
    }
    if (values_.size() != columns_->size()) {
        throw DataContractError(
            "record has " + std::to_string(values_.size()) + " values for " +
            std::to_string(columns_->size()) + " columns"
        );
    }
}

const std::vector<std::string>& Record::columns() const {
    static const std::vector<std::string> no_columns;
    return columns_ ? *columns_ : no_columns;
}

bool Record::has_field(const std::string& name) const {
    const auto& cols = columns();
    return std::find(cols.begin(), cols.end(), name) != cols.end();
}

size_t Record::column_index(const std::string& name) const {
    const auto& cols = columns();
    auto it = std::find(cols.begin(), cols.end(), name);
    if (it == cols.end()) {
        throw DataContractError("result record has no field '" + name + "'");
    }
    return static_cast<size_t>(it - cols.begin());
}

std::optional<std::string> Record::get(const std::string& name) const {
    return values_[column_index(name)];
}

std::string Record::require(const std::string& name) const {
    const auto& value = values_[column_index(name)];
    if (!value) {
        throw DataContractError("result field '" + name + "' is null");
    }
    return *value;
}

// ============================================================================
// BufferedResult
// ============================================================================

const Record* BufferedResult::peek() {
    if (position_ >= records_.size()) return nullptr;
    return &records_[position_];
}

bool BufferedResult::next(Record& record) {
    if (position_ >= records_.size()) return false;
    record = std::move(records_[position_++]);
    return true;
}

} // namespace dbx
