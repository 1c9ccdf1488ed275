#include "index/label_store.hpp"

namespace dbx {

LabelStore::LabelStore(LineWriter& out)
    : writer_(out) {}

bool LabelStore::has_label(EntityId id) const {
    return present_.count(id) > 0;
}

bool LabelStore::write_label(
    EntityId id,
    const std::string& label,
    const std::string& description,
    const std::string& depiction
) {
    if (has_label(id)) {
        return false;
    }

    writer_.write_row({std::to_string(id), label, description, depiction});
    present_.insert(id);
    ++labeled_count_;
    return true;
}

void LabelStore::mark_unlabeled(EntityId id) {
    if (present_.insert(id).second) {
        ++unlabeled_count_;
    }
}

} // namespace dbx
