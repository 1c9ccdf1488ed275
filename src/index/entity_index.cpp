#include "index/entity_index.hpp"

namespace dbx {

EntityIndex::EntityIndex(LineWriter& index_out, LineWriter& relevant_out)
    : index_writer_(index_out), relevant_writer_(relevant_out) {}

EntityId EntityIndex::resolve(const std::string& uri, bool relevant) {
    auto it = ids_.find(uri);
    if (it != ids_.end()) {
        return it->second;
    }

    EntityId id = static_cast<EntityId>(ids_.size());
    std::string id_text = std::to_string(id);

    index_writer_.write_row({id_text, uri});
    if (relevant) {
        relevant_writer_.write_row({id_text});
        ++relevant_count_;
    }

    ids_.emplace(uri, id);
    return id;
}

std::optional<EntityId> EntityIndex::find(const std::string& uri) const {
    auto it = ids_.find(uri);
    if (it == ids_.end()) return std::nullopt;
    return it->second;
}

} // namespace dbx
