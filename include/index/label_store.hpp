#pragma once

#include "index/entity_index.hpp"
#include "io/line_writer.hpp"
#include "io/tsv_writer.hpp"
#include <string>
#include <unordered_set>

namespace dbx {

/**
 * @brief Human-readable description of an entity as stored in the graph
 */
struct LabelRecord {
    std::string label;
    std::string description;
    std::string depiction;      ///< URL of an image, may be empty
};

/**
 * @brief Writes at most one label row `(id, label, description, depiction)`
 * per entity
 *
 * Which entities are done is tracked in memory for the current run only; a
 * label table left by an earlier run is never read.
 */
class LabelStore {
public:
    explicit LabelStore(LineWriter& out);

    /**
     * @brief Whether the entity was already labeled or marked unlabeled
     */
    bool has_label(EntityId id) const;

    /**
     * @brief Write the label row for an entity unless one exists
     *
     * @return true if a row was written, false if the call was ignored
     */
    bool write_label(
        EntityId id,
        const std::string& label,
        const std::string& description,
        const std::string& depiction
    );

    /**
     * @brief Record that no label exists for an entity, so it is not
     * looked up again; writes nothing
     */
    void mark_unlabeled(EntityId id);

    size_t labeled_count() const { return labeled_count_; }
    size_t unlabeled_count() const { return unlabeled_count_; }

private:
    TsvWriter writer_;
    std::unordered_set<EntityId> present_;
    size_t labeled_count_ = 0;
    size_t unlabeled_count_ = 0;
};

} // namespace dbx
