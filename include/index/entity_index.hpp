#pragma once

#include "io/line_writer.hpp"
#include "io/tsv_writer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace dbx {

/**
 * @brief Dense integer identifier of an entity, assigned from 0 in order of
 * first appearance
 */
using EntityId = std::uint64_t;

/**
 * @brief Assigns stable sequential ids to entity URIs and persists them
 *
 * The index is the only writer of the index table `(id, uri)` and of the
 * relevant-entities table `(id)`. A URI is written exactly once, when it is
 * first resolved; whether it counts as relevant is decided by that first
 * call alone.
 */
class EntityIndex {
public:
    /**
     * @brief Constructor
     *
     * @param index_out Receives one `(id, uri)` row per new entity
     * @param relevant_out Receives one `(id)` row per new relevant entity
     */
    EntityIndex(LineWriter& index_out, LineWriter& relevant_out);

    /**
     * @brief Get the id of a URI, assigning the next free id if it is new
     *
     * @param uri Entity URI
     * @param relevant Whether the entity occurs as subject or object; only
     *        taken into account when the URI is new
     * @return Id of the entity
     * @throws OutputError if a row cannot be written
     */
    EntityId resolve(const std::string& uri, bool relevant);

    /**
     * @brief Look up a URI without assigning an id
     *
     * @return The id, or std::nullopt if the URI was never resolved
     */
    std::optional<EntityId> find(const std::string& uri) const;

    /**
     * @brief Number of distinct entities indexed so far
     */
    size_t size() const { return ids_.size(); }

    /**
     * @brief Number of entities written to the relevant-entities table
     */
    size_t relevant_count() const { return relevant_count_; }

private:
    TsvWriter index_writer_;
    TsvWriter relevant_writer_;
    std::unordered_map<std::string, EntityId> ids_;
    size_t relevant_count_ = 0;
};

} // namespace dbx
