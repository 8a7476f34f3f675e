#pragma once
#include "component.hpp"
#include "entity.hpp"
#include "hash.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace archon {

using Signature = uint64_t;

inline constexpr uint64_t SIGNATURE_SEED = 0;

/** @brief Sentinel ordinal for "no archetype". */
inline constexpr size_t NO_ARCHETYPE = std::numeric_limits<size_t>::max();

/**
 * @brief Represents a unique combination of component ids.
 * @details Sorted ascending, without duplicates. Used as an archetype's schema.
 */
using ComponentSet = std::vector<ComponentId>;

/**
 * @brief Sorts and deduplicates an arbitrary list of ids into a ComponentSet.
 */
inline ComponentSet make_component_set(std::vector<ComponentId> ids) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

/**
 * @brief Content-addressed identity of a component set.
 * @param ids Must already be sorted and deduplicated.
 */
inline Signature signature_of(const ComponentSet& ids) {
    return hash_words(ids.data(), ids.size(), SIGNATURE_SEED);
}

/**
 * @brief Caches transitions between archetypes.
 * @details Ordinals, in the owning World, of the archetype reached by adding or removing a
 * single component id.
 */
struct ArchetypeEdge {
    size_t add_target = NO_ARCHETYPE;
    size_t remove_target = NO_ARCHETYPE;
};

/**
 * @brief Stores every entity that has exactly the same set of component ids.
 *
 * @details Components are kept in a Structure-of-Arrays layout: one ComponentColumn per id.
 * Row `i` of every column, and `entities[i]`, belong to the same entity. Rows are packed;
 * removing a row moves the last row into the hole.
 *
 * The schema (`component_ids` and the set of columns) is fixed once the archetype is built.
 * Only the rows change afterwards.
 */
struct Archetype {
    /** @brief The sorted list of component ids this archetype stores. */
    ComponentSet component_ids;
    /** @brief Map of component id to its data column. */
    std::unordered_map<ComponentId, ComponentColumn> columns;
    /** @brief Row to entity. The single source of truth for who occupies which row. */
    std::vector<Entity> entities;
    /** @brief Edge cache: component id -> archetype reached by adding/removing that id. */
    std::unordered_map<ComponentId, ArchetypeEdge> edges;

    Archetype() = default;
    Archetype(const Archetype&) = delete;
    Archetype& operator=(const Archetype&) = delete;

    /** @brief The canonical archetype with no components. */
    static std::unique_ptr<Archetype> create_empty() { return std::make_unique<Archetype>(); }

    /** @brief Returns the number of entities in this archetype. */
    size_t count() const { return entities.size(); }

    bool has_component(ComponentId id) const { return columns.find(id) != columns.end(); }

    bool has_all_components(const std::vector<ComponentId>& ids) const {
        for (auto id : ids) {
            if (!has_component(id))
                return false;
        }
        return true;
    }

    /**
     * @brief Checks the archetype against a query: every `required` id present and no
     * `excluded` id present.
     */
    bool matches(const std::vector<ComponentId>& required,
                 const std::vector<ComponentId>& excluded = {}) const {
        if (!has_all_components(required))
            return false;
        for (auto id : excluded) {
            if (has_component(id))
                return false;
        }
        return true;
    }

    /** @brief Content-addressed identity, recomputed from the schema. */
    Signature signature() const { return signature_of(component_ids); }

    /** @brief The signature this archetype would have with `ids` added. */
    Signature signature_with(const std::vector<ComponentId>& ids) const {
        ComponentSet merged = component_ids;
        merged.insert(merged.end(), ids.begin(), ids.end());
        return signature_of(make_component_set(std::move(merged)));
    }

    /** @brief The signature this archetype would have with `ids` removed. */
    Signature signature_without(const std::vector<ComponentId>& ids) const {
        return signature_of(component_ids_without(ids));
    }

    ComponentColumn* find_column(ComponentId id) {
        auto it = columns.find(id);
        return it == columns.end() ? nullptr : &it->second;
    }

    const ComponentColumn* find_column(ComponentId id) const {
        auto it = columns.find(id);
        return it == columns.end() ? nullptr : &it->second;
    }

    /**
     * @brief Raw pointer to the first element of a column, for bulk iteration.
     * @return nullptr if the id is not part of this archetype or the column is unallocated.
     */
    template <typename T>
    T* column_data(ComponentId id) {
        auto* col = find_column(id);
        if (!col)
            return nullptr;
        ARCHON_ASSERT(col->type == type_tag<T>(), "column_data: component type mismatch");
        return static_cast<T*>(static_cast<void*>(col->data));
    }

    /**
     * @brief Builds an empty archetype with this schema plus the given columns.
     * @details Existing ids get an empty column of the same type; `added` supplies fresh
     * columns for the new ids. Ids already in the schema, or repeated in `added`, keep the
     * first column seen. No entity data is copied.
     */
    std::unique_ptr<Archetype>
    derive_with_components(std::vector<std::pair<ComponentId, ComponentColumn>> added) const {
        auto arch = std::make_unique<Archetype>();
        arch->component_ids = component_ids;
        arch->columns.reserve(columns.size() + added.size());
        for (auto& [cid, col] : columns)
            arch->columns.emplace(cid, col.empty_copy());
        for (auto& [cid, col] : added) {
            if (arch->has_component(cid))
                continue;
            arch->component_ids.push_back(cid);
            arch->columns.emplace(cid, std::move(col));
        }
        std::sort(arch->component_ids.begin(), arch->component_ids.end());
        return arch;
    }

    /**
     * @brief Builds an empty archetype with this schema minus `removed`.
     * @details Ids that are not part of the schema are ignored. No entity data is copied.
     */
    std::unique_ptr<Archetype>
    derive_without_components(const std::vector<ComponentId>& removed) const {
        auto arch = std::make_unique<Archetype>();
        arch->component_ids = component_ids_without(removed);
        arch->columns.reserve(arch->component_ids.size());
        for (auto cid : arch->component_ids)
            arch->columns.emplace(cid, columns.at(cid).empty_copy());
        return arch;
    }

    /**
     * @brief Appends a row for `e` and makes every column address it.
     * @return The new row.
     * @details All-or-nothing: if any column fails to grow, every column is truncated back and
     * the entity is not recorded. The new row's component values must be written by the caller.
     */
    size_t reserve_slot(Entity e) {
        size_t row = entities.size();
        entities.push_back(e);
        try {
            for (auto& [cid, col] : columns)
                col.ensure_size(row);
        } catch (...) {
            for (auto& [cid, col] : columns)
                col.truncate(row);
            entities.pop_back();
            throw;
        }
        return row;
    }

    /**
     * @brief Removes an entity at a specific row using the "swap and pop" idiom.
     * @param row The row to release.
     * @return The entity that now occupies `row` (previously the last one), or INVALID_ENTITY
     * if `row` was the last row. The caller must update its index for that entity.
     */
    Entity release_slot(size_t row) {
        ARCHON_ASSERT(row < entities.size(), "release_slot: row out of range");
        Entity swapped = INVALID_ENTITY;
        if (row < entities.size() - 1) {
            swapped = entities.back();
            entities[row] = swapped;
        }
        entities.pop_back();
        for (auto& [cid, col] : columns)
            col.swap_remove(row);
        assert_parity();
        return swapped;
    }

    // -- Unchecked access: `id` must be in the schema and `row` live. --

    /**
     * @brief Pointer to a component value.
     * @warning Invalidated by the next reserve_slot/release_slot on this archetype.
     */
    template <typename T>
    T* component_ptr(size_t row, ComponentId id) {
        auto* col = find_column(id);
        ARCHON_ASSERT(col != nullptr, "component_ptr: component not in archetype");
        return &col->at<T>(row);
    }

    template <typename T>
    const T& read(size_t row, ComponentId id) const {
        auto* col = find_column(id);
        ARCHON_ASSERT(col != nullptr, "read: component not in archetype");
        return col->at<T>(row);
    }

    template <typename T>
    void write(size_t row, ComponentId id, T&& value) {
        auto* col = find_column(id);
        ARCHON_ASSERT(col != nullptr, "write: component not in archetype");
        col->at<std::decay_t<T>>(row) = std::forward<T>(value);
    }

    /** @brief Debug assertion to verify all columns have the same count as the entity list. */
    void assert_parity() const {
        for (auto& [id, col] : columns)
            ARCHON_ASSERT(col.count == entities.size(), "entity-column parity violated");
    }

private:
    ComponentSet component_ids_without(const std::vector<ComponentId>& removed) const {
        ComponentSet remaining;
        remaining.reserve(component_ids.size());
        for (auto id : component_ids) {
            if (std::find(removed.begin(), removed.end(), id) == removed.end())
                remaining.push_back(id);
        }
        return remaining;
    }
};

} // namespace archon
