#pragma once
#include "archetype.hpp"
#include "component.hpp"
#include "entity.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace archon {

/** @brief Ordinal of the canonical empty archetype in every World. */
inline constexpr size_t EMPTY_ARCHETYPE = 0;

/**
 * @brief Internal tracking structure for an entity's location.
 * @details Maps an Entity to the ordinal of its Archetype and the row where its data resides.
 * The row changes whenever another entity is removed from the same archetype.
 */
struct EntityRecord {
    size_t archetype = NO_ARCHETYPE;
    size_t row = 0;
};

/**
 * @brief Owns entities, their component data and every archetype they are grouped into.
 *
 * @details The World is responsible for:
 * - Creating and destroying entities.
 * - Routing each entity to the archetype matching its exact component set, creating
 *   archetypes lazily the first time a set is seen.
 * - Migrating entity data between archetypes when components are added or removed.
 * - Keeping every entity's record (archetype, row) current across swap-removes.
 *
 * Failure reporting:
 * - Allocation failure throws std::bad_alloc; the World is left as it was before the call.
 * - Unknown entities and absent components are reported through the return value
 *   (`false`, `nullptr`, `std::nullopt`, INVALID_ENTITY).
 * - `get` is the unchecked tier and only asserts.
 *
 * It is not thread-safe for write operations.
 */
class World {
public:
    /**
     * @brief Constructs a new World holding only the empty archetype.
     */
    World() {
        auto empty = Archetype::create_empty();
        Signature sig = empty->signature();
        archetypes_.push_back(std::move(empty));
        archetype_index_.emplace(sig, EMPTY_ARCHETYPE);
    }

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    /** @brief Canonical component id for a name. Does not depend on any World state. */
    static constexpr ComponentId component_id(std::string_view name) {
        return archon::component_id(name);
    }

    // -- Entity creation --

    /**
     * @brief Creates a new Entity with no components.
     * @details The entity is placed in the empty archetype. If recording it fails, the
     * reserved row is released and the identity is not consumed.
     */
    Entity create() {
        Entity e{next_id_};
        Archetype& arch = *archetypes_[EMPTY_ARCHETYPE];
        size_t row = arch.reserve_slot(e);
        try {
            records_.emplace(e, EntityRecord{EMPTY_ARCHETYPE, row});
        } catch (...) {
            arch.release_slot(row);
            throw;
        }
        ++next_id_;
        return e;
    }

    /**
     * @brief Creates a new Entity initialized with a set of components.
     * @details Either the entity is created with every component, or nothing is created.
     */
    template <typename... Ts>
    Entity create_with(With<Ts>... components) {
        Entity e = create();
        try {
            add_components(e, std::move(components)...);
        } catch (...) {
            destroy(e);
            throw;
        }
        return e;
    }

    /**
     * @brief Creates a new entity in the same archetype as `e`, copying every component.
     * @return The copy, or INVALID_ENTITY if `e` is not alive or any of its component types
     * is not copy-assignable.
     */
    Entity clone(Entity e) {
        auto it = records_.find(e);
        if (it == records_.end())
            return INVALID_ENTITY;
        size_t ordinal = it->second.archetype;
        size_t src_row = it->second.row;

        Archetype& arch = *archetypes_[ordinal];
        for (auto& [cid, col] : arch.columns) {
            if (!col.copyable())
                return INVALID_ENTITY;
        }
        Entity copy{next_id_};
        size_t row = arch.reserve_slot(copy);
        try {
            for (auto& [cid, col] : arch.columns)
                ComponentColumn::copy_element(col, src_row, col, row);
            records_.emplace(copy, EntityRecord{ordinal, row});
        } catch (...) {
            arch.release_slot(row);
            throw;
        }
        ++next_id_;
        return copy;
    }

    // -- Entity destruction --

    /**
     * @brief Destroys an entity and releases its components.
     * @return false if the entity is not alive.
     * @details The row is released first (the entity swapped into it gets its record fixed),
     * then the record is erased.
     */
    bool destroy(Entity e) {
        auto it = records_.find(e);
        if (it == records_.end())
            return false;
        EntityRecord rec = it->second;
        Entity swapped = archetypes_[rec.archetype]->release_slot(rec.row);
        if (swapped != INVALID_ENTITY)
            record_ref(swapped).row = rec.row;
        records_.erase(it);
        return true;
    }

    /**
     * @brief Checks if an entity handle refers to a living entity.
     */
    bool alive(Entity e) const { return records_.find(e) != records_.end(); }

    /**
     * @brief Returns the total number of living entities in the world.
     */
    size_t count() const { return records_.size(); }

    /**
     * @brief The current location of an entity.
     * @return nullptr if the entity is not alive. Invalidated by any structural change.
     */
    const EntityRecord* record(Entity e) const {
        auto it = records_.find(e);
        return it == records_.end() ? nullptr : &it->second;
    }

    // -- Add components (archetype migration) --

    /**
     * @brief Adds components to an entity, or overwrites the ones it already has.
     * @return false if the entity is not alive.
     * @details Ids not yet on the entity move it to the archetype with those ids added; its
     * existing values are carried over first, then every value of this call is written, so
     * the values passed here always win.
     */
    template <typename... Ts>
    bool add_components(Entity e, With<Ts>... components) {
        auto it = records_.find(e);
        if (it == records_.end())
            return false;
        EntityRecord& rec = it->second;

        std::vector<ComponentId> new_ids;
        {
            const Archetype& src = *archetypes_[rec.archetype];
            auto collect = [&](ComponentId id) {
                if (!src.has_component(id) &&
                    std::find(new_ids.begin(), new_ids.end(), id) == new_ids.end())
                    new_ids.push_back(id);
            };
            (collect(components.id), ...);
        }

        if (!new_ids.empty()) {
            size_t target = find_add_target(rec.archetype, new_ids, [&] {
                std::vector<std::pair<ComponentId, ComponentColumn>> added;
                added.reserve(new_ids.size());
                (append_new_column<Ts>(components.id, new_ids, added), ...);
                return added;
            });
            migrate(e, rec, target);
        }

        Archetype& arch = *archetypes_[rec.archetype];
        (arch.write(rec.row, components.id, std::move(components.value)), ...);
        return true;
    }

    template <typename T>
    bool add_component(Entity e, ComponentId id, T&& value) {
        return add_components(e, with(id, std::forward<T>(value)));
    }

    // -- Set components (no migration) --

    /**
     * @brief Overwrites components the entity already has.
     * @return false, without writing anything, if the entity is not alive or any id is
     * missing from its archetype. Never migrates.
     */
    template <typename... Ts>
    bool set_components(Entity e, With<Ts>... components) {
        auto it = records_.find(e);
        if (it == records_.end())
            return false;
        Archetype& arch = *archetypes_[it->second.archetype];
        if (!(arch.has_component(components.id) && ...))
            return false;
        size_t row = it->second.row;
        (arch.write(row, components.id, std::move(components.value)), ...);
        return true;
    }

    template <typename T>
    bool set_component(Entity e, ComponentId id, T&& value) {
        return set_components(e, with(id, std::forward<T>(value)));
    }

    // -- Remove components (archetype migration) --

    /**
     * @brief Removes components from an entity.
     * @return false if the entity is not alive.
     * @details Ids the entity does not have are ignored. Removing every component moves the
     * entity back to the empty archetype.
     */
    bool remove_components(Entity e, const std::vector<ComponentId>& ids) {
        auto it = records_.find(e);
        if (it == records_.end())
            return false;
        EntityRecord& rec = it->second;

        std::vector<ComponentId> removed;
        const Archetype& src = *archetypes_[rec.archetype];
        for (auto id : ids) {
            if (src.has_component(id) &&
                std::find(removed.begin(), removed.end(), id) == removed.end())
                removed.push_back(id);
        }
        if (removed.empty())
            return true;

        size_t target = find_remove_target(rec.archetype, removed);
        migrate(e, rec, target);
        return true;
    }

    bool remove_component(Entity e, ComponentId id) { return remove_components(e, {id}); }

    // -- Component access --

    /**
     * @brief Checks if an entity has a specific component.
     * @return true if the entity exists and has the component.
     */
    bool has(Entity e, ComponentId id) const {
        auto* rec = record(e);
        return rec && archetypes_[rec->archetype]->has_component(id);
    }

    /**
     * @brief Retrieves a reference to an entity's component.
     * @warning Unchecked tier: asserts if the entity is dead, the component is missing or T is
     * not the stored type. The reference is invalidated by the next structural change.
     */
    template <typename T>
    T& get(Entity e, ComponentId id) {
        auto it = records_.find(e);
        ARCHON_ASSERT(it != records_.end(), "get on dead entity");
        Archetype& arch = *archetypes_[it->second.archetype];
        ARCHON_ASSERT(arch.has_component(id), "get on entity missing component");
        return *arch.component_ptr<T>(it->second.row, id);
    }

    /**
     * @brief Tries to retrieve a pointer to an entity's component.
     * @return Pointer to the component, or nullptr if missing/dead.
     */
    template <typename T>
    T* try_get(Entity e, ComponentId id) {
        if (!has(e, id))
            return nullptr;
        return &get<T>(e, id);
    }

    template <typename T>
    const T* try_get(Entity e, ComponentId id) const {
        auto* rec = record(e);
        if (!rec || !archetypes_[rec->archetype]->has_component(id))
            return nullptr;
        return &archetypes_[rec->archetype]->read<T>(rec->row, id);
    }

    /**
     * @brief Copy of an entity's component.
     * @return std::nullopt if the entity is dead or does not have the component.
     */
    template <typename T>
    std::optional<T> get_component(Entity e, ComponentId id) const {
        const T* ptr = try_get<T>(e, id);
        if (!ptr)
            return std::nullopt;
        return *ptr;
    }

    // -- Archetype enumeration --

    size_t archetype_count() const { return archetypes_.size(); }

    Archetype& archetype(size_t ordinal) {
        ARCHON_ASSERT(ordinal < archetypes_.size(), "archetype ordinal out of range");
        return *archetypes_[ordinal];
    }

    const Archetype& archetype(size_t ordinal) const {
        ARCHON_ASSERT(ordinal < archetypes_.size(), "archetype ordinal out of range");
        return *archetypes_[ordinal];
    }

    const Archetype& empty_archetype() const { return *archetypes_[EMPTY_ARCHETYPE]; }

    /** @return Ordinal of the archetype with this signature, or NO_ARCHETYPE. */
    size_t find_archetype(Signature sig) const {
        auto it = archetype_index_.find(sig);
        return it == archetype_index_.end() ? NO_ARCHETYPE : it->second;
    }

    /** @return Ordinal of the entity's archetype, or NO_ARCHETYPE if it is not alive. */
    size_t archetype_of(Entity e) const {
        auto* rec = record(e);
        return rec ? rec->archetype : NO_ARCHETYPE;
    }

    /**
     * @brief Invokes `fn(Archetype&)` for every archetype, in creation order.
     * @warning `fn` must not add, remove or destroy entities.
     */
    template <typename Func>
    void for_each_archetype(Func&& fn) {
        for (auto& arch : archetypes_)
            fn(*arch);
    }

    template <typename Func>
    void for_each_archetype(Func&& fn) const {
        for (auto& arch : archetypes_)
            fn(static_cast<const Archetype&>(*arch));
    }

private:
    std::vector<std::unique_ptr<Archetype>> archetypes_;
    std::unordered_map<Signature, size_t> archetype_index_;
    std::unordered_map<Entity, EntityRecord, EntityHash> records_;
    uint64_t next_id_ = 1;

    EntityRecord& record_ref(Entity e) {
        auto it = records_.find(e);
        ARCHON_ASSERT(it != records_.end(), "entity record missing");
        return it->second;
    }

    template <typename T>
    static void append_new_column(ComponentId id, const std::vector<ComponentId>& new_ids,
                                  std::vector<std::pair<ComponentId, ComponentColumn>>& added) {
        if (std::find(new_ids.begin(), new_ids.end(), id) == new_ids.end())
            return;
        for (auto& entry : added) {
            if (entry.first == id)
                return;
        }
        added.emplace_back(id, make_column<T>());
    }

    // Takes ownership of a freshly derived archetype. Either both the ordinal list and the
    // signature index hold it, or neither does.
    size_t register_archetype(Signature sig, std::unique_ptr<Archetype> arch) {
        ARCHON_ASSERT(arch->signature() == sig, "derived archetype signature mismatch");
        size_t ordinal = archetypes_.size();
        archetypes_.push_back(std::move(arch));
        try {
            archetype_index_.emplace(sig, ordinal);
        } catch (...) {
            archetypes_.pop_back();
            throw;
        }
        return ordinal;
    }

    template <typename BuildColumns>
    size_t find_add_target(size_t src_ordinal, const std::vector<ComponentId>& new_ids,
                           BuildColumns&& build_columns) {
        Archetype& src = *archetypes_[src_ordinal];
        if (new_ids.size() == 1) {
            auto edge = src.edges.find(new_ids[0]);
            if (edge != src.edges.end() && edge->second.add_target != NO_ARCHETYPE)
                return edge->second.add_target;
        }

        Signature sig = src.signature_with(new_ids);
        size_t target = find_archetype(sig);
        if (target == NO_ARCHETYPE)
            target = register_archetype(sig, src.derive_with_components(build_columns()));

        if (new_ids.size() == 1)
            link(src_ordinal, target, new_ids[0]);
        return target;
    }

    size_t find_remove_target(size_t src_ordinal, const std::vector<ComponentId>& removed) {
        Archetype& src = *archetypes_[src_ordinal];
        if (removed.size() == 1) {
            auto edge = src.edges.find(removed[0]);
            if (edge != src.edges.end() && edge->second.remove_target != NO_ARCHETYPE)
                return edge->second.remove_target;
        }

        Signature sig = src.signature_without(removed);
        size_t target = find_archetype(sig);
        if (target == NO_ARCHETYPE)
            target = register_archetype(sig, src.derive_without_components(removed));

        if (removed.size() == 1)
            link(target, src_ordinal, removed[0]);
        return target;
    }

    // Records that adding `cid` to `without` reaches `with_cid`, and removing it goes back.
    void link(size_t without, size_t with_cid, ComponentId cid) {
        archetypes_[without]->edges[cid].add_target = with_cid;
        archetypes_[with_cid]->edges[cid].remove_target = without;
    }

    // Moves `e` from its current archetype/row to a new row of `target`, carrying every column
    // both archetypes share. Columns only `target` has are left default-initialised for the
    // caller to write. Only reserving the new row can fail; if it does, `e` stays where it was.
    void migrate(Entity e, EntityRecord& rec, size_t target) {
        ARCHON_ASSERT(target != rec.archetype, "migration to the same archetype");
        Archetype& src = *archetypes_[rec.archetype];
        Archetype& dst = *archetypes_[target];

        size_t new_row = dst.reserve_slot(e);
        for (auto& [cid, dst_col] : dst.columns) {
            if (auto* src_col = src.find_column(cid))
                ComponentColumn::move_element(*src_col, rec.row, dst_col, new_row);
        }
        dst.assert_parity();

        size_t old_row = rec.row;
        Entity swapped = src.release_slot(old_row);
        if (swapped != INVALID_ENTITY)
            record_ref(swapped).row = old_row;

        rec.archetype = target;
        rec.row = new_row;
    }
};

} // namespace archon
