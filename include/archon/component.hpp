#pragma once
#include "hash.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <new>
#include <string_view>
#include <type_traits>
#include <utility>

#ifndef ARCHON_ASSERT
#define ARCHON_ASSERT(expr, msg) assert((expr) && (msg))
#endif

namespace archon {

using ComponentId = uint64_t;

inline constexpr uint64_t COMPONENT_ID_SEED = 0;

/**
 * @brief Canonical component id for a name.
 * @details Pure function of the name: identical names always map to the same id, in every
 * World and every process. Collisions between distinct names are not detected.
 */
constexpr ComponentId component_id(std::string_view name) {
    return hash_bytes(name, COMPONENT_ID_SEED);
}

/**
 * @brief Per-type tag used to check column element types in debug builds.
 */
using TypeTag = const void*;

template <typename T>
TypeTag type_tag() {
    static const char tag = 0;
    return &tag;
}

/**
 * @brief A component value paired with the id it is stored under.
 * @details Built with `with(id, value)` and passed to the World's add/set calls.
 */
template <typename T>
struct With {
    ComponentId id;
    T value;
};

template <typename T>
With<std::decay_t<T>> with(ComponentId id, T&& value) {
    return {id, std::forward<T>(value)};
}

// Type-erased column storage for a single component type within an archetype.
// Slots [0, count) hold constructed objects; [count, capacity) is raw memory.
struct ComponentColumn {
    static constexpr size_t MIN_CAPACITY = 16;

    uint8_t* data = nullptr;
    size_t elem_size = 0;
    size_t alignment = 1;
    size_t count = 0;
    size_t capacity = 0;
    TypeTag type = nullptr;

    using ConstructFunc = void (*)(void* ptr);
    using MoveFunc = void (*)(void* dst, void* src);
    using DestroyFunc = void (*)(void* ptr);
    using TransferFunc = void (*)(void* dst, void* src);
    using CopyFunc = void (*)(void* dst, const void* src);
    using FactoryFunc = ComponentColumn (*)();

    ConstructFunc construct_fn = nullptr;
    MoveFunc move_fn = nullptr;
    DestroyFunc destroy_fn = nullptr;
    TransferFunc transfer_fn = nullptr;
    CopyFunc copy_fn = nullptr;
    FactoryFunc factory_fn = nullptr;

    ComponentColumn() = default;

    ComponentColumn(ComponentColumn&& o) noexcept
        : data(o.data),
          elem_size(o.elem_size),
          alignment(o.alignment),
          count(o.count),
          capacity(o.capacity),
          type(o.type),
          construct_fn(o.construct_fn),
          move_fn(o.move_fn),
          destroy_fn(o.destroy_fn),
          transfer_fn(o.transfer_fn),
          copy_fn(o.copy_fn),
          factory_fn(o.factory_fn) {
        o.data = nullptr;
        o.count = 0;
        o.capacity = 0;
    }

    ComponentColumn& operator=(ComponentColumn&& o) noexcept {
        if (this != &o) {
            release();
            data = o.data;
            elem_size = o.elem_size;
            alignment = o.alignment;
            count = o.count;
            capacity = o.capacity;
            type = o.type;
            construct_fn = o.construct_fn;
            move_fn = o.move_fn;
            destroy_fn = o.destroy_fn;
            transfer_fn = o.transfer_fn;
            copy_fn = o.copy_fn;
            factory_fn = o.factory_fn;
            o.data = nullptr;
            o.count = 0;
            o.capacity = 0;
        }
        return *this;
    }

    ~ComponentColumn() { release(); }

    ComponentColumn(const ComponentColumn&) = delete;
    ComponentColumn& operator=(const ComponentColumn&) = delete;

    void* get(size_t row) { return data + row * elem_size; }
    const void* get(size_t row) const { return data + row * elem_size; }

    /**
     * @brief Grows the column so that `max_row` is addressable.
     * @details New slots are default-initialised: trivial types hold unspecified values and
     * must be written before they are read. Strong guarantee: if allocation or a default
     * constructor throws, the column is left exactly as it was.
     */
    void ensure_size(size_t max_row) {
        size_t needed = max_row + 1;
        if (needed <= count)
            return;
        if (needed > capacity)
            grow(needed);

        size_t row = count;
        try {
            for (; row < needed; ++row)
                construct_fn(get(row));
        } catch (...) {
            while (row > count)
                destroy_fn(get(--row));
            throw;
        }
        count = needed;
    }

    /** @brief Destroys every slot at or past `size`. */
    void truncate(size_t size) {
        while (count > size)
            destroy_fn(get(--count));
    }

    /**
     * @brief Removes `row` by moving the last value into it.
     * @details The caller must account for the entity that was at `count - 1` now living at
     * `row`.
     */
    void swap_remove(size_t row) {
        ARCHON_ASSERT(row < count, "swap_remove: row out of range");
        if (row < count - 1) {
            destroy_fn(get(row));
            move_fn(get(row), get(count - 1));
        } else {
            destroy_fn(get(row));
        }
        --count;
    }

    /** @brief Creates an empty column bound to the same element type. */
    ComponentColumn empty_copy() const { return factory_fn(); }

    /** @brief Whether copy_element can be used on this column. */
    bool copyable() const { return copy_fn != nullptr; }

    /**
     * @brief Copy-assigns one value between two columns of the same element type.
     * @details The element type is only checked in debug builds.
     */
    static void copy_element(const ComponentColumn& src, size_t src_row, ComponentColumn& dst,
                             size_t dst_row) {
        ARCHON_ASSERT(src.type == dst.type, "copy_element: column type mismatch");
        ARCHON_ASSERT(src.copy_fn != nullptr, "copy_element: component type is not copyable");
        ARCHON_ASSERT(src_row < src.count && dst_row < dst.count, "copy_element: row out of range");
        dst.copy_fn(dst.get(dst_row), src.get(src_row));
    }

    /**
     * @brief Transfers one value between two columns of the same element type.
     * @details The destination slot is destroyed and move-constructed from the source, which
     * never throws for a component type. The source is left moved-from and is expected to be
     * released afterwards.
     */
    static void move_element(ComponentColumn& src, size_t src_row, ComponentColumn& dst,
                             size_t dst_row) noexcept {
        ARCHON_ASSERT(src.type == dst.type, "move_element: column type mismatch");
        ARCHON_ASSERT(src_row < src.count && dst_row < dst.count, "move_element: row out of range");
        dst.transfer_fn(dst.get(dst_row), src.get(src_row));
    }

    template <typename T>
    T& at(size_t row) {
        ARCHON_ASSERT(type == type_tag<T>(), "component type mismatch");
        ARCHON_ASSERT(row < count, "row out of range");
        return *static_cast<T*>(get(row));
    }

    template <typename T>
    const T& at(size_t row) const {
        ARCHON_ASSERT(type == type_tag<T>(), "component type mismatch");
        ARCHON_ASSERT(row < count, "row out of range");
        return *static_cast<const T*>(get(row));
    }

private:
    void grow(size_t needed) {
        size_t new_cap = capacity == 0 ? MIN_CAPACITY : capacity * 2;
        if (new_cap < needed)
            new_cap = needed;

        // Throws std::bad_alloc; nothing has been touched yet.
        auto* new_data = static_cast<uint8_t*>(
            ::operator new(new_cap * elem_size, std::align_val_t{alignment}));
        for (size_t i = 0; i < count; ++i)
            move_fn(new_data + i * elem_size, get(i));

        if (data)
            ::operator delete(data, std::align_val_t{alignment});
        data = new_data;
        capacity = new_cap;
    }

    void release() {
        if (data) {
            truncate(0);
            ::operator delete(data, std::align_val_t{alignment});
        }
        data = nullptr;
        count = 0;
        capacity = 0;
    }
};

/**
 * @brief Creates an empty column bound to component type T.
 * @details All type-specific behaviour is captured here, once; every later operation on the
 * column goes through the stored function pointers.
 */
template <typename T>
ComponentColumn make_column() {
    static_assert(std::is_default_constructible_v<T>,
                  "component types must be default-constructible");
    static_assert(std::is_nothrow_move_constructible_v<T>,
                  "component types must be nothrow-move-constructible");
    static_assert(std::is_move_assignable_v<T>, "component types must be move-assignable");

    ComponentColumn col;
    col.elem_size = sizeof(T);
    col.alignment = alignof(T);
    col.type = type_tag<T>();
    col.construct_fn = [](void* ptr) {
        new (ptr) T;
    };
    col.move_fn = [](void* dst, void* src) {
        new (dst) T(std::move(*static_cast<T*>(src)));
        static_cast<T*>(src)->~T();
    };
    col.destroy_fn = [](void* ptr) {
        static_cast<T*>(ptr)->~T();
    };
    // Rebuilds the destination from the source; the source stays constructed (moved-from).
    col.transfer_fn = [](void* dst, void* src) noexcept {
        static_cast<T*>(dst)->~T();
        new (dst) T(std::move(*static_cast<T*>(src)));
    };
    if constexpr (std::is_copy_assignable_v<T>) {
        col.copy_fn = [](void* dst, const void* src) {
            *static_cast<T*>(dst) = *static_cast<const T*>(src);
        };
    }
    col.factory_fn = &make_column<T>;
    return col;
}

} // namespace archon
