// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_object_store.hpp
 * @brief Slot arena owning every heap object.
 *
 * Objects live in index-stable slots recycled through a free list. Each
 * slot carries a generation counter so a handle to a freed object is
 * detected instead of silently reaching the slot's next occupant. The
 * store also owns the string intern set and the mark-and-sweep collector.
 */

#pragma once

#include "lx_core.hpp"
#include "lx_table.hpp"
#include "lx_value.hpp"
#include <memory>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace loxvm {

class StringObject;

class ObjectStore {
public:
    ObjectStore() = default;
    ~ObjectStore();

    // Prevent copying
    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;

    // Object lifecycle
    template<typename T, typename... Args>
    ObjRef allocate(Args&&... args) {
        return adopt(std::make_unique<T>(std::forward<Args>(args)...));
    }

    ObjRef adopt(std::unique_ptr<Object> object);
    void free(ObjRef ref);

    bool contains(ObjRef ref) const;
    Object* get(ObjRef ref);
    const Object* get(ObjRef ref) const;

    template<typename T>
    bool is(ObjRef ref) const {
        return get(ref)->type == T::kType;
    }

    template<typename T>
    bool is(Value value) const {
        return value.is_object() && is<T>(value.as_object());
    }

    template<typename T>
    T& as(ObjRef ref) {
        Object* obj = get(ref);
        if (obj->type != T::kType) {
            throw std::logic_error(std::string("Object is not a ") + object_type_name(T::kType));
        }
        return static_cast<T&>(*obj);
    }

    template<typename T>
    const T& as(ObjRef ref) const {
        const Object* obj = get(ref);
        if (obj->type != T::kType) {
            throw std::logic_error(std::string("Object is not a ") + object_type_name(T::kType));
        }
        return static_cast<const T&>(*obj);
    }

    // Strings
    ObjRef intern(std::string_view chars);
    TableKey key_of(ObjRef string) const;
    static uint32_t hash_string(std::string_view chars);

    // Garbage collection. The caller marks its roots, then calls collect()
    // which traces, drops unreachable interned strings and sweeps.
    void mark_object(ObjRef ref);
    void mark_value(Value value);
    size_t collect();

    size_t live_count() const { return stats_.current_objects; }
    size_t slot_count() const { return slots_.size(); }
    const MemoryStats& stats() const { return stats_; }

private:
    struct Slot {
        std::unique_ptr<Object> object;
        uint32_t generation{0};
    };

    std::vector<Slot> slots_;
    std::vector<uint32_t> free_slots_;
    Table strings_;
    std::vector<ObjRef> gray_;
    MemoryStats stats_;

    void release_slot(uint32_t index);
};

} // namespace loxvm
