// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_table.hpp
 * @brief Open-addressing hash table keyed by interned strings.
 *
 * Linear probing over a power-of-two array with tombstone deletion. Keys
 * are string handles compared by identity; the string's hash travels with
 * the key so lookups never touch the object store. Used for globals,
 * class method tables, instance fields and the string intern set.
 */

#pragma once

#include "lx_value.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace loxvm {

struct TableKey {
    ObjRef ref;
    uint32_t hash{0};
};

class Table {
public:
    static constexpr double kMaxLoad = 0.75;
    static constexpr size_t kInitialCapacity = 8;

    // An empty slot has a null key and a nil value; a tombstone has a null
    // key and the value true.
    struct Entry {
        ObjRef key;
        uint32_t hash{0};
        Value value;

        bool is_tombstone() const { return key.is_null() && !value.is_nil(); }
    };

    // Returns true when the key was not present before.
    bool set(const TableKey& key, Value value);
    std::optional<Value> get(const TableKey& key) const;
    bool remove(const TableKey& key);
    void add_all(const Table& from);

    // Content lookup used by interning; returns a null handle if absent.
    ObjRef find_string(const ObjectStore& store, std::string_view chars, uint32_t hash) const;

    // Tombstones count towards the load factor until the next resize.
    size_t count() const { return count_; }
    size_t capacity() const { return entries_.size(); }

    // Garbage collection support.
    void mark(ObjectStore& store) const;
    void remove_unmarked(const ObjectStore& store);

private:
    size_t count_{0};
    std::vector<Entry> entries_;

    static size_t find_slot(const std::vector<Entry>& entries, const TableKey& key);
    void adjust_capacity(size_t capacity);
};

} // namespace loxvm
