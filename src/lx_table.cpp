// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_table.cpp
 * @brief Open-addressing hash table implementation.
 */

#include "lx_table.hpp"
#include "lx_object.hpp"
#include "lx_object_store.hpp"

namespace loxvm {

size_t Table::find_slot(const std::vector<Entry>& entries, const TableKey& key) {
    size_t mask = entries.size() - 1;
    size_t index = key.hash & mask;
    std::optional<size_t> tombstone;

    while (true) {
        const Entry& entry = entries[index];
        if (entry.key.is_null()) {
            if (entry.value.is_nil()) {
                // Empty entry; reuse a tombstone passed on the way if any
                return tombstone.value_or(index);
            }
            if (!tombstone) {
                tombstone = index;
            }
        } else if (entry.key == key.ref) {
            return index;
        }
        index = (index + 1) & mask;
    }
}

bool Table::set(const TableKey& key, Value value) {
    if (static_cast<double>(count_ + 1) > static_cast<double>(entries_.size()) * kMaxLoad) {
        adjust_capacity(entries_.empty() ? kInitialCapacity : entries_.size() * 2);
    }

    Entry& entry = entries_[find_slot(entries_, key)];
    bool is_new_key = entry.key.is_null();
    if (is_new_key && entry.value.is_nil()) {
        count_++;
    }

    entry.key = key.ref;
    entry.hash = key.hash;
    entry.value = value;
    return is_new_key;
}

std::optional<Value> Table::get(const TableKey& key) const {
    if (count_ == 0) return std::nullopt;

    const Entry& entry = entries_[find_slot(entries_, key)];
    if (entry.key.is_null()) return std::nullopt;
    return entry.value;
}

bool Table::remove(const TableKey& key) {
    if (count_ == 0) return false;

    Entry& entry = entries_[find_slot(entries_, key)];
    if (entry.key.is_null()) return false;

    entry.key = ObjRef{};
    entry.hash = 0;
    entry.value = Value::from_bool(true);
    return true;
}

void Table::add_all(const Table& from) {
    for (const Entry& entry : from.entries_) {
        if (!entry.key.is_null()) {
            set(TableKey{entry.key, entry.hash}, entry.value);
        }
    }
}

ObjRef Table::find_string(const ObjectStore& store, std::string_view chars, uint32_t hash) const {
    if (count_ == 0) return ObjRef{};

    size_t mask = entries_.size() - 1;
    size_t index = hash & mask;
    while (true) {
        const Entry& entry = entries_[index];
        if (entry.key.is_null()) {
            // Stop at an empty non-tombstone entry
            if (entry.value.is_nil()) return ObjRef{};
        } else if (entry.hash == hash) {
            const auto& string = store.as<StringObject>(entry.key);
            if (string.chars == chars) {
                return entry.key;
            }
        }
        index = (index + 1) & mask;
    }
}

void Table::mark(ObjectStore& store) const {
    for (const Entry& entry : entries_) {
        if (!entry.key.is_null()) {
            store.mark_object(entry.key);
            store.mark_value(entry.value);
        }
    }
}

void Table::remove_unmarked(const ObjectStore& store) {
    for (Entry& entry : entries_) {
        if (!entry.key.is_null() && !store.get(entry.key)->marked) {
            entry.key = ObjRef{};
            entry.hash = 0;
            entry.value = Value::from_bool(true);
        }
    }
}

void Table::adjust_capacity(size_t capacity) {
    std::vector<Entry> entries(capacity);

    // Tombstones are dropped, so the count is rebuilt from live entries
    count_ = 0;
    for (const Entry& entry : entries_) {
        if (entry.key.is_null()) continue;

        entries[find_slot(entries, TableKey{entry.key, entry.hash})] = entry;
        count_++;
    }

    entries_ = std::move(entries);
}

} // namespace loxvm
