// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_object_store.cpp
 * @brief Slot arena, interning and mark-and-sweep collection.
 */

#include "lx_object_store.hpp"
#include "lx_object.hpp"

namespace loxvm {

ObjectStore::~ObjectStore() {
    LX_DEBUG_LOG("STORE teardown: %zu live objects", stats_.current_objects);
}

ObjRef ObjectStore::adopt(std::unique_ptr<Object> object) {
    object->tracked_size = object->memory_size();
    stats_.total_allocated += object->tracked_size;
    stats_.current_objects++;
    if (stats_.current_objects > stats_.peak_objects) {
        stats_.peak_objects = stats_.current_objects;
    }

    uint32_t index;
    if (!free_slots_.empty()) {
        index = free_slots_.back();
        free_slots_.pop_back();
    } else {
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    LX_DEBUG_LOG("ALLOCATE #%u [%s] size: %zu bytes",
        index, object_type_name(object->type), object->tracked_size);

    Slot& slot = slots_[index];
    slot.object = std::move(object);
    return ObjRef{index, slot.generation};
}

void ObjectStore::free(ObjRef ref) {
    if (!contains(ref)) {
        throw std::logic_error("Attempt to free a stale object reference");
    }
    if (slots_[ref.index].object->type == ObjectType::String) {
        strings_.remove(key_of(ref));
    }
    release_slot(ref.index);
}

void ObjectStore::release_slot(uint32_t index) {
    Slot& slot = slots_[index];
    LX_DEBUG_LOG("FREE #%u [%s]", index, object_type_name(slot.object->type));

    stats_.total_freed += slot.object->tracked_size;
    stats_.current_objects--;

    slot.object.reset();
    slot.generation++;
    free_slots_.push_back(index);
}

bool ObjectStore::contains(ObjRef ref) const {
    return !ref.is_null() &&
           ref.index < slots_.size() &&
           slots_[ref.index].generation == ref.generation &&
           slots_[ref.index].object != nullptr;
}

Object* ObjectStore::get(ObjRef ref) {
    if (!contains(ref)) {
        throw std::logic_error("Stale or null object reference");
    }
    return slots_[ref.index].object.get();
}

const Object* ObjectStore::get(ObjRef ref) const {
    if (!contains(ref)) {
        throw std::logic_error("Stale or null object reference");
    }
    return slots_[ref.index].object.get();
}

uint32_t ObjectStore::hash_string(std::string_view chars) {
    // FNV-1a
    uint32_t hash = 2166136261u;
    for (char c : chars) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 16777619u;
    }
    return hash;
}

ObjRef ObjectStore::intern(std::string_view chars) {
    uint32_t hash = hash_string(chars);
    ObjRef existing = strings_.find_string(*this, chars, hash);
    if (!existing.is_null()) {
        return existing;
    }

    ObjRef ref = allocate<StringObject>(std::string(chars), hash);
    strings_.set(TableKey{ref, hash}, Value::nil());
    return ref;
}

TableKey ObjectStore::key_of(ObjRef string) const {
    return TableKey{string, as<StringObject>(string).hash};
}

void ObjectStore::mark_object(ObjRef ref) {
    if (ref.is_null()) return;

    Object* obj = get(ref);
    if (obj->marked) return;

    obj->marked = true;
    gray_.push_back(ref);
}

void ObjectStore::mark_value(Value value) {
    if (value.is_object()) {
        mark_object(value.as_object());
    }
}

size_t ObjectStore::collect() {
    LX_DEBUG_LOG("-- gc begin (%zu objects)", stats_.current_objects);

    while (!gray_.empty()) {
        ObjRef ref = gray_.back();
        gray_.pop_back();
        get(ref)->trace(*this);
    }

    // The intern set holds its strings weakly
    strings_.remove_unmarked(*this);

    size_t freed = 0;
    for (uint32_t index = 0; index < slots_.size(); index++) {
        Slot& slot = slots_[index];
        if (!slot.object) continue;

        if (slot.object->marked) {
            slot.object->marked = false;
        } else {
            release_slot(index);
            freed++;
        }
    }

    stats_.collections++;
    stats_.objects_collected += freed;
    LX_DEBUG_LOG("-- gc end (freed %zu, %zu remain)", freed, stats_.current_objects);
    return freed;
}

} // namespace loxvm
