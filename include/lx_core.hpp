// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_core.hpp
 * @brief Core object-model definitions.
 *
 * Declares the heap object base class, object type tags, stable object
 * handles, memory statistics and the debug logging macros shared by the
 * compiler and the virtual machine.
 */

#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>

namespace loxvm {

// Forward declarations
class VM;
class Object;
class Value;
class ObjectStore;

// Object type enumeration
enum class ObjectType : uint8_t {
    String,
    Function,
    Closure,
    Upvalue,
    Class,
    Instance,
    BoundMethod,
    Native
};

inline const char* object_type_name(ObjectType type) {
    switch (type) {
        case ObjectType::String: return "String";
        case ObjectType::Function: return "Function";
        case ObjectType::Closure: return "Closure";
        case ObjectType::Upvalue: return "Upvalue";
        case ObjectType::Class: return "Class";
        case ObjectType::Instance: return "Instance";
        case ObjectType::BoundMethod: return "BoundMethod";
        case ObjectType::Native: return "Native";
    }
    return "Unknown";
}

// Stable handle to a slot in the object store. The generation changes
// every time a slot is reused, so a handle to a freed object never
// aliases its successor.
struct ObjRef {
    static constexpr uint32_t kNullIndex = std::numeric_limits<uint32_t>::max();

    uint32_t index{kNullIndex};
    uint32_t generation{0};

    bool is_null() const { return index == kNullIndex; }
    bool operator==(const ObjRef& other) const = default;
};

// Base Object class for all heap-allocated objects
class Object {
public:
    ObjectType type;
    bool marked{false};
    size_t tracked_size{0};

    explicit Object(ObjectType t) : type(t) {}
    virtual ~Object() = default;

    // Virtual methods for type-specific behavior
    virtual std::string to_string(const ObjectStore& store) const = 0;
    virtual size_t memory_size() const = 0;

    // Marks every object directly reachable from this one.
    virtual void trace(ObjectStore& store) const { (void)store; }

    // Prevent copying
    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;
};

// Memory statistics
struct MemoryStats {
    size_t total_allocated{0};
    size_t total_freed{0};
    size_t current_objects{0};
    size_t peak_objects{0};
    size_t collections{0};
    size_t objects_collected{0};
};

// Debug utilities
#ifdef LX_DEBUG
    #define LX_DEBUG_LOG(fmt, ...) \
        printf("[LX] " fmt "\n", ##__VA_ARGS__)
#else
    #define LX_DEBUG_LOG(fmt, ...)
#endif

#define LX_ASSERT(cond, msg) assert((cond) && (msg))

} // namespace loxvm
