// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_object.hpp
 * @brief Heap object kinds.
 *
 * Every heap object derives from Object and is owned by the ObjectStore.
 * Objects refer to each other through ObjRef handles, never raw pointers.
 */

#pragma once

#include "lx_chunk.hpp"
#include "lx_core.hpp"
#include "lx_table.hpp"
#include "lx_value.hpp"
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace loxvm {

// Interned string. The hash is computed once at creation.
class StringObject : public Object {
public:
    static constexpr ObjectType kType = ObjectType::String;

    std::string chars;
    uint32_t hash;

    StringObject(std::string s, uint32_t h)
        : Object(kType), chars(std::move(s)), hash(h) {}

    std::string to_string(const ObjectStore&) const override { return chars; }
    size_t memory_size() const override { return sizeof(StringObject) + chars.capacity(); }
};

// Compiled function. A null name marks the top-level script.
class FunctionObject : public Object {
public:
    static constexpr ObjectType kType = ObjectType::Function;

    int arity{0};
    int upvalue_count{0};
    Chunk chunk;
    ObjRef name;

    FunctionObject() : Object(kType) {}

    std::string to_string(const ObjectStore& store) const override;
    size_t memory_size() const override {
        return sizeof(FunctionObject) + chunk.code.capacity() +
               chunk.lines.capacity() * sizeof(uint32_t) +
               chunk.constants.capacity() * sizeof(Value);
    }
    void trace(ObjectStore& store) const override;
};

// Captured variable. While open it aliases a live stack slot; once closed
// it owns a copy of the value. Open upvalues form a list sorted by slot,
// highest first.
class UpvalueObject : public Object {
public:
    static constexpr ObjectType kType = ObjectType::Upvalue;

    size_t slot;
    bool is_open{true};
    Value closed;
    ObjRef next_open;

    explicit UpvalueObject(size_t stack_slot) : Object(kType), slot(stack_slot) {}

    std::string to_string(const ObjectStore&) const override { return "upvalue"; }
    size_t memory_size() const override { return sizeof(UpvalueObject); }
    void trace(ObjectStore& store) const override;
};

// Function plus the upvalues it captured when it was created.
class ClosureObject : public Object {
public:
    static constexpr ObjectType kType = ObjectType::Closure;

    ObjRef function;
    std::vector<ObjRef> upvalues;

    ClosureObject(ObjRef fn, size_t upvalue_count)
        : Object(kType), function(fn) {
        upvalues.reserve(upvalue_count);
    }

    std::string to_string(const ObjectStore& store) const override;
    size_t memory_size() const override {
        return sizeof(ClosureObject) + upvalues.capacity() * sizeof(ObjRef);
    }
    void trace(ObjectStore& store) const override;
};

class ClassObject : public Object {
public:
    static constexpr ObjectType kType = ObjectType::Class;

    ObjRef name;
    Table methods;

    explicit ClassObject(ObjRef class_name) : Object(kType), name(class_name) {}

    std::string to_string(const ObjectStore& store) const override;
    size_t memory_size() const override {
        return sizeof(ClassObject) + methods.capacity() * sizeof(Table::Entry);
    }
    void trace(ObjectStore& store) const override;
};

class InstanceObject : public Object {
public:
    static constexpr ObjectType kType = ObjectType::Instance;

    ObjRef klass;
    Table fields;

    explicit InstanceObject(ObjRef cls) : Object(kType), klass(cls) {}

    std::string to_string(const ObjectStore& store) const override;
    size_t memory_size() const override {
        return sizeof(InstanceObject) + fields.capacity() * sizeof(Table::Entry);
    }
    void trace(ObjectStore& store) const override;
};

// Method closure bound to the receiver it was accessed through.
class BoundMethodObject : public Object {
public:
    static constexpr ObjectType kType = ObjectType::BoundMethod;

    Value receiver;
    ObjRef method;

    BoundMethodObject(Value recv, ObjRef closure)
        : Object(kType), receiver(recv), method(closure) {}

    std::string to_string(const ObjectStore& store) const override;
    size_t memory_size() const override { return sizeof(BoundMethodObject); }
    void trace(ObjectStore& store) const override;
};

// Native function signature
using NativeFunction = std::function<Value(VM&, std::span<const Value>)>;

// Host function. An arity of -1 accepts any argument count.
class NativeObject : public Object {
public:
    static constexpr ObjectType kType = ObjectType::Native;

    std::string name;
    int arity;
    NativeFunction function;

    NativeObject(std::string fn_name, int param_count, NativeFunction fn)
        : Object(kType), name(std::move(fn_name)), arity(param_count), function(std::move(fn)) {}

    std::string to_string(const ObjectStore&) const override { return "<native fn>"; }
    size_t memory_size() const override { return sizeof(NativeObject) + name.capacity(); }
};

} // namespace loxvm
