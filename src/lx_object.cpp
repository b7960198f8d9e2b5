// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_object.cpp
 * @brief Display and tracing for heap objects.
 */

#include "lx_object.hpp"
#include "lx_object_store.hpp"

namespace loxvm {

std::string FunctionObject::to_string(const ObjectStore& store) const {
    if (name.is_null()) {
        return "<script>";
    }
    return "<fn " + store.as<StringObject>(name).chars + ">";
}

void FunctionObject::trace(ObjectStore& store) const {
    store.mark_object(name);
    for (const Value& constant : chunk.constants) {
        store.mark_value(constant);
    }
}

void UpvalueObject::trace(ObjectStore& store) const {
    store.mark_value(closed);
}

std::string ClosureObject::to_string(const ObjectStore& store) const {
    return store.get(function)->to_string(store);
}

void ClosureObject::trace(ObjectStore& store) const {
    store.mark_object(function);
    for (ObjRef upvalue : upvalues) {
        store.mark_object(upvalue);
    }
}

std::string ClassObject::to_string(const ObjectStore& store) const {
    return store.as<StringObject>(name).chars;
}

void ClassObject::trace(ObjectStore& store) const {
    store.mark_object(name);
    methods.mark(store);
}

std::string InstanceObject::to_string(const ObjectStore& store) const {
    return store.get(klass)->to_string(store) + " instance";
}

void InstanceObject::trace(ObjectStore& store) const {
    store.mark_object(klass);
    fields.mark(store);
}

std::string BoundMethodObject::to_string(const ObjectStore& store) const {
    return store.get(method)->to_string(store);
}

void BoundMethodObject::trace(ObjectStore& store) const {
    store.mark_value(receiver);
    store.mark_object(method);
}

} // namespace loxvm
