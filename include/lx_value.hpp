// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_value.hpp
 * @brief Tagged runtime value.
 *
 * A Value is nil, a boolean, a double-precision number, or a handle to a
 * heap object owned by the ObjectStore. Values are trivially copyable and
 * live directly on the VM stack and in constant pools.
 */

#pragma once

#include "lx_core.hpp"
#include <string>

namespace loxvm {

using Bool = bool;
using Number = double;

// Value class - 16 bytes on 64-bit systems
class Value {
public:
    enum class Type : uint8_t {
        Nil,
        Bool,
        Number,
        Object  // Handle into the object store
    };

private:
    Type type_{Type::Nil};
    uint8_t padding_[7]{};  // Alignment padding

    union {
        Bool bool_val;
        Number number_val;
        ObjRef object_val;
    } data_{.number_val = 0};

public:
    // Constructors
    Value() : type_(Type::Nil) {}

    static Value nil() { return Value(); }

    static Value from_bool(Bool b) {
        Value v;
        v.type_ = Type::Bool;
        v.data_.bool_val = b;
        return v;
    }

    static Value from_number(Number n) {
        Value v;
        v.type_ = Type::Number;
        v.data_.number_val = n;
        return v;
    }

    static Value from_object(ObjRef ref) {
        Value v;
        v.type_ = Type::Object;
        v.data_.object_val = ref;
        return v;
    }

    // Type checking
    bool is_nil() const { return type_ == Type::Nil; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_object() const { return type_ == Type::Object; }

    Type type() const { return type_; }

    // Value access (with assertions)
    Bool as_bool() const {
        LX_ASSERT(is_bool(), "Value is not a bool");
        return data_.bool_val;
    }

    Number as_number() const {
        LX_ASSERT(is_number(), "Value is not a number");
        return data_.number_val;
    }

    ObjRef as_object() const {
        LX_ASSERT(is_object(), "Value is not an object");
        return data_.object_val;
    }

    // nil and false are falsey, everything else is truthy
    bool is_falsey() const {
        return is_nil() || (is_bool() && !data_.bool_val);
    }

    // Strings are interned, so handle identity is content equality.
    bool equals(const Value& other) const;

    std::string to_string(const ObjectStore& store) const;
};

static_assert(sizeof(Value) == 16, "Value must be 16 bytes");

// Renders a number the way `print` shows it: the shortest decimal text
// that reads back to the same value, without an exponent.
std::string format_number(Number n);

} // namespace loxvm
