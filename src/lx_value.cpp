// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_value.cpp
 * @brief Value equality and display.
 */

#include "lx_value.hpp"
#include "lx_core.hpp"
#include "lx_object_store.hpp"
#include <charconv>
#include <cmath>

namespace loxvm {

bool Value::equals(const Value& other) const {
    if (type_ != other.type_) return false;

    switch (type_) {
        case Type::Nil:
            return true;
        case Type::Bool:
            return data_.bool_val == other.data_.bool_val;
        case Type::Number:
            return data_.number_val == other.data_.number_val;
        case Type::Object:
            return data_.object_val == other.data_.object_val;
    }
    return false;
}

std::string Value::to_string(const ObjectStore& store) const {
    switch (type_) {
        case Type::Nil:
            return "nil";
        case Type::Bool:
            return data_.bool_val ? "true" : "false";
        case Type::Number:
            return format_number(data_.number_val);
        case Type::Object:
            return store.get(data_.object_val)->to_string(store);
    }
    return "unknown";
}

std::string format_number(Number n) {
    if (std::isnan(n)) return "nan";
    if (std::isinf(n)) return n < 0 ? "-inf" : "inf";

    // Shortest digits that read back to the same double, never in exponent form.
    char buf[400];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), n, std::chars_format::fixed);
    LX_ASSERT(ec == std::errc{}, "number does not fit the format buffer");
    (void)ec;
    return std::string(buf, end);
}

} // namespace loxvm
