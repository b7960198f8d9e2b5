#pragma once

#include "lx_token.hpp"
#include <cstdint>
#include <optional>

namespace loxvm {

// Precedence-climbing ranks, lowest first. Each infix operator has a left
// and a right power: right < left makes it right-associative (assignment),
// right > left makes it left-associative.
enum class BindingPower : uint8_t {
    Group,
    AssignmentRight,
    AssignmentLeft,
    LogicalLeft,
    LogicalRight,
    EqualityLeft,
    EqualityRight,
    ComparisonLeft,
    ComparisonRight,
    TermLeft,
    TermRight,
    FactorLeft,
    FactorRight,
    Unary,
    CallRight,
    CallLeft
};

struct InfixBindingPower {
    BindingPower left;
    BindingPower right;
};

std::optional<InfixBindingPower> infix_binding_power(TokenType type);
std::optional<BindingPower> prefix_binding_power(TokenType type);

} // namespace loxvm
