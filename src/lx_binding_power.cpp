#include "lx_binding_power.hpp"

namespace loxvm {

std::optional<InfixBindingPower> infix_binding_power(TokenType type) {
    switch (type) {
        case TokenType::Equal:
            return InfixBindingPower{BindingPower::AssignmentLeft, BindingPower::AssignmentRight};
        case TokenType::And:
        case TokenType::Or:
            return InfixBindingPower{BindingPower::LogicalLeft, BindingPower::LogicalRight};
        case TokenType::EqualEqual:
        case TokenType::BangEqual:
            return InfixBindingPower{BindingPower::EqualityLeft, BindingPower::EqualityRight};
        case TokenType::Less:
        case TokenType::LessEqual:
        case TokenType::Greater:
        case TokenType::GreaterEqual:
            return InfixBindingPower{BindingPower::ComparisonLeft, BindingPower::ComparisonRight};
        case TokenType::Plus:
        case TokenType::Minus:
            return InfixBindingPower{BindingPower::TermLeft, BindingPower::TermRight};
        case TokenType::Star:
        case TokenType::Slash:
            return InfixBindingPower{BindingPower::FactorLeft, BindingPower::FactorRight};
        case TokenType::Dot:
        case TokenType::LeftParen:
            return InfixBindingPower{BindingPower::CallLeft, BindingPower::CallRight};
        default:
            return std::nullopt;
    }
}

std::optional<BindingPower> prefix_binding_power(TokenType type) {
    switch (type) {
        case TokenType::LeftParen:
            return BindingPower::Group;
        case TokenType::Bang:
        case TokenType::Minus:
            return BindingPower::Unary;
        default:
            return std::nullopt;
    }
}

} // namespace loxvm
