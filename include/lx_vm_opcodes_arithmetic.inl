#pragma once

#include "lx_opcodes.hpp"
#include "lx_vm.hpp"

namespace loxvm {

    // Pops two numbers and pushes op(a, b). Both operands must be numbers.
    template<typename Op>
    inline void binary_number_op(VM& vm, Op op) {
        Value b = vm.peek(0);
        Value a = vm.peek(1);
        if (!a.is_number() || !b.is_number()) {
            throw RuntimeError("Operands must be numbers.");
        }
        vm.pop();
        vm.pop();
        vm.push(op(a.as_number(), b.as_number()));
    }

    OPCODE(OpCode::OP_EQUAL) {
        OP_BODY {
            Value b = vm.pop();
            Value a = vm.pop();
            vm.push(Value::from_bool(a.equals(b)));
        }
    };

    OPCODE(OpCode::OP_GREATER) {
        OP_BODY {
            binary_number_op(vm, [](double a, double b) { return Value::from_bool(a > b); });
        }
    };

    OPCODE(OpCode::OP_LESS) {
        OP_BODY {
            binary_number_op(vm, [](double a, double b) { return Value::from_bool(a < b); });
        }
    };

    OPCODE(OpCode::OP_ADD) {
        OP_BODY {
            Value b = vm.peek(0);
            Value a = vm.peek(1);

            if (vm.store_.is<StringObject>(a) && vm.store_.is<StringObject>(b)) {
                std::string result = vm.store_.as<StringObject>(a.as_object()).chars;
                result += vm.store_.as<StringObject>(b.as_object()).chars;
                ObjRef interned = vm.store_.intern(result);
                vm.pop();
                vm.pop();
                vm.push(Value::from_object(interned));
            } else if (a.is_number() && b.is_number()) {
                vm.pop();
                vm.pop();
                vm.push(Value::from_number(a.as_number() + b.as_number()));
            } else {
                vm.runtime_error("Operands must be two numbers or two strings.");
            }
        }
    };

    OPCODE(OpCode::OP_SUBTRACT) {
        OP_BODY {
            binary_number_op(vm, [](double a, double b) { return Value::from_number(a - b); });
        }
    };

    OPCODE(OpCode::OP_MULTIPLY) {
        OP_BODY {
            binary_number_op(vm, [](double a, double b) { return Value::from_number(a * b); });
        }
    };

    OPCODE(OpCode::OP_DIVIDE) {
        OP_BODY {
            binary_number_op(vm, [](double a, double b) { return Value::from_number(a / b); });
        }
    };

    OPCODE(OpCode::OP_NOT) {
        OP_BODY {
            vm.push(Value::from_bool(vm.pop().is_falsey()));
        }
    };

    OPCODE(OpCode::OP_NEGATE) {
        OP_BODY {
            if (!vm.peek(0).is_number()) {
                vm.runtime_error("Operand must be a number.");
            }
            vm.push(Value::from_number(-vm.pop().as_number()));
        }
    };

} // namespace loxvm
