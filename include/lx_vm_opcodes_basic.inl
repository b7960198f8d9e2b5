#pragma once
#define OPCODE(T) template<> struct OpCodeHandler<T>
#define OP_BODY static void execute(VM& vm)

#include "lx_opcodes.hpp"
#include "lx_vm.hpp"

namespace loxvm {

    // Literals, stack slots, globals, upvalues and jumps.

    OPCODE(OpCode::OP_CONSTANT) {
        OP_BODY {
            vm.push(vm.read_constant());
        }
    };

    OPCODE(OpCode::OP_NIL) {
        OP_BODY {
            vm.push(Value::nil());
        }
    };

    OPCODE(OpCode::OP_TRUE) {
        OP_BODY {
            vm.push(Value::from_bool(true));
        }
    };

    OPCODE(OpCode::OP_FALSE) {
        OP_BODY {
            vm.push(Value::from_bool(false));
        }
    };

    OPCODE(OpCode::OP_POP) {
        OP_BODY {
            vm.pop();
        }
    };

    OPCODE(OpCode::OP_GET_LOCAL) {
        OP_BODY {
            uint8_t slot = vm.read_byte();
            vm.push(vm.stack_[vm.frame().stack_base + slot]);
        }
    };

    OPCODE(OpCode::OP_SET_LOCAL) {
        OP_BODY {
            uint8_t slot = vm.read_byte();
            // Assignment is an expression; the value stays on the stack
            vm.stack_[vm.frame().stack_base + slot] = vm.peek(0);
        }
    };

    OPCODE(OpCode::OP_GET_GLOBAL) {
        OP_BODY {
            ObjRef name = vm.read_string();
            auto value = vm.globals_.get(vm.store_.key_of(name));
            if (!value) {
                vm.runtime_error("Undefined variable '" + vm.store_.as<StringObject>(name).chars + "'.");
            }
            vm.push(*value);
        }
    };

    OPCODE(OpCode::OP_DEFINE_GLOBAL) {
        OP_BODY {
            ObjRef name = vm.read_string();
            vm.globals_.set(vm.store_.key_of(name), vm.peek(0));
            vm.pop();
        }
    };

    OPCODE(OpCode::OP_SET_GLOBAL) {
        OP_BODY {
            ObjRef name = vm.read_string();
            TableKey key = vm.store_.key_of(name);
            if (vm.globals_.set(key, vm.peek(0))) {
                // Assignment never creates a global
                vm.globals_.remove(key);
                vm.runtime_error("Undefined variable '" + vm.store_.as<StringObject>(name).chars + "'.");
            }
        }
    };

    OPCODE(OpCode::OP_GET_UPVALUE) {
        OP_BODY {
            uint8_t slot = vm.read_byte();
            const auto& closure = vm.store_.as<ClosureObject>(vm.frame().closure);
            vm.push(vm.upvalue_value(closure.upvalues[slot]));
        }
    };

    OPCODE(OpCode::OP_SET_UPVALUE) {
        OP_BODY {
            uint8_t slot = vm.read_byte();
            const auto& closure = vm.store_.as<ClosureObject>(vm.frame().closure);
            vm.upvalue_value(closure.upvalues[slot]) = vm.peek(0);
        }
    };

    OPCODE(OpCode::OP_CLOSE_UPVALUE) {
        OP_BODY {
            vm.close_upvalues(vm.stack_top_ - 1);
            vm.pop();
        }
    };

    OPCODE(OpCode::OP_PRINT) {
        OP_BODY {
            vm.out_ << vm.to_string(vm.pop()) << "\n";
        }
    };

    OPCODE(OpCode::OP_JUMP) {
        OP_BODY {
            uint16_t offset = vm.read_short();
            vm.frame().ip += offset;
        }
    };

    OPCODE(OpCode::OP_JUMP_IF_FALSE) {
        OP_BODY {
            uint16_t offset = vm.read_short();
            if (vm.peek(0).is_falsey()) {
                vm.frame().ip += offset;
            }
        }
    };

    OPCODE(OpCode::OP_LOOP) {
        OP_BODY {
            uint16_t offset = vm.read_short();
            vm.frame().ip -= offset;
        }
    };

} // namespace loxvm
