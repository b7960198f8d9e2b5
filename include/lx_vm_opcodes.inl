#pragma once

#include "lx_opcodes.hpp"
#include "lx_vm.hpp"

namespace loxvm {

    // Calls, closures and classes.

    OPCODE(OpCode::OP_CALL) {
        OP_BODY {
            int arg_count = vm.read_byte();
            vm.call_value(vm.peek(arg_count), arg_count);
        }
    };

    OPCODE(OpCode::OP_INVOKE) {
        OP_BODY {
            ObjRef method = vm.read_string();
            int arg_count = vm.read_byte();
            vm.invoke(method, arg_count);
        }
    };

    OPCODE(OpCode::OP_SUPER_INVOKE) {
        OP_BODY {
            ObjRef method = vm.read_string();
            int arg_count = vm.read_byte();
            ObjRef superclass = vm.pop().as_object();
            vm.invoke_from_class(superclass, method, arg_count);
        }
    };

    OPCODE(OpCode::OP_CLOSURE) {
        OP_BODY {
            ObjRef function = vm.read_constant().as_object();
            int upvalue_count = vm.store_.as<FunctionObject>(function).upvalue_count;
            ObjRef closure_ref = vm.store_.allocate<ClosureObject>(function, upvalue_count);
            vm.push(Value::from_object(closure_ref));

            for (int i = 0; i < upvalue_count; i++) {
                uint8_t is_local = vm.read_byte();
                uint8_t index = vm.read_byte();
                ObjRef upvalue;
                if (is_local) {
                    upvalue = vm.capture_upvalue(vm.frame().stack_base + index);
                } else {
                    upvalue = vm.store_.as<ClosureObject>(vm.frame().closure).upvalues[index];
                }
                vm.store_.as<ClosureObject>(closure_ref).upvalues.push_back(upvalue);
            }
        }
    };

    OPCODE(OpCode::OP_RETURN) {
        OP_BODY {
            Value result = vm.pop();
            size_t base = vm.frame().stack_base;
            vm.close_upvalues(base);
            vm.call_frames_.pop_back();

            // Discard the callee's window, including the callee itself
            vm.stack_top_ = base;
            if (!vm.call_frames_.empty()) {
                vm.push(result);
            }
        }
    };

    OPCODE(OpCode::OP_CLASS) {
        OP_BODY {
            ObjRef name = vm.read_string();
            vm.push(Value::from_object(vm.store_.allocate<ClassObject>(name)));
        }
    };

    OPCODE(OpCode::OP_INHERIT) {
        OP_BODY {
            Value superclass = vm.peek(1);
            if (!vm.store_.is<ClassObject>(superclass)) {
                vm.runtime_error("Superclass must be a class.");
            }

            auto& subclass = vm.store_.as<ClassObject>(vm.peek(0).as_object());
            subclass.methods.add_all(vm.store_.as<ClassObject>(superclass.as_object()).methods);
            vm.pop();  // Subclass
        }
    };

    OPCODE(OpCode::OP_METHOD) {
        OP_BODY {
            vm.define_method(vm.read_string());
        }
    };

    OPCODE(OpCode::OP_GET_PROPERTY) {
        OP_BODY {
            if (!vm.store_.is<InstanceObject>(vm.peek(0))) {
                vm.runtime_error("Only instances have properties.");
            }

            ObjRef name = vm.read_string();
            const auto& instance = vm.store_.as<InstanceObject>(vm.peek(0).as_object());
            if (auto value = instance.fields.get(vm.store_.key_of(name))) {
                vm.pop();  // Instance
                vm.push(*value);
                return;
            }

            vm.bind_method(instance.klass, name);
        }
    };

    OPCODE(OpCode::OP_SET_PROPERTY) {
        OP_BODY {
            if (!vm.store_.is<InstanceObject>(vm.peek(1))) {
                vm.runtime_error("Only instances have fields.");
            }

            ObjRef name = vm.read_string();
            auto& instance = vm.store_.as<InstanceObject>(vm.peek(1).as_object());
            instance.fields.set(vm.store_.key_of(name), vm.peek(0));

            Value value = vm.pop();
            vm.pop();  // Instance
            vm.push(value);
        }
    };

    OPCODE(OpCode::OP_GET_SUPER) {
        OP_BODY {
            ObjRef name = vm.read_string();
            ObjRef superclass = vm.pop().as_object();
            vm.bind_method(superclass, name);
        }
    };

    constexpr std::array<OpHandlerFunc, 256> make_handler_table()
    {
        std::array<OpHandlerFunc, 256> tbl{};
        tbl.fill(nullptr);

#define X(op, width) tbl[static_cast<uint8_t>(OpCode::op)] = &OpCodeHandler<OpCode::op>::execute;
#include "lx_opcodes.def"
#undef X

        return tbl;
    }

} // namespace loxvm
