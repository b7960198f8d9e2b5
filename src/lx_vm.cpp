// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_vm.cpp
 * @brief VM lifecycle, dispatch loop and call machinery.
 */

#include "lx_vm.hpp"
#include "lx_compiler.hpp"
#include "lx_natives.hpp"
#include <iomanip>

namespace loxvm {

    const std::array<OpHandlerFunc, 256> g_opcode_handlers = make_handler_table();

    VM::VM(std::ostream& out, std::ostream& err, VMConfig config)
        : config_(config), out_(out), err_(err) {
        stack_.resize(kStackMax);
        call_frames_.reserve(kFramesMax);
        init_string_ = store_.intern("init");
        register_builtin_natives(*this);
    }

    VM::~VM() {
        if (config_.enable_debug) {
            print_stats();
        }
    }

    InterpretResult VM::interpret(std::string_view source) {
        reset_stack();

        ObjRef function;
        try {
            Compiler compiler(source, store_, err_);
            if (config_.print_code) {
                compiler.set_code_dump(&err_);
            }
            function = compiler.compile();
        } catch (const CompilerError&) {
            return InterpretResult::CompileError;
        }

        try {
            ObjRef closure = store_.allocate<ClosureObject>(function, 0);
            push(Value::from_object(closure));
            call(closure, 0);
            run();
        } catch (const RuntimeError& e) {
            report_runtime_error(e.what());
            return InterpretResult::RuntimeError;
        }

        if (config_.collect_between_runs) {
            collect_garbage();
        }
        return InterpretResult::Ok;
    }

    void VM::run() {
        while (!call_frames_.empty()) {
            if (config_.trace_execution) {
                trace_instruction();
            }

            uint8_t instruction = read_byte();
            auto handler = g_opcode_handlers[instruction];
            if (!handler) {
                runtime_error("Unknown opcode " + std::to_string(instruction) + ".");
            }
            handler(*this);
        }
    }

    // ---- Stack ----

    void VM::push(Value val) {
        if (stack_top_ >= kStackMax) {
            runtime_error("Stack overflow.");
        }
        stack_[stack_top_++] = val;
    }

    Value VM::pop() {
        if (stack_top_ == 0) {
            runtime_error("Stack underflow.");
        }
        return stack_[--stack_top_];
    }

    Value VM::peek(size_t distance) const {
        if (distance >= stack_top_) {
            runtime_error("Stack underflow.");
        }
        return stack_[stack_top_ - 1 - distance];
    }

    void VM::reset_stack() {
        // Closures that outlive an aborted run keep the values they captured.
        close_upvalues(0);
        stack_top_ = 0;
        call_frames_.clear();
    }

    // ---- Instruction decoding ----

    uint8_t VM::read_byte() {
        CallFrame& current = frame();
        return current.function->chunk.code[current.ip++];
    }

    uint16_t VM::read_short() {
        CallFrame& current = frame();
        uint16_t value = current.function->chunk.read_short(current.ip);
        current.ip += 2;
        return value;
    }

    Value VM::read_constant() {
        return chunk().constants[read_byte()];
    }

    ObjRef VM::read_string() {
        return read_constant().as_object();
    }

    // ---- Errors ----

    void VM::runtime_error(const std::string& message) const {
        throw RuntimeError(message);
    }

    void VM::report_runtime_error(const std::string& message) {
        err_ << message << "\n";

        for (size_t i = call_frames_.size(); i-- > 0;) {
            const CallFrame& f = call_frames_[i];
            const Chunk& code = f.function->chunk;
            size_t instruction = f.ip > 0 ? f.ip - 1 : 0;
            uint32_t line = instruction < code.lines.size() ? code.lines[instruction] : 0;

            err_ << "[line " << line << "] in ";
            if (f.function->name.is_null()) {
                err_ << "script\n";
            } else {
                err_ << store_.as<StringObject>(f.function->name).chars << "()\n";
            }
        }

        // The value stack is kept for inspection; frames and open upvalues
        // are dropped so the next interpret starts clean.
        close_upvalues(0);
        call_frames_.clear();
    }

    void VM::trace_instruction() {
        err_ << "          ";
        for (size_t i = 0; i < stack_top_; i++) {
            err_ << "[ " << to_string(stack_[i]) << " ]";
        }
        err_ << "\n";
        frame().function->chunk.disassemble_instruction(err_, frame().ip, store_);
    }

    // ---- Calls ----

    void VM::call_value(Value callee, int arg_count) {
        if (callee.is_object()) {
            ObjRef ref = callee.as_object();
            switch (store_.get(ref)->type) {
                case ObjectType::BoundMethod: {
                    const auto& bound = store_.as<BoundMethodObject>(ref);
                    stack_[stack_top_ - arg_count - 1] = bound.receiver;
                    call(bound.method, arg_count);
                    return;
                }
                case ObjectType::Class: {
                    ObjRef instance = store_.allocate<InstanceObject>(ref);
                    stack_[stack_top_ - arg_count - 1] = Value::from_object(instance);

                    const auto& klass = store_.as<ClassObject>(ref);
                    if (auto initializer = klass.methods.get(store_.key_of(init_string_))) {
                        call(initializer->as_object(), arg_count);
                    } else if (arg_count != 0) {
                        runtime_error("Expected 0 arguments but got " + std::to_string(arg_count) + ".");
                    }
                    return;
                }
                case ObjectType::Closure:
                    call(ref, arg_count);
                    return;
                case ObjectType::Native: {
                    const auto& native = store_.as<NativeObject>(ref);
                    if (native.arity >= 0 && native.arity != arg_count) {
                        runtime_error("Expected " + std::to_string(native.arity) +
                                      " arguments but got " + std::to_string(arg_count) + ".");
                    }
                    std::span<const Value> args(stack_.data() + stack_top_ - arg_count,
                                                static_cast<size_t>(arg_count));
                    Value result;
                    try {
                        result = native.function(*this, args);
                    } catch (const RuntimeError&) {
                        throw;
                    } catch (const std::exception& e) {
                        // Host failures surface as Lox runtime errors.
                        runtime_error(e.what());
                    }
                    stack_top_ -= arg_count + 1;
                    push(result);
                    return;
                }
                case ObjectType::String:
                case ObjectType::Function:
                case ObjectType::Upvalue:
                case ObjectType::Instance:
                    break;
            }
        }
        runtime_error("Can only call functions and classes.");
    }

    void VM::call(ObjRef closure, int arg_count) {
        const auto& function = store_.as<FunctionObject>(store_.as<ClosureObject>(closure).function);
        if (arg_count != function.arity) {
            runtime_error("Expected " + std::to_string(function.arity) +
                          " arguments but got " + std::to_string(arg_count) + ".");
        }

        if (call_frames_.size() == kFramesMax) {
            runtime_error("Stack overflow.");
        }

        call_frames_.emplace_back(closure, &function, stack_top_ - arg_count - 1);
    }

    void VM::invoke(ObjRef name, int arg_count) {
        Value receiver = peek(arg_count);
        if (!store_.is<InstanceObject>(receiver)) {
            runtime_error("Only instances have methods.");
        }

        const auto& instance = store_.as<InstanceObject>(receiver.as_object());
        // A field holding a callable shadows a method of the same name
        if (auto field = instance.fields.get(store_.key_of(name))) {
            stack_[stack_top_ - arg_count - 1] = *field;
            call_value(*field, arg_count);
            return;
        }

        invoke_from_class(instance.klass, name, arg_count);
    }

    void VM::invoke_from_class(ObjRef klass, ObjRef name, int arg_count) {
        auto method = store_.as<ClassObject>(klass).methods.get(store_.key_of(name));
        if (!method) {
            runtime_error("Undefined property '" + store_.as<StringObject>(name).chars + "'.");
        }
        call(method->as_object(), arg_count);
    }

    void VM::bind_method(ObjRef klass, ObjRef name) {
        auto method = store_.as<ClassObject>(klass).methods.get(store_.key_of(name));
        if (!method) {
            runtime_error("Undefined property '" + store_.as<StringObject>(name).chars + "'.");
        }

        ObjRef bound = store_.allocate<BoundMethodObject>(peek(0), method->as_object());
        pop();
        push(Value::from_object(bound));
    }

    void VM::define_method(ObjRef name) {
        Value method = peek(0);
        auto& klass = store_.as<ClassObject>(peek(1).as_object());
        klass.methods.set(store_.key_of(name), method);
        pop();
    }

    // ---- Upvalues ----

    ObjRef VM::capture_upvalue(size_t slot) {
        ObjRef prev;
        ObjRef current = open_upvalues_;
        while (!current.is_null() && store_.as<UpvalueObject>(current).slot > slot) {
            prev = current;
            current = store_.as<UpvalueObject>(current).next_open;
        }

        if (!current.is_null() && store_.as<UpvalueObject>(current).slot == slot) {
            return current;
        }

        ObjRef created = store_.allocate<UpvalueObject>(slot);
        store_.as<UpvalueObject>(created).next_open = current;

        if (prev.is_null()) {
            open_upvalues_ = created;
        } else {
            store_.as<UpvalueObject>(prev).next_open = created;
        }
        return created;
    }

    void VM::close_upvalues(size_t last) {
        while (!open_upvalues_.is_null()) {
            auto& upvalue = store_.as<UpvalueObject>(open_upvalues_);
            if (upvalue.slot < last) break;

            upvalue.closed = stack_[upvalue.slot];
            upvalue.is_open = false;
            open_upvalues_ = upvalue.next_open;
            upvalue.next_open = ObjRef{};
        }
    }

    Value& VM::upvalue_value(ObjRef upvalue) {
        auto& up = store_.as<UpvalueObject>(upvalue);
        return up.is_open ? stack_[up.slot] : up.closed;
    }

    // ---- Globals and natives ----

    std::optional<Value> VM::get_global(std::string_view name) {
        return globals_.get(store_.key_of(store_.intern(name)));
    }

    void VM::set_global(std::string_view name, Value value) {
        globals_.set(store_.key_of(store_.intern(name)), value);
    }

    void VM::define_native(std::string_view name, NativeFunction function, int arity) {
        ObjRef native = store_.allocate<NativeObject>(std::string(name), arity, std::move(function));
        set_global(name, Value::from_object(native));
    }

    // ---- Garbage collection ----

    void VM::mark_roots() {
        for (size_t i = 0; i < stack_top_; i++) {
            store_.mark_value(stack_[i]);
        }
        for (const CallFrame& f : call_frames_) {
            store_.mark_object(f.closure);
        }
        for (ObjRef upvalue = open_upvalues_; !upvalue.is_null();
             upvalue = store_.as<UpvalueObject>(upvalue).next_open) {
            store_.mark_object(upvalue);
        }
        globals_.mark(store_);
        store_.mark_object(init_string_);
    }

    size_t VM::collect_garbage() {
        mark_roots();
        return store_.collect();
    }

    // ---- Statistics ----

    void VM::print_stats() const {
        const MemoryStats& stats = store_.stats();
        err_ << "\n=== loxvm Statistics ===\n";
        err_ << "Total Allocated:  " << std::setw(10) << stats.total_allocated << " bytes\n";
        err_ << "Total Freed:      " << std::setw(10) << stats.total_freed << " bytes\n";
        err_ << "Current Objects:  " << std::setw(10) << stats.current_objects << "\n";
        err_ << "Peak Objects:     " << std::setw(10) << stats.peak_objects << "\n";
        err_ << "Collections:      " << std::setw(10) << stats.collections << "\n";
        err_ << "Objects Collected:" << std::setw(10) << stats.objects_collected << "\n";
    }

} // namespace loxvm
