// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_vm.hpp
 * @brief Stack-based bytecode virtual machine.
 *
 * The VM owns the object store, a fixed-capacity value stack, the call
 * frame stack and the global table. Each opcode has an OpCodeHandler
 * specialization; run() dispatches through a table of their execute
 * functions built from lx_opcodes.def.
 */

#pragma once

#include "lx_chunk.hpp"
#include "lx_core.hpp"
#include "lx_object.hpp"
#include "lx_object_store.hpp"
#include "lx_table.hpp"
#include "lx_value.hpp"
#include <array>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace loxvm {

class VM;

// Primary OpCodeHandler template. Specializations in the lx_vm_opcodes
// .inl files override `execute`.
template<OpCode op>
struct OpCodeHandler {
    static void execute(VM& vm) {
        (void)vm;
        throw std::runtime_error("Unhandled opcode (no handler specialization)");
    }
};

// VM configuration
struct VMConfig {
    bool trace_execution = false;      // dump stack and instruction before each dispatch
    bool print_code = false;           // disassemble every function after compiling
    bool enable_debug = false;         // print memory statistics on destruction
    bool collect_between_runs = false; // full collection after each successful interpret
};

enum class InterpretResult {
    Ok,
    CompileError,
    RuntimeError
};

class RuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Call Frame for function calls. `function` caches the closure's
// function, which the store never moves.
class CallFrame {
public:
    ObjRef closure;
    const FunctionObject* function;
    size_t ip;
    size_t stack_base;  // Slot of the callee; locals start here

    CallFrame(ObjRef c, const FunctionObject* fn, size_t base)
        : closure(c), function(fn), ip(0), stack_base(base) {}
};

// Virtual Machine
class VM {
public:
    static constexpr size_t kFramesMax = 64;
    static constexpr size_t kStackMax = kFramesMax * 256;

    explicit VM(std::ostream& out = std::cout, std::ostream& err = std::cerr,
                VMConfig config = VMConfig{});
    ~VM();

    // Prevent copying
    VM(const VM&) = delete;
    VM& operator=(const VM&) = delete;

    // Compiles and runs one program or REPL line. Globals and heap objects
    // persist across calls.
    InterpretResult interpret(std::string_view source);

    // Host functions
    void define_native(std::string_view name, NativeFunction function, int arity = -1);

    // Stack operations
    void push(Value val);
    Value pop();
    Value peek(size_t distance = 0) const;
    size_t stack_size() const { return stack_top_; }
    size_t frame_count() const { return call_frames_.size(); }

    // Global variables
    std::optional<Value> get_global(std::string_view name);
    void set_global(std::string_view name, Value value);

    // Heap
    ObjectStore& store() { return store_; }
    const ObjectStore& store() const { return store_; }
    size_t collect_garbage();
    std::string to_string(Value value) const { return value.to_string(store_); }

    // Statistics
    const MemoryStats& get_stats() const { return store_.stats(); }
    void print_stats() const;

    // Configuration

private:
    template<OpCode op> friend struct OpCodeHandler;

    VMConfig config_;
    std::ostream& out_;
    std::ostream& err_;

    ObjectStore store_;

    // Execution state
    std::vector<Value> stack_;
    size_t stack_top_{0};
    std::vector<CallFrame> call_frames_;
    ObjRef open_upvalues_;  // Highest stack slot first

    // Global scope
    Table globals_;
    ObjRef init_string_;

    void run();
    CallFrame& frame() { return call_frames_.back(); }
    const Chunk& chunk() { return call_frames_.back().function->chunk; }
    uint8_t read_byte();
    uint16_t read_short();
    Value read_constant();
    ObjRef read_string();

    [[noreturn]] void runtime_error(const std::string& message) const;
    void report_runtime_error(const std::string& message);
    void reset_stack();
    void trace_instruction();

    void call_value(Value callee, int arg_count);
    void call(ObjRef closure, int arg_count);
    void invoke(ObjRef name, int arg_count);
    void invoke_from_class(ObjRef klass, ObjRef name, int arg_count);
    void bind_method(ObjRef klass, ObjRef name);
    void define_method(ObjRef name);

    ObjRef capture_upvalue(size_t slot);
    void close_upvalues(size_t last);
    Value& upvalue_value(ObjRef upvalue);

    void mark_roots();
};

// Opcode dispatch table (function pointer type) instantiated at program start
using OpHandlerFunc = void(*)(VM&);
extern const std::array<OpHandlerFunc, 256> g_opcode_handlers;

} // namespace loxvm

#include "lx_vm_opcodes_basic.inl"
#include "lx_vm_opcodes_arithmetic.inl"
#include "lx_vm_opcodes.inl"
