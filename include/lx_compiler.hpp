// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_compiler.hpp
 * @brief Single-pass bytecode compiler.
 *
 * Consumes tokens straight from the Scanner and emits bytecode without an
 * intermediate AST. Expressions use precedence climbing over the
 * BindingPower table; statements and declarations use recursive descent.
 * Each function being compiled gets a Context on an explicit stack that
 * mirrors lexical nesting and drives local and upvalue resolution.
 */

#pragma once

#include "lx_binding_power.hpp"
#include "lx_chunk.hpp"
#include "lx_object.hpp"
#include "lx_object_store.hpp"
#include "lx_scanner.hpp"
#include <array>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace loxvm {

class CompilerError : public std::runtime_error {
public:
    CompilerError(const std::string& msg, uint32_t line = 0, size_t error_count = 1)
        : std::runtime_error(line > 0 ? msg + " (line " + std::to_string(line) + ")" : msg)
        , line_(line)
        , error_count_(error_count) {}

    uint32_t line() const { return line_; }
    size_t error_count() const { return error_count_; }

private:
    uint32_t line_;
    size_t error_count_;
};

enum class FunctionType {
    Function,
    Initializer,
    Method,
    Script
};

class Compiler {
public:
    static constexpr size_t kMaxLocals = 255;
    static constexpr size_t kMaxUpvalues = 255;
    static constexpr size_t kMaxArgs = 255;
    // Slot zero holds the callee, so parameters share the rest of the locals.
    static constexpr size_t kMaxParams = kMaxLocals - 1;
    static constexpr int kMaxRecursionDepth = 1000;

    Compiler(std::string_view source, ObjectStore& store, std::ostream& errors);

    // Compiles the whole source into the top-level script function.
    // Every error is reported to the error stream as it is found; if any
    // occurred, CompilerError is thrown once the source is consumed.
    ObjRef compile();

    // Disassemble each function to this stream once it compiles cleanly.
    void set_code_dump(std::ostream* out) { code_dump_ = out; }

private:
    struct Local {
        Token name;
        int depth{-1};  // -1 while the initializer is being compiled
        bool is_captured{false};
    };

    struct Upvalue {
        uint8_t index{0};
        bool is_local{false};
    };

    struct Context {
        std::unique_ptr<FunctionObject> function;
        FunctionType type;
        int scope_depth{0};
        std::array<Local, kMaxLocals> locals{};
        size_t local_count{0};
        std::array<Upvalue, kMaxUpvalues> upvalues{};

        explicit Context(FunctionType t)
            : function(std::make_unique<FunctionObject>()), type(t) {}
    };

    struct FinishedFunction {
        std::unique_ptr<FunctionObject> function;
        std::array<Upvalue, kMaxUpvalues> upvalues;
    };

    struct ClassContext {
        bool has_superclass{false};
    };

    Scanner scanner_;
    ObjectStore& store_;
    std::ostream& errors_;
    std::ostream* code_dump_{nullptr};

    Token current_;
    Token previous_;
    bool had_error_{false};
    bool panic_mode_{false};
    size_t error_count_{0};
    std::string first_error_;
    uint32_t first_error_line_{0};

    std::vector<Context> contexts_;
    std::vector<ClassContext> classes_;
    int recursion_depth_{0};

    // Token stream
    void advance();
    void consume(TokenType type, const char* message);
    bool check(TokenType type) const { return current_.type == type; }
    bool match(TokenType type);

    // Error reporting
    void error_at(const Token& token, std::string_view message);
    void error(std::string_view message) { error_at(previous_, message); }
    void error_at_current(std::string_view message) { error_at(current_, message); }
    void synchronize();

    // Emission
    Context& context() { return contexts_.back(); }
    Chunk& current_chunk() { return contexts_.back().function->chunk; }
    void emit_byte(uint8_t byte);
    void emit_op(OpCode op);
    void emit_op(OpCode op, uint8_t operand);
    size_t emit_jump(OpCode op);
    void patch_jump(size_t offset);
    void emit_loop(size_t loop_start);
    void emit_return();
    uint8_t make_constant(Value value);

    // Contexts and scopes
    void push_context(FunctionType type);
    FinishedFunction end_context();
    void begin_scope();
    void end_scope();

    // Variables
    uint8_t identifier_constant(const Token& name);
    static bool identifiers_equal(const Token& a, const Token& b);
    void add_local(const Token& name);
    void declare_variable();
    uint8_t parse_variable(const char* message);
    void mark_initialized();
    void define_variable(uint8_t global);
    std::optional<uint8_t> resolve_local(size_t context_index, const Token& name);
    std::optional<uint8_t> resolve_upvalue(size_t context_index, const Token& name);
    uint8_t add_upvalue(size_t context_index, uint8_t index, bool is_local);
    void named_variable(const Token& name, bool can_assign);
    Token synthetic_token(TokenType type, std::string_view text) const;

    // Declarations
    void declaration();
    void class_declaration();
    void method();
    void fun_declaration();
    void function(FunctionType type);
    void var_declaration();

    // Statements
    void statement();
    void print_statement();
    void expression_statement();
    void if_statement();
    void while_statement();
    void for_statement();
    void return_statement();
    void block();

    // Expressions
    void expression(BindingPower min_bp = BindingPower::Group);
    bool prefix(TokenType type, bool can_assign);
    void infix(TokenType type, BindingPower right, bool can_assign);
    void number();
    void string();
    void this_();
    void super_();
    void and_(BindingPower right);
    void or_(BindingPower right);
    void dot(bool can_assign);
    uint8_t argument_list();

    // Recursion guard
    class RecursionGuard {
    public:
        explicit RecursionGuard(Compiler& compiler) : compiler_(compiler) {
            if (++compiler_.recursion_depth_ > kMaxRecursionDepth) {
                --compiler_.recursion_depth_;
                compiler_.error_at_current("Maximum recursion depth exceeded.");
                throw CompilerError("Maximum recursion depth exceeded", compiler_.current_.line,
                                    compiler_.error_count_);
            }
        }
        ~RecursionGuard() {
            --compiler_.recursion_depth_;
        }
        RecursionGuard(const RecursionGuard&) = delete;
        RecursionGuard& operator=(const RecursionGuard&) = delete;
    private:
        Compiler& compiler_;
    };
};

} // namespace loxvm
