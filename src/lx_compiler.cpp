// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_compiler.cpp
 * @brief Single-pass compiler implementation.
 *
 * Expressions are parsed by precedence climbing: a prefix rule for the
 * first token, then a loop that keeps folding infix operators whose left
 * binding power is at least the caller's minimum. Locals live in fixed
 * stack slots; variables captured by inner functions are reached through
 * upvalues threaded context by context.
 */

#include "lx_compiler.hpp"
#include <cstdlib>

namespace loxvm {

Compiler::Compiler(std::string_view source, ObjectStore& store, std::ostream& errors)
    : scanner_(source), store_(store), errors_(errors) {}

ObjRef Compiler::compile() {
    contexts_.clear();
    classes_.clear();
    push_context(FunctionType::Script);

    advance();
    while (!match(TokenType::Eof)) {
        declaration();
    }

    FinishedFunction script = end_context();
    if (had_error_) {
        throw CompilerError(first_error_, first_error_line_, error_count_);
    }
    return store_.adopt(std::move(script.function));
}

// ---- Token stream ----

void Compiler::advance() {
    previous_ = current_;

    while (true) {
        current_ = scanner_.next_token();
        if (current_.type != TokenType::Error) break;
        error_at_current(current_.lexeme);
    }
}

void Compiler::consume(TokenType type, const char* message) {
    if (current_.type == type) {
        advance();
        return;
    }
    error_at_current(message);
}

bool Compiler::match(TokenType type) {
    if (!check(type)) return false;
    advance();
    return true;
}

// ---- Error reporting ----

void Compiler::error_at(const Token& token, std::string_view message) {
    if (panic_mode_) return;
    panic_mode_ = true;

    errors_ << "[line " << token.line << "] Error";
    if (token.type == TokenType::Eof) {
        errors_ << " at end";
    } else if (token.type != TokenType::Error) {
        errors_ << " at '" << token.lexeme << "'";
    }
    errors_ << ": " << message << "\n";

    if (!had_error_) {
        first_error_ = std::string(message);
        first_error_line_ = token.line;
    }
    had_error_ = true;
    error_count_++;
}

void Compiler::synchronize() {
    panic_mode_ = false;

    while (current_.type != TokenType::Eof) {
        if (previous_.type == TokenType::Semicolon) return;
        switch (current_.type) {
            case TokenType::Class:
            case TokenType::Fun:
            case TokenType::Var:
            case TokenType::For:
            case TokenType::If:
            case TokenType::While:
            case TokenType::Print:
            case TokenType::Return:
                return;
            default:
                break;
        }
        advance();
    }
}

// ---- Emission ----

void Compiler::emit_byte(uint8_t byte) {
    current_chunk().write(byte, previous_.line);
}

void Compiler::emit_op(OpCode op) {
    current_chunk().write_op(op, previous_.line);
}

void Compiler::emit_op(OpCode op, uint8_t operand) {
    emit_op(op);
    emit_byte(operand);
}

size_t Compiler::emit_jump(OpCode op) {
    return current_chunk().emit_jump(op, previous_.line);
}

void Compiler::patch_jump(size_t offset) {
    if (!current_chunk().patch_jump(offset)) {
        error("Too much code to jump over.");
    }
}

void Compiler::emit_loop(size_t loop_start) {
    if (!current_chunk().emit_loop(loop_start, previous_.line)) {
        error("Loop body too large.");
    }
}

void Compiler::emit_return() {
    if (context().type == FunctionType::Initializer) {
        emit_op(OpCode::OP_GET_LOCAL, 0);
    } else {
        emit_op(OpCode::OP_NIL);
    }
    emit_op(OpCode::OP_RETURN);
}

uint8_t Compiler::make_constant(Value value) {
    auto index = current_chunk().add_constant(value);
    if (!index) {
        error("Too many constants in one chunk.");
        return 0;
    }
    return *index;
}

// ---- Contexts and scopes ----

void Compiler::push_context(FunctionType type) {
    contexts_.emplace_back(type);
    Context& ctx = contexts_.back();
    if (type != FunctionType::Script) {
        ctx.function->name = store_.intern(previous_.lexeme);
    }

    // Slot zero holds the callee, or the receiver inside methods
    Local& local = ctx.locals[ctx.local_count++];
    local.depth = 0;
    local.is_captured = false;
    if (type == FunctionType::Method || type == FunctionType::Initializer) {
        local.name = synthetic_token(TokenType::This, "this");
    } else {
        local.name = synthetic_token(TokenType::Identifier, "");
    }
}

Compiler::FinishedFunction Compiler::end_context() {
    emit_return();

    FinishedFunction finished{std::move(context().function), context().upvalues};
    contexts_.pop_back();

    if (code_dump_ != nullptr && !had_error_) {
        std::string name = finished.function->name.is_null()
            ? "<script>"
            : store_.as<StringObject>(finished.function->name).chars;
        finished.function->chunk.disassemble(*code_dump_, name, store_);
    }
    return finished;
}

void Compiler::begin_scope() {
    context().scope_depth++;
}

void Compiler::end_scope() {
    Context& ctx = context();
    ctx.scope_depth--;

    while (ctx.local_count > 0 && ctx.locals[ctx.local_count - 1].depth > ctx.scope_depth) {
        if (ctx.locals[ctx.local_count - 1].is_captured) {
            emit_op(OpCode::OP_CLOSE_UPVALUE);
        } else {
            emit_op(OpCode::OP_POP);
        }
        ctx.local_count--;
    }
}

// ---- Variables ----

uint8_t Compiler::identifier_constant(const Token& name) {
    return make_constant(Value::from_object(store_.intern(name.lexeme)));
}

bool Compiler::identifiers_equal(const Token& a, const Token& b) {
    return a.lexeme == b.lexeme;
}

Token Compiler::synthetic_token(TokenType type, std::string_view text) const {
    return Token(type, text, previous_.line);
}

void Compiler::add_local(const Token& name) {
    Context& ctx = context();
    if (ctx.local_count == kMaxLocals) {
        error("Too many local variables in function.");
        return;
    }

    Local& local = ctx.locals[ctx.local_count++];
    local.name = name;
    local.depth = -1;
    local.is_captured = false;
}

void Compiler::declare_variable() {
    Context& ctx = context();
    if (ctx.scope_depth == 0) return;

    const Token& name = previous_;
    for (size_t i = ctx.local_count; i-- > 0;) {
        const Local& local = ctx.locals[i];
        if (local.depth != -1 && local.depth < ctx.scope_depth) {
            break;
        }
        if (identifiers_equal(name, local.name)) {
            error("Already a variable with this name in this scope.");
        }
    }

    add_local(name);
}

uint8_t Compiler::parse_variable(const char* message) {
    consume(TokenType::Identifier, message);

    declare_variable();
    if (context().scope_depth > 0) return 0;

    return identifier_constant(previous_);
}

void Compiler::mark_initialized() {
    Context& ctx = context();
    if (ctx.scope_depth == 0) return;
    ctx.locals[ctx.local_count - 1].depth = ctx.scope_depth;
}

void Compiler::define_variable(uint8_t global) {
    if (context().scope_depth > 0) {
        mark_initialized();
        return;
    }
    emit_op(OpCode::OP_DEFINE_GLOBAL, global);
}

std::optional<uint8_t> Compiler::resolve_local(size_t context_index, const Token& name) {
    Context& ctx = contexts_[context_index];
    for (size_t i = ctx.local_count; i-- > 0;) {
        const Local& local = ctx.locals[i];
        if (identifiers_equal(name, local.name)) {
            if (local.depth == -1) {
                error("Can't read local variable in its own initializer.");
            }
            return static_cast<uint8_t>(i);
        }
    }
    return std::nullopt;
}

std::optional<uint8_t> Compiler::resolve_upvalue(size_t context_index, const Token& name) {
    if (context_index == 0) return std::nullopt;

    size_t enclosing = context_index - 1;
    if (auto local = resolve_local(enclosing, name)) {
        contexts_[enclosing].locals[*local].is_captured = true;
        return add_upvalue(context_index, *local, true);
    }

    if (auto upvalue = resolve_upvalue(enclosing, name)) {
        return add_upvalue(context_index, *upvalue, false);
    }

    return std::nullopt;
}

uint8_t Compiler::add_upvalue(size_t context_index, uint8_t index, bool is_local) {
    Context& ctx = contexts_[context_index];
    int count = ctx.function->upvalue_count;

    for (int i = 0; i < count; i++) {
        const Upvalue& upvalue = ctx.upvalues[i];
        if (upvalue.index == index && upvalue.is_local == is_local) {
            return static_cast<uint8_t>(i);
        }
    }

    if (static_cast<size_t>(count) == kMaxUpvalues) {
        error("Too many closure variables in function.");
        return 0;
    }

    ctx.upvalues[count].is_local = is_local;
    ctx.upvalues[count].index = index;
    return static_cast<uint8_t>(ctx.function->upvalue_count++);
}

void Compiler::named_variable(const Token& name, bool can_assign) {
    size_t top = contexts_.size() - 1;
    OpCode get_op;
    OpCode set_op;
    uint8_t arg;

    if (auto local = resolve_local(top, name)) {
        arg = *local;
        get_op = OpCode::OP_GET_LOCAL;
        set_op = OpCode::OP_SET_LOCAL;
    } else if (auto upvalue = resolve_upvalue(top, name)) {
        arg = *upvalue;
        get_op = OpCode::OP_GET_UPVALUE;
        set_op = OpCode::OP_SET_UPVALUE;
    } else {
        arg = identifier_constant(name);
        get_op = OpCode::OP_GET_GLOBAL;
        set_op = OpCode::OP_SET_GLOBAL;
    }

    if (can_assign && match(TokenType::Equal)) {
        expression(BindingPower::AssignmentRight);
        emit_op(set_op, arg);
    } else {
        emit_op(get_op, arg);
    }
}

// ---- Declarations ----

void Compiler::declaration() {
    if (match(TokenType::Class)) {
        class_declaration();
    } else if (match(TokenType::Fun)) {
        fun_declaration();
    } else if (match(TokenType::Var)) {
        var_declaration();
    } else {
        statement();
    }

    if (panic_mode_) synchronize();
}

void Compiler::class_declaration() {
    consume(TokenType::Identifier, "Expect class name.");
    Token class_name = previous_;
    uint8_t name_constant = identifier_constant(previous_);
    declare_variable();

    emit_op(OpCode::OP_CLASS, name_constant);
    define_variable(name_constant);

    classes_.push_back(ClassContext{});

    if (match(TokenType::Less)) {
        consume(TokenType::Identifier, "Expect superclass name.");
        named_variable(previous_, false);

        if (identifiers_equal(class_name, previous_)) {
            error("A class can't inherit from itself.");
        }

        begin_scope();
        add_local(synthetic_token(TokenType::Super, "super"));
        define_variable(0);

        named_variable(class_name, false);
        emit_op(OpCode::OP_INHERIT);
        classes_.back().has_superclass = true;
    }

    // Keep the class on the stack while its methods are bound
    named_variable(class_name, false);
    consume(TokenType::LeftBrace, "Expect '{' before class body.");
    while (!check(TokenType::RightBrace) && !check(TokenType::Eof)) {
        method();
    }
    consume(TokenType::RightBrace, "Expect '}' after class body.");
    emit_op(OpCode::OP_POP);

    if (classes_.back().has_superclass) {
        end_scope();
    }
    classes_.pop_back();
}

void Compiler::method() {
    consume(TokenType::Identifier, "Expect method name.");
    uint8_t constant = identifier_constant(previous_);

    FunctionType type = previous_.lexeme == "init"
        ? FunctionType::Initializer
        : FunctionType::Method;
    function(type);

    emit_op(OpCode::OP_METHOD, constant);
}

void Compiler::fun_declaration() {
    uint8_t global = parse_variable("Expect function name.");
    // Initialized before the body so the function can refer to itself
    mark_initialized();
    function(FunctionType::Function);
    define_variable(global);
}

void Compiler::function(FunctionType type) {
    push_context(type);
    begin_scope();

    consume(TokenType::LeftParen, "Expect '(' after function name.");
    if (!check(TokenType::RightParen)) {
        do {
            context().function->arity++;
            if (static_cast<size_t>(context().function->arity) > kMaxParams) {
                error_at_current("Can't have more than 254 parameters.");
            }
            uint8_t constant = parse_variable("Expect parameter name.");
            define_variable(constant);
        } while (match(TokenType::Comma));
    }
    consume(TokenType::RightParen, "Expect ')' after parameters.");
    consume(TokenType::LeftBrace, "Expect '{' before function body.");
    block();

    FinishedFunction finished = end_context();
    int upvalue_count = finished.function->upvalue_count;
    ObjRef function_ref = store_.adopt(std::move(finished.function));

    emit_op(OpCode::OP_CLOSURE, make_constant(Value::from_object(function_ref)));
    for (int i = 0; i < upvalue_count; i++) {
        emit_byte(finished.upvalues[i].is_local ? 1 : 0);
        emit_byte(finished.upvalues[i].index);
    }
}

void Compiler::var_declaration() {
    uint8_t global = parse_variable("Expect variable name.");

    if (match(TokenType::Equal)) {
        expression();
    } else {
        emit_op(OpCode::OP_NIL);
    }
    consume(TokenType::Semicolon, "Expect ';' after variable declaration.");

    define_variable(global);
}

// ---- Statements ----

void Compiler::statement() {
    RecursionGuard guard(*this);

    if (match(TokenType::Print)) {
        print_statement();
    } else if (match(TokenType::For)) {
        for_statement();
    } else if (match(TokenType::If)) {
        if_statement();
    } else if (match(TokenType::Return)) {
        return_statement();
    } else if (match(TokenType::While)) {
        while_statement();
    } else if (match(TokenType::LeftBrace)) {
        begin_scope();
        block();
        end_scope();
    } else {
        expression_statement();
    }
}

void Compiler::print_statement() {
    expression();
    consume(TokenType::Semicolon, "Expect ';' after value.");
    emit_op(OpCode::OP_PRINT);
}

void Compiler::expression_statement() {
    expression();
    consume(TokenType::Semicolon, "Expect ';' after expression.");
    emit_op(OpCode::OP_POP);
}

void Compiler::if_statement() {
    consume(TokenType::LeftParen, "Expect '(' after 'if'.");
    expression();
    consume(TokenType::RightParen, "Expect ')' after condition.");

    size_t then_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE);
    emit_op(OpCode::OP_POP);
    statement();

    size_t else_jump = emit_jump(OpCode::OP_JUMP);
    patch_jump(then_jump);
    emit_op(OpCode::OP_POP);

    if (match(TokenType::Else)) statement();
    patch_jump(else_jump);
}

void Compiler::while_statement() {
    size_t loop_start = current_chunk().size();
    consume(TokenType::LeftParen, "Expect '(' after 'while'.");
    expression();
    consume(TokenType::RightParen, "Expect ')' after condition.");

    size_t exit_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE);
    emit_op(OpCode::OP_POP);
    statement();
    emit_loop(loop_start);

    patch_jump(exit_jump);
    emit_op(OpCode::OP_POP);
}

void Compiler::for_statement() {
    begin_scope();
    consume(TokenType::LeftParen, "Expect '(' after 'for'.");
    if (match(TokenType::Semicolon)) {
        // No initializer
    } else if (match(TokenType::Var)) {
        var_declaration();
    } else {
        expression_statement();
    }

    size_t loop_start = current_chunk().size();
    std::optional<size_t> exit_jump;
    if (!match(TokenType::Semicolon)) {
        expression();
        consume(TokenType::Semicolon, "Expect ';' after loop condition.");

        exit_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE);
        emit_op(OpCode::OP_POP);
    }

    if (!match(TokenType::RightParen)) {
        size_t body_jump = emit_jump(OpCode::OP_JUMP);
        size_t increment_start = current_chunk().size();
        expression();
        emit_op(OpCode::OP_POP);
        consume(TokenType::RightParen, "Expect ')' after for clauses.");

        emit_loop(loop_start);
        loop_start = increment_start;
        patch_jump(body_jump);
    }

    statement();
    emit_loop(loop_start);

    if (exit_jump) {
        patch_jump(*exit_jump);
        emit_op(OpCode::OP_POP);
    }

    end_scope();
}

void Compiler::return_statement() {
    if (context().type == FunctionType::Script) {
        error("Can't return from top-level code.");
    }

    if (match(TokenType::Semicolon)) {
        emit_return();
        return;
    }

    if (context().type == FunctionType::Initializer) {
        error("Can't return a value from an initializer.");
    }

    expression();
    consume(TokenType::Semicolon, "Expect ';' after return value.");
    emit_op(OpCode::OP_RETURN);
}

void Compiler::block() {
    while (!check(TokenType::RightBrace) && !check(TokenType::Eof)) {
        declaration();
    }
    consume(TokenType::RightBrace, "Expect '}' after block.");
}

// ---- Expressions ----

void Compiler::expression(BindingPower min_bp) {
    RecursionGuard guard(*this);

    advance();
    bool can_assign = min_bp <= BindingPower::AssignmentLeft;
    if (!prefix(previous_.type, can_assign)) {
        return;
    }

    while (true) {
        auto bp = infix_binding_power(current_.type);
        if (!bp || bp->left < min_bp) break;

        advance();
        infix(previous_.type, bp->right, can_assign);
    }
}

bool Compiler::prefix(TokenType type, bool can_assign) {
    switch (type) {
        case TokenType::Number:
            number();
            return true;
        case TokenType::String:
            string();
            return true;
        case TokenType::True:
            emit_op(OpCode::OP_TRUE);
            return true;
        case TokenType::False:
            emit_op(OpCode::OP_FALSE);
            return true;
        case TokenType::Nil:
            emit_op(OpCode::OP_NIL);
            return true;
        case TokenType::Identifier:
            named_variable(previous_, can_assign);
            return true;
        case TokenType::This:
            this_();
            return true;
        case TokenType::Super:
            super_();
            return true;
        default:
            break;
    }

    auto bp = prefix_binding_power(type);
    if (!bp) {
        error("Expect expression.");
        return false;
    }

    switch (type) {
        case TokenType::LeftParen:
            expression(*bp);
            consume(TokenType::RightParen, "Expect ')' after expression.");
            break;
        case TokenType::Minus:
            expression(*bp);
            emit_op(OpCode::OP_NEGATE);
            break;
        case TokenType::Bang:
            expression(*bp);
            emit_op(OpCode::OP_NOT);
            break;
        default:
            break;
    }
    return true;
}

void Compiler::infix(TokenType type, BindingPower right, bool can_assign) {
    switch (type) {
        case TokenType::And:
            and_(right);
            return;
        case TokenType::Or:
            or_(right);
            return;
        case TokenType::LeftParen:
            emit_op(OpCode::OP_CALL, argument_list());
            return;
        case TokenType::Dot:
            dot(can_assign);
            return;
        case TokenType::Equal:
            // Assignable targets consume '=' themselves
            error("Invalid assignment target.");
            expression(right);
            return;
        default:
            break;
    }

    expression(right);

    switch (type) {
        case TokenType::BangEqual:
            emit_op(OpCode::OP_EQUAL);
            emit_op(OpCode::OP_NOT);
            break;
        case TokenType::EqualEqual:
            emit_op(OpCode::OP_EQUAL);
            break;
        case TokenType::Greater:
            emit_op(OpCode::OP_GREATER);
            break;
        case TokenType::GreaterEqual:
            emit_op(OpCode::OP_LESS);
            emit_op(OpCode::OP_NOT);
            break;
        case TokenType::Less:
            emit_op(OpCode::OP_LESS);
            break;
        case TokenType::LessEqual:
            emit_op(OpCode::OP_GREATER);
            emit_op(OpCode::OP_NOT);
            break;
        case TokenType::Plus:
            emit_op(OpCode::OP_ADD);
            break;
        case TokenType::Minus:
            emit_op(OpCode::OP_SUBTRACT);
            break;
        case TokenType::Star:
            emit_op(OpCode::OP_MULTIPLY);
            break;
        case TokenType::Slash:
            emit_op(OpCode::OP_DIVIDE);
            break;
        default:
            break;
    }
}

void Compiler::number() {
    std::string text(previous_.lexeme);
    double value = std::strtod(text.c_str(), nullptr);
    emit_op(OpCode::OP_CONSTANT, make_constant(Value::from_number(value)));
}

void Compiler::string() {
    ObjRef ref = store_.intern(previous_.lexeme);
    emit_op(OpCode::OP_CONSTANT, make_constant(Value::from_object(ref)));
}

void Compiler::this_() {
    if (classes_.empty()) {
        error("Can't use 'this' outside of a class.");
        return;
    }
    named_variable(previous_, false);
}

void Compiler::super_() {
    if (classes_.empty()) {
        error("Can't use 'super' outside of a class.");
    } else if (!classes_.back().has_superclass) {
        error("Can't use 'super' in a class with no superclass.");
    }

    consume(TokenType::Dot, "Expect '.' after 'super'.");
    consume(TokenType::Identifier, "Expect superclass method name.");
    uint8_t name = identifier_constant(previous_);

    named_variable(synthetic_token(TokenType::This, "this"), false);
    if (match(TokenType::LeftParen)) {
        uint8_t arg_count = argument_list();
        named_variable(synthetic_token(TokenType::Super, "super"), false);
        emit_op(OpCode::OP_SUPER_INVOKE, name);
        emit_byte(arg_count);
    } else {
        named_variable(synthetic_token(TokenType::Super, "super"), false);
        emit_op(OpCode::OP_GET_SUPER, name);
    }
}

void Compiler::and_(BindingPower right) {
    size_t end_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE);

    emit_op(OpCode::OP_POP);
    expression(right);

    patch_jump(end_jump);
}

void Compiler::or_(BindingPower right) {
    size_t else_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE);
    size_t end_jump = emit_jump(OpCode::OP_JUMP);

    patch_jump(else_jump);
    emit_op(OpCode::OP_POP);

    expression(right);
    patch_jump(end_jump);
}

void Compiler::dot(bool can_assign) {
    consume(TokenType::Identifier, "Expect property name after '.'.");
    uint8_t name = identifier_constant(previous_);

    if (can_assign && match(TokenType::Equal)) {
        expression(BindingPower::AssignmentRight);
        emit_op(OpCode::OP_SET_PROPERTY, name);
    } else if (match(TokenType::LeftParen)) {
        uint8_t arg_count = argument_list();
        emit_op(OpCode::OP_INVOKE, name);
        emit_byte(arg_count);
    } else {
        emit_op(OpCode::OP_GET_PROPERTY, name);
    }
}

uint8_t Compiler::argument_list() {
    size_t arg_count = 0;
    if (!check(TokenType::RightParen)) {
        do {
            expression();
            if (arg_count == kMaxArgs) {
                error("Can't have more than 255 arguments.");
            }
            arg_count++;
        } while (match(TokenType::Comma));
    }
    consume(TokenType::RightParen, "Expect ')' after arguments.");
    return static_cast<uint8_t>(arg_count > kMaxArgs ? kMaxArgs : arg_count);
}

} // namespace loxvm
