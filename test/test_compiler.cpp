#include <gtest/gtest.h>
#include <initializer_list>
#include <sstream>
#include <vector>
#include "lx_binding_power.hpp"
#include "lx_compiler.hpp"
#include "test_helpers.hpp"

using namespace loxvm;
using namespace loxvm::test;

namespace {

uint8_t op(OpCode code) {
    return static_cast<uint8_t>(code);
}

std::vector<uint8_t> bytes(std::initializer_list<int> values) {
    std::vector<uint8_t> out;
    for (int v : values) out.push_back(static_cast<uint8_t>(v));
    return out;
}

// Compiles successfully or fails the test with the diagnostics
const FunctionObject& compile_script(ObjectStore& store, std::string_view source) {
    std::ostringstream errors;
    ObjRef script;
    try {
        script = compile_source(store, source, errors);
    } catch (const CompilerError&) {
        ADD_FAILURE() << "unexpected compile error: " << errors.str();
        throw;
    }
    return store.as<FunctionObject>(script);
}

// First function constant in `fn`'s pool
const FunctionObject* find_function(const ObjectStore& store, const FunctionObject& fn) {
    for (const Value& v : fn.chunk.constants) {
        if (store.is<FunctionObject>(v)) {
            return &store.as<FunctionObject>(v.as_object());
        }
    }
    return nullptr;
}

} // namespace

// ---- Binding powers ----

TEST(BindingPowerTests, AssignmentIsRightAssociative) {
    auto bp = infix_binding_power(TokenType::Equal);
    ASSERT_TRUE(bp.has_value());
    EXPECT_LT(bp->right, bp->left);
}

TEST(BindingPowerTests, ArithmeticIsLeftAssociative) {
    for (TokenType type : {TokenType::Plus, TokenType::Minus, TokenType::Star, TokenType::Slash}) {
        auto bp = infix_binding_power(type);
        ASSERT_TRUE(bp.has_value());
        EXPECT_GT(bp->right, bp->left);
    }
}

TEST(BindingPowerTests, FactorBindsTighterThanTerm) {
    auto term = infix_binding_power(TokenType::Plus);
    auto factor = infix_binding_power(TokenType::Star);
    auto compare = infix_binding_power(TokenType::Less);
    auto equality = infix_binding_power(TokenType::EqualEqual);
    EXPECT_GT(factor->left, term->right);
    EXPECT_GT(term->left, compare->right);
    EXPECT_GT(compare->left, equality->right);
}

TEST(BindingPowerTests, AndOrShareOneLevel) {
    auto and_bp = infix_binding_power(TokenType::And);
    auto or_bp = infix_binding_power(TokenType::Or);
    EXPECT_EQ(and_bp->left, or_bp->left);
    EXPECT_EQ(and_bp->right, or_bp->right);
}

TEST(BindingPowerTests, PrefixOperators) {
    EXPECT_EQ(prefix_binding_power(TokenType::Minus), BindingPower::Unary);
    EXPECT_EQ(prefix_binding_power(TokenType::Bang), BindingPower::Unary);
    EXPECT_EQ(prefix_binding_power(TokenType::LeftParen), BindingPower::Group);
    EXPECT_FALSE(prefix_binding_power(TokenType::Plus).has_value());
    EXPECT_FALSE(infix_binding_power(TokenType::Semicolon).has_value());
}

// ---- Emitted bytecode ----

TEST(CompilerTests, ArithmeticPrint) {
    ObjectStore store;
    const FunctionObject& script = compile_script(store, "print 1 + 2 * 3;");

    EXPECT_EQ(script.chunk.code, bytes({
        op(OpCode::OP_CONSTANT), 0,
        op(OpCode::OP_CONSTANT), 1,
        op(OpCode::OP_CONSTANT), 2,
        op(OpCode::OP_MULTIPLY),
        op(OpCode::OP_ADD),
        op(OpCode::OP_PRINT),
        op(OpCode::OP_NIL),
        op(OpCode::OP_RETURN),
    }));
    EXPECT_TRUE(script.name.is_null());
    EXPECT_EQ(script.arity, 0);
}

TEST(CompilerTests, NegatedComparisonsUseTwoOps) {
    ObjectStore store;
    const FunctionObject& script = compile_script(store, "1 >= 2; 1 <= 2; 1 != 2;");

    EXPECT_EQ(script.chunk.code, bytes({
        op(OpCode::OP_CONSTANT), 0, op(OpCode::OP_CONSTANT), 1,
        op(OpCode::OP_LESS), op(OpCode::OP_NOT), op(OpCode::OP_POP),
        op(OpCode::OP_CONSTANT), 2, op(OpCode::OP_CONSTANT), 3,
        op(OpCode::OP_GREATER), op(OpCode::OP_NOT), op(OpCode::OP_POP),
        op(OpCode::OP_CONSTANT), 4, op(OpCode::OP_CONSTANT), 5,
        op(OpCode::OP_EQUAL), op(OpCode::OP_NOT), op(OpCode::OP_POP),
        op(OpCode::OP_NIL), op(OpCode::OP_RETURN),
    }));
}

TEST(CompilerTests, GlobalDefineAndAssign) {
    ObjectStore store;
    const FunctionObject& script = compile_script(store, "var a = 1; a = 2;");

    EXPECT_EQ(script.chunk.code, bytes({
        op(OpCode::OP_CONSTANT), 1,
        op(OpCode::OP_DEFINE_GLOBAL), 0,
        op(OpCode::OP_CONSTANT), 3,
        op(OpCode::OP_SET_GLOBAL), 2,
        op(OpCode::OP_POP),
        op(OpCode::OP_NIL),
        op(OpCode::OP_RETURN),
    }));
    EXPECT_EQ(script.chunk.constants[0].to_string(store), "a");
}

TEST(CompilerTests, LocalsLiveInStackSlots) {
    ObjectStore store;
    const FunctionObject& script = compile_script(store, "{ var a = 1; var b = a; print b; }");

    EXPECT_EQ(script.chunk.code, bytes({
        op(OpCode::OP_CONSTANT), 0,
        op(OpCode::OP_GET_LOCAL), 1,
        op(OpCode::OP_GET_LOCAL), 2,
        op(OpCode::OP_PRINT),
        op(OpCode::OP_POP),
        op(OpCode::OP_POP),
        op(OpCode::OP_NIL),
        op(OpCode::OP_RETURN),
    }));
}

TEST(CompilerTests, IfElseJumps) {
    ObjectStore store;
    const FunctionObject& script = compile_script(store, "if (true) print 1;");

    EXPECT_EQ(script.chunk.code, bytes({
        op(OpCode::OP_TRUE),
        op(OpCode::OP_JUMP_IF_FALSE), 0, 7,
        op(OpCode::OP_POP),
        op(OpCode::OP_CONSTANT), 0,
        op(OpCode::OP_PRINT),
        op(OpCode::OP_JUMP), 0, 1,
        op(OpCode::OP_POP),
        op(OpCode::OP_NIL),
        op(OpCode::OP_RETURN),
    }));
}

TEST(CompilerTests, WhileLoopJumpsBack) {
    ObjectStore store;
    const FunctionObject& script = compile_script(store, "while (false) print 1;");

    // 0 FALSE, 1 JUMP_IF_FALSE, 4 POP, 5 CONSTANT, 7 PRINT, 8 LOOP, 11 POP
    EXPECT_EQ(script.chunk.code, bytes({
        op(OpCode::OP_FALSE),
        op(OpCode::OP_JUMP_IF_FALSE), 0, 7,
        op(OpCode::OP_POP),
        op(OpCode::OP_CONSTANT), 0,
        op(OpCode::OP_PRINT),
        op(OpCode::OP_LOOP), 0, 11,
        op(OpCode::OP_POP),
        op(OpCode::OP_NIL),
        op(OpCode::OP_RETURN),
    }));
}

TEST(CompilerTests, FunctionDeclarationEmitsClosure) {
    ObjectStore store;
    const FunctionObject& script = compile_script(store, "fun add(a, b) { return a + b; }");

    const FunctionObject* add = find_function(store, script);
    ASSERT_NE(add, nullptr);
    EXPECT_EQ(add->arity, 2);
    EXPECT_EQ(add->upvalue_count, 0);
    EXPECT_EQ(store.as<StringObject>(add->name).chars, "add");
    EXPECT_EQ(add->chunk.code, bytes({
        op(OpCode::OP_GET_LOCAL), 1,
        op(OpCode::OP_GET_LOCAL), 2,
        op(OpCode::OP_ADD),
        op(OpCode::OP_RETURN),
        op(OpCode::OP_NIL),
        op(OpCode::OP_RETURN),
    }));

    EXPECT_EQ(script.chunk.code[0], op(OpCode::OP_CLOSURE));
    EXPECT_EQ(script.chunk.code[2], op(OpCode::OP_DEFINE_GLOBAL));
}

TEST(CompilerTests, CapturedVariableIsRecordedOnce) {
    ObjectStore store;
    const FunctionObject& script = compile_script(store, R"(
        fun outer() {
            var x = 1;
            fun inner() { return x + x; }
            return inner;
        }
    )");

    const FunctionObject* outer = find_function(store, script);
    ASSERT_NE(outer, nullptr);
    const FunctionObject* inner = find_function(store, *outer);
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->upvalue_count, 1);

    // OP_CLOSURE <const> is_local=1 index=1, then the local `inner` is read back
    const auto& code = outer->chunk.code;
    ASSERT_GE(code.size(), 6u);
    EXPECT_EQ(code[2], op(OpCode::OP_CLOSURE));
    EXPECT_EQ(code[4], 1);
    EXPECT_EQ(code[5], 1);
    EXPECT_EQ(code[6], op(OpCode::OP_GET_LOCAL));
}

TEST(CompilerTests, UpvaluesThreadThroughIntermediateFunctions) {
    ObjectStore store;
    const FunctionObject& script = compile_script(store, R"(
        fun a() {
            var x = 1;
            fun b() {
                fun c() { print x; }
                return c;
            }
            return b;
        }
    )");

    const FunctionObject* a = find_function(store, script);
    ASSERT_NE(a, nullptr);
    const FunctionObject* b = find_function(store, *a);
    ASSERT_NE(b, nullptr);
    const FunctionObject* c = find_function(store, *b);
    ASSERT_NE(c, nullptr);

    EXPECT_EQ(b->upvalue_count, 1);
    EXPECT_EQ(c->upvalue_count, 1);

    // b captures a's local slot 1; c captures b's upvalue 0
    EXPECT_EQ(a->chunk.code[4], 1);
    EXPECT_EQ(a->chunk.code[5], 1);
    EXPECT_EQ(b->chunk.code[0], op(OpCode::OP_CLOSURE));
    EXPECT_EQ(b->chunk.code[2], 0);
    EXPECT_EQ(b->chunk.code[3], 0);
}

TEST(CompilerTests, CapturedLocalIsClosedAtScopeEnd) {
    ObjectStore store;
    const FunctionObject& script = compile_script(store, R"(
        {
            var x = 1;
            fun f() { return x; }
        }
    )");

    const auto& code = script.chunk.code;
    ASSERT_GE(code.size(), 4u);
    // ... POP (f), CLOSE_UPVALUE (x), NIL, RETURN
    EXPECT_EQ(code[code.size() - 4], op(OpCode::OP_POP));
    EXPECT_EQ(code[code.size() - 3], op(OpCode::OP_CLOSE_UPVALUE));
}

TEST(CompilerTests, InitializerReturnsReceiver) {
    ObjectStore store;
    const FunctionObject& script = compile_script(store, "class A { init() { return; } }");

    // The method closure sits in the script's pool after the class and method names
    const FunctionObject* init = find_function(store, script);
    ASSERT_NE(init, nullptr);
    EXPECT_EQ(init->chunk.code, bytes({
        op(OpCode::OP_GET_LOCAL), 0,
        op(OpCode::OP_RETURN),
        op(OpCode::OP_GET_LOCAL), 0,
        op(OpCode::OP_RETURN),
    }));
}

TEST(CompilerTests, CodeDumpDisassemblesEveryFunction) {
    ObjectStore store;
    std::ostringstream errors;
    std::ostringstream dump;
    Compiler compiler("fun f() {} print f;", store, errors);
    compiler.set_code_dump(&dump);
    compiler.compile();

    std::string text = dump.str();
    EXPECT_NE(text.find("== f =="), std::string::npos);
    EXPECT_NE(text.find("== <script> =="), std::string::npos);
    EXPECT_LT(text.find("== f =="), text.find("== <script> =="));
}

// ---- Diagnostics ----

TEST(CompileErrorTests, MissingExpressionAtEnd) {
    EXPECT_EQ(compile_errors("print 1 +"), "[line 1] Error at end: Expect expression.\n");
}

TEST(CompileErrorTests, MissingExpressionAtToken) {
    EXPECT_EQ(compile_errors("print ;"), "[line 1] Error at ';': Expect expression.\n");
}

TEST(CompileErrorTests, MissingSemicolon) {
    EXPECT_EQ(compile_errors("print 1\nprint 2;"),
              "[line 2] Error at 'print': Expect ';' after value.\n");
}

TEST(CompileErrorTests, ScannerErrorsHaveNoLexeme) {
    EXPECT_EQ(compile_errors("print \"open;"), "[line 1] Error: Unterminated string.\n");
    EXPECT_EQ(compile_errors("var a = 1 @ 2;"), "[line 1] Error: Unexpected character.\n");
}

TEST(CompileErrorTests, InvalidAssignmentTarget) {
    EXPECT_EQ(compile_errors("var a; var b; var c; a + b = c;"),
              "[line 1] Error at '=': Invalid assignment target.\n");
    EXPECT_EQ(compile_errors("1 = 2;"),
              "[line 1] Error at '=': Invalid assignment target.\n");
}

TEST(CompileErrorTests, ReturnOutsideFunction) {
    EXPECT_EQ(compile_errors("return 1;"),
              "[line 1] Error at 'return': Can't return from top-level code.\n");
}

TEST(CompileErrorTests, ReturnValueFromInitializer) {
    EXPECT_EQ(compile_errors("class A { init() { return 1; } }"),
              "[line 1] Error at 'return': Can't return a value from an initializer.\n");
}

TEST(CompileErrorTests, ThisAndSuperOutsideClass) {
    EXPECT_EQ(compile_errors("print this;"),
              "[line 1] Error at 'this': Can't use 'this' outside of a class.\n");
    EXPECT_EQ(compile_errors("fun f() { super.g(); }"),
              "[line 1] Error at 'super': Can't use 'super' outside of a class.\n");
    EXPECT_EQ(compile_errors("class A { f() { super.f(); } }"),
              "[line 1] Error at 'super': Can't use 'super' in a class with no superclass.\n");
}

TEST(CompileErrorTests, ClassCannotInheritFromItself) {
    EXPECT_EQ(compile_errors("class A < A {}"),
              "[line 1] Error at 'A': A class can't inherit from itself.\n");
}

TEST(CompileErrorTests, LocalInOwnInitializer) {
    EXPECT_EQ(compile_errors("{ var a = a; }"),
              "[line 1] Error at 'a': Can't read local variable in its own initializer.\n");
}

TEST(CompileErrorTests, DuplicateLocal) {
    EXPECT_EQ(compile_errors("{ var a = 1; var a = 2; }"),
              "[line 1] Error at 'a': Already a variable with this name in this scope.\n");
    // Redeclaring a global is fine
    EXPECT_EQ(compile_errors("var a = 1; var a = 2;"), "");
}

TEST(CompileErrorTests, SynchronizeReportsOneErrorPerStatement) {
    std::string errors = compile_errors("print ;\nprint ;\nvar x = 1;\nx = ;");
    EXPECT_EQ(errors,
              "[line 1] Error at ';': Expect expression.\n"
              "[line 2] Error at ';': Expect expression.\n"
              "[line 4] Error at ';': Expect expression.\n");
}

TEST(CompileErrorTests, ThrowsWithFirstErrorAndCount) {
    ObjectStore store;
    std::ostringstream errors;
    try {
        compile_source(store, "print ;\n\nprint ;", errors);
        FAIL() << "expected CompilerError";
    } catch (const CompilerError& e) {
        EXPECT_EQ(e.line(), 1u);
        EXPECT_EQ(e.error_count(), 2u);
        EXPECT_NE(std::string(e.what()).find("Expect expression."), std::string::npos);
    }
}

TEST(CompileErrorTests, TooManyConstants) {
    std::string source = "print 0";
    for (int i = 1; i <= 256; i++) {
        source += " + " + std::to_string(i);
    }
    source += ";";
    EXPECT_NE(compile_errors(source).find("Too many constants in one chunk."), std::string::npos);
}

TEST(CompileErrorTests, TooManyArguments) {
    std::string source = "fun f() {} f(";
    for (int i = 0; i < 256; i++) {
        if (i > 0) source += ", ";
        source += "nil";
    }
    source += ");";
    EXPECT_NE(compile_errors(source).find("Can't have more than 255 arguments."), std::string::npos);
}

TEST(CompileErrorTests, TooManyParameters) {
    std::string source = "fun f(";
    for (int i = 0; i < 300; i++) {
        if (i > 0) source += ", ";
        source += "p" + std::to_string(i);
    }
    source += ") {}";
    EXPECT_EQ(compile_errors(source), "[line 1] Error at 'p254': Can't have more than 254 parameters.\n");
}

TEST(CompileErrorTests, TooManyLocals) {
    // Slot zero is reserved, so the 255th declared local overflows.
    std::string source = "{";
    for (int i = 0; i < 255; i++) {
        source += " var v" + std::to_string(i) + ";";
    }
    source += " }";
    EXPECT_EQ(compile_errors(source), "[line 1] Error at 'v254': Too many local variables in function.\n");
}

TEST(CompileErrorTests, TooManyClosureVariables) {
    // 400 distinct captures spread over two enclosing functions.
    std::string outer_locals;
    std::string middle_locals;
    std::string uses;
    for (int i = 0; i < 200; i++) {
        outer_locals += "var a" + std::to_string(i) + "; ";
        middle_locals += "var b" + std::to_string(i) + "; ";
        uses += "a" + std::to_string(i) + "; b" + std::to_string(i) + "; ";
    }
    std::string source = "fun outer() { " + outer_locals +
                         "fun middle() { " + middle_locals +
                         "fun inner() { " + uses + "} } }";
    std::string errors = compile_errors(source);
    EXPECT_NE(errors.find("Too many closure variables in function."), std::string::npos) << errors;
    EXPECT_EQ(errors.find("Too many local variables"), std::string::npos) << errors;
}

TEST(CompileErrorTests, IfBodyTooLargeToJumpOver) {
    std::string source = "if (true) {";
    for (int i = 0; i < 33000; i++) source += " nil;";
    source += " }";
    std::string errors = compile_errors(source);
    EXPECT_NE(errors.find("Too much code to jump over."), std::string::npos) << errors;
}

TEST(CompileErrorTests, WhileBodyTooLargeToLoop) {
    std::string source = "while (false) {";
    for (int i = 0; i < 33000; i++) source += " nil;";
    source += " }";
    // The loop error comes first; the exit jump error is suppressed.
    EXPECT_EQ(compile_errors(source), "[line 1] Error at '}': Loop body too large.\n");
}
