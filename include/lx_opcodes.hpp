#pragma once

#include <cstdint>

namespace loxvm {

// Bytecode instructions. Values are contiguous from zero in the order of
// lx_opcodes.def; OP_UNKNOWN is never emitted.
enum class OpCode : uint8_t {
#define X(name, width) name,
#include "lx_opcodes.def"
#undef X
    OP_UNKNOWN = 255
};

constexpr int kOpCodeCount = 0
#define X(name, width) + 1
#include "lx_opcodes.def"
#undef X
    ;

static_assert(kOpCodeCount == 37, "Instruction set size changed");

inline const char* opcode_name(OpCode op) {
    switch (op) {
#define X(name, width) case OpCode::name: return #name;
#include "lx_opcodes.def"
#undef X
        default: return "OP_UNKNOWN";
    }
}

// Operand byte count following the opcode, -1 for OP_CLOSURE whose
// operands depend on the function's upvalue count, 0 for unknown bytes.
inline int opcode_operand_width(OpCode op) {
    switch (op) {
#define X(name, width) case OpCode::name: return width;
#include "lx_opcodes.def"
#undef X
        default: return 0;
    }
}

} // namespace loxvm
