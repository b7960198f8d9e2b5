// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_chunk.hpp
 * @brief Bytecode container.
 *
 * A Chunk is one function's compiled bytecode with a parallel line table
 * (lines[i] is the source line of code[i]) and a constant pool addressed
 * by one-byte indices.
 */

#pragma once

#include "lx_opcodes.hpp"
#include "lx_value.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace loxvm {

struct Chunk {
    static constexpr size_t kMaxConstants = 256;
    static constexpr size_t kMaxJump = UINT16_MAX;

    std::vector<uint8_t> code;
    std::vector<uint32_t> lines;
    std::vector<Value> constants;

    void write(uint8_t byte, uint32_t line);
    void write_op(OpCode op, uint32_t line);

    // Returns the new constant's index, or nullopt when the pool is full.
    std::optional<uint8_t> add_constant(Value value);

    // Emits a jump with a placeholder offset and returns the offset of
    // the placeholder for patch_jump.
    size_t emit_jump(OpCode op, uint32_t line);

    // Returns false if the jump distance does not fit in 16 bits.
    bool patch_jump(size_t offset);

    // Emits OP_LOOP back to loop_start. False if the body is too large.
    bool emit_loop(size_t loop_start, uint32_t line);

    size_t size() const { return code.size(); }
    uint16_t read_short(size_t offset) const {
        return static_cast<uint16_t>((code[offset] << 8) | code[offset + 1]);
    }

    // Debug
    void disassemble(std::ostream& out, std::string_view name, const ObjectStore& store) const;
    size_t disassemble_instruction(std::ostream& out, size_t offset, const ObjectStore& store) const;

private:
    size_t simple_instruction(std::ostream& out, const char* name, size_t offset) const;
    size_t byte_instruction(std::ostream& out, const char* name, size_t offset) const;
    size_t constant_instruction(std::ostream& out, const char* name, size_t offset, const ObjectStore& store) const;
    size_t invoke_instruction(std::ostream& out, const char* name, size_t offset, const ObjectStore& store) const;
    size_t jump_instruction(std::ostream& out, const char* name, int sign, size_t offset) const;
    size_t closure_instruction(std::ostream& out, size_t offset, const ObjectStore& store) const;
};

} // namespace loxvm
