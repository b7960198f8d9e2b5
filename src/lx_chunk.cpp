// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_chunk.cpp
 * @brief Chunk emission helpers and disassembler.
 */

#include "lx_chunk.hpp"
#include "lx_object.hpp"
#include "lx_object_store.hpp"
#include <iomanip>

namespace loxvm {

namespace {

void write_name(std::ostream& out, const char* name) {
    out << std::left << std::setw(16) << name << std::right;
}

void write_operand(std::ostream& out, size_t operand) {
    out << ' ' << std::setw(4) << operand;
}

} // namespace

void Chunk::write(uint8_t byte, uint32_t line) {
    code.push_back(byte);
    lines.push_back(line);
}

void Chunk::write_op(OpCode op, uint32_t line) {
    write(static_cast<uint8_t>(op), line);
}

std::optional<uint8_t> Chunk::add_constant(Value value) {
    if (constants.size() >= kMaxConstants) {
        return std::nullopt;
    }
    constants.push_back(value);
    return static_cast<uint8_t>(constants.size() - 1);
}

size_t Chunk::emit_jump(OpCode op, uint32_t line) {
    write_op(op, line);
    write(0xFF, line);
    write(0xFF, line);
    return code.size() - 2;
}

bool Chunk::patch_jump(size_t offset) {
    // -2 to adjust for the jump offset itself
    size_t jump = code.size() - offset - 2;
    if (jump > kMaxJump) {
        return false;
    }

    code[offset] = (jump >> 8) & 0xFF;
    code[offset + 1] = jump & 0xFF;
    return true;
}

bool Chunk::emit_loop(size_t loop_start, uint32_t line) {
    write_op(OpCode::OP_LOOP, line);

    size_t offset = code.size() - loop_start + 2;
    bool fits = offset <= kMaxJump;
    if (!fits) {
        offset = 0;
    }

    write((offset >> 8) & 0xFF, line);
    write(offset & 0xFF, line);
    return fits;
}

void Chunk::disassemble(std::ostream& out, std::string_view name, const ObjectStore& store) const {
    out << "== " << name << " ==\n";
    for (size_t offset = 0; offset < code.size();) {
        offset = disassemble_instruction(out, offset, store);
    }
}

size_t Chunk::disassemble_instruction(std::ostream& out, size_t offset, const ObjectStore& store) const {
    out << std::right << std::setfill('0') << std::setw(4) << offset << std::setfill(' ') << ' ';

    if (offset > 0 && lines[offset] == lines[offset - 1]) {
        out << "   | ";
    } else {
        out << std::setw(4) << lines[offset] << ' ';
    }

    OpCode instruction = static_cast<OpCode>(code[offset]);
    switch (instruction) {
        case OpCode::OP_CONSTANT:
        case OpCode::OP_GET_GLOBAL:
        case OpCode::OP_DEFINE_GLOBAL:
        case OpCode::OP_SET_GLOBAL:
        case OpCode::OP_GET_PROPERTY:
        case OpCode::OP_SET_PROPERTY:
        case OpCode::OP_GET_SUPER:
        case OpCode::OP_CLASS:
        case OpCode::OP_METHOD:
            return constant_instruction(out, opcode_name(instruction), offset, store);
        case OpCode::OP_GET_LOCAL:
        case OpCode::OP_SET_LOCAL:
        case OpCode::OP_GET_UPVALUE:
        case OpCode::OP_SET_UPVALUE:
        case OpCode::OP_CALL:
            return byte_instruction(out, opcode_name(instruction), offset);
        case OpCode::OP_JUMP:
        case OpCode::OP_JUMP_IF_FALSE:
            return jump_instruction(out, opcode_name(instruction), 1, offset);
        case OpCode::OP_LOOP:
            return jump_instruction(out, opcode_name(instruction), -1, offset);
        case OpCode::OP_INVOKE:
        case OpCode::OP_SUPER_INVOKE:
            return invoke_instruction(out, opcode_name(instruction), offset, store);
        case OpCode::OP_CLOSURE:
            return closure_instruction(out, offset, store);
        case OpCode::OP_NIL:
        case OpCode::OP_TRUE:
        case OpCode::OP_FALSE:
        case OpCode::OP_POP:
        case OpCode::OP_EQUAL:
        case OpCode::OP_GREATER:
        case OpCode::OP_LESS:
        case OpCode::OP_ADD:
        case OpCode::OP_SUBTRACT:
        case OpCode::OP_MULTIPLY:
        case OpCode::OP_DIVIDE:
        case OpCode::OP_NOT:
        case OpCode::OP_NEGATE:
        case OpCode::OP_PRINT:
        case OpCode::OP_CLOSE_UPVALUE:
        case OpCode::OP_RETURN:
        case OpCode::OP_INHERIT:
            return simple_instruction(out, opcode_name(instruction), offset);
        case OpCode::OP_UNKNOWN:
            break;
    }

    out << "Unknown opcode " << static_cast<int>(code[offset]) << "\n";
    return offset + 1;
}

size_t Chunk::simple_instruction(std::ostream& out, const char* name, size_t offset) const {
    out << name << "\n";
    return offset + 1;
}

size_t Chunk::byte_instruction(std::ostream& out, const char* name, size_t offset) const {
    write_name(out, name);
    write_operand(out, code[offset + 1]);
    out << "\n";
    return offset + 2;
}

size_t Chunk::constant_instruction(std::ostream& out, const char* name, size_t offset,
                                   const ObjectStore& store) const {
    uint8_t constant = code[offset + 1];
    write_name(out, name);
    write_operand(out, constant);
    out << " '" << constants[constant].to_string(store) << "'\n";
    return offset + 2;
}

size_t Chunk::invoke_instruction(std::ostream& out, const char* name, size_t offset,
                                 const ObjectStore& store) const {
    uint8_t constant = code[offset + 1];
    uint8_t arg_count = code[offset + 2];
    write_name(out, name);
    out << " (" << static_cast<int>(arg_count) << " args)";
    write_operand(out, constant);
    out << " '" << constants[constant].to_string(store) << "'\n";
    return offset + 3;
}

size_t Chunk::jump_instruction(std::ostream& out, const char* name, int sign, size_t offset) const {
    uint16_t jump = read_short(offset + 1);
    long target = static_cast<long>(offset) + 3 + sign * static_cast<long>(jump);
    write_name(out, name);
    write_operand(out, offset);
    out << " -> " << target << "\n";
    return offset + 3;
}

size_t Chunk::closure_instruction(std::ostream& out, size_t offset, const ObjectStore& store) const {
    offset++;
    uint8_t constant = code[offset++];
    write_name(out, "OP_CLOSURE");
    write_operand(out, constant);
    out << ' ' << constants[constant].to_string(store) << "\n";

    const auto& function = store.as<FunctionObject>(constants[constant].as_object());
    for (int i = 0; i < function.upvalue_count; i++) {
        bool is_local = code[offset] != 0;
        int index = code[offset + 1];
        out << std::setfill('0') << std::setw(4) << offset << std::setfill(' ')
            << "      |                     "
            << (is_local ? "local" : "upvalue") << ' ' << index << "\n";
        offset += 2;
    }
    return offset;
}

} // namespace loxvm
