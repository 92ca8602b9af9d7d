#pragma once

#include <cstdint>

#include "error.hpp"

namespace Chip8Vm {

// One value per supported opcode pattern. Operands live in Instruction;
// which fields are meaningful depends on the opcode (see the table in
// instruction.cpp).
enum class Opcode : uint8_t {
    Clear,             // 00E0
    Return,            // 00EE
    Jump,              // 1nnn
    Call,              // 2nnn
    SkipEqImm,         // 3xkk
    SkipNeqImm,        // 4xkk
    SkipEqReg,         // 5xy0
    LoadImm,           // 6xkk
    AddImm,            // 7xkk
    Copy,              // 8xy0
    Or,                // 8xy1
    And,               // 8xy2
    Xor,               // 8xy3
    AddReg,            // 8xy4
    SubReg,            // 8xy5  Vx = Vx - Vy
    ShiftRight,        // 8xy6
    SubRegReverse,     // 8xy7  Vx = Vy - Vx
    ShiftLeft,         // 8xyE
    SkipNeqReg,        // 9xy0
    LoadI,             // Annn
    JumpV0Offset,      // Bnnn
    DrawSprite,        // Dxyn
    SkipIfKeyDown,     // Ex9E
    SkipIfKeyUp,       // ExA1
    ReadDelayTimer,    // Fx07
    WaitForKey,        // Fx0A
    SetDelayTimer,     // Fx15
    AddXToI,           // Fx1E
    LoadFontChar,      // Fx29
    StoreBcd,          // Fx33
    StoreRegisters,    // Fx55
    LoadRegisters,     // Fx65
};

struct Instruction {
    Opcode   op;
    uint8_t  x;       // register index, nibble b
    uint8_t  y;       // register index, nibble c
    uint8_t  n;       // low nibble (sprite height)
    uint8_t  byte;    // low 8 bits
    uint16_t address; // low 12 bits
    uint16_t word;    // the raw instruction word
};

// Pure mapping from an instruction word to an Instruction. Returns
// ErrorCode::UnknownInstruction (and leaves out untouched) for any word
// outside the opcode table.
ErrorCode Decode (uint16_t word, Instruction * out);

const char * OpcodeName (Opcode op);

// Renders a mnemonic line such as "ADD V3, V4" for traces and the
// debug history.
void FormatInstruction (const Instruction & instr, char * buf, unsigned bufSize);

} // namespace Chip8Vm
