#include <cstdio>

#include "chip8vm/instruction.hpp"

namespace Chip8Vm {

//=====================================================================
//
// Static locals
//
//=====================================================================

//=====================================================================
static Instruction MakeInstruction (Opcode op, uint16_t word) {

    Instruction instr;
    instr.op      = op;
    instr.x       = (word & 0x0F00) >> 8;
    instr.y       = (word & 0x00F0) >> 4;
    instr.n       =  word & 0x000F;
    instr.byte    =  word & 0x00FF;
    instr.address =  word & 0x0FFF;
    instr.word    =  word;
    return instr;

}


//=====================================================================
//
// Decoder definitions
//
//=====================================================================

//=====================================================================
ErrorCode Decode (uint16_t word, Instruction * out) {

    const unsigned a = (word & 0xF000) >> 12;
    const unsigned d =  word & 0x000F;
    const unsigned low = word & 0x00FF;

    bool   known = true;
    Opcode op    = Opcode::Clear;

    switch (a) {
        case 0x0:
            if (word == 0x00E0)
                op = Opcode::Clear;
            else if (word == 0x00EE)
                op = Opcode::Return;
            else
                known = false;
            break;

        case 0x1: op = Opcode::Jump;       break;
        case 0x2: op = Opcode::Call;       break;
        case 0x3: op = Opcode::SkipEqImm;  break;
        case 0x4: op = Opcode::SkipNeqImm; break;

        case 0x5:
            op    = Opcode::SkipEqReg;
            known = (d == 0x0);
            break;

        case 0x6: op = Opcode::LoadImm; break;
        case 0x7: op = Opcode::AddImm;  break;

        case 0x8:
            switch (d) {
                case 0x0: op = Opcode::Copy;          break;
                case 0x1: op = Opcode::Or;            break;
                case 0x2: op = Opcode::And;           break;
                case 0x3: op = Opcode::Xor;           break;
                case 0x4: op = Opcode::AddReg;        break;
                case 0x5: op = Opcode::SubReg;        break;
                case 0x6: op = Opcode::ShiftRight;    break;
                case 0x7: op = Opcode::SubRegReverse; break;
                case 0xE: op = Opcode::ShiftLeft;     break;
                default:  known = false;              break;
            }
            break;

        case 0x9:
            op    = Opcode::SkipNeqReg;
            known = (d == 0x0);
            break;

        case 0xA: op = Opcode::LoadI;        break;
        case 0xB: op = Opcode::JumpV0Offset; break;
        case 0xD: op = Opcode::DrawSprite;   break;

        case 0xE:
            if (low == 0x9E)
                op = Opcode::SkipIfKeyDown;
            else if (low == 0xA1)
                op = Opcode::SkipIfKeyUp;
            else
                known = false;
            break;

        case 0xF:
            switch (low) {
                case 0x07: op = Opcode::ReadDelayTimer; break;
                case 0x0A: op = Opcode::WaitForKey;     break;
                case 0x15: op = Opcode::SetDelayTimer;  break;
                case 0x1E: op = Opcode::AddXToI;        break;
                case 0x29: op = Opcode::LoadFontChar;   break;
                case 0x33: op = Opcode::StoreBcd;       break;
                case 0x55: op = Opcode::StoreRegisters; break;
                case 0x65: op = Opcode::LoadRegisters;  break;
                default:   known = false;               break;
            }
            break;

        // 0xC (random) is not part of this machine
        default:
            known = false;
            break;
    }

    if (!known)
        return ErrorCode::UnknownInstruction;

    if (out)
        *out = MakeInstruction(op, word);
    return ErrorCode::None;

}

//=====================================================================
const char * OpcodeName (Opcode op) {

    switch (op) {
        case Opcode::Clear:          return "Clear";
        case Opcode::Return:         return "Return";
        case Opcode::Jump:           return "Jump";
        case Opcode::Call:           return "Call";
        case Opcode::SkipEqImm:      return "SkipEqImm";
        case Opcode::SkipNeqImm:     return "SkipNeqImm";
        case Opcode::SkipEqReg:      return "SkipEqReg";
        case Opcode::LoadImm:        return "LoadImm";
        case Opcode::AddImm:         return "AddImm";
        case Opcode::Copy:           return "Copy";
        case Opcode::Or:             return "Or";
        case Opcode::And:            return "And";
        case Opcode::Xor:            return "Xor";
        case Opcode::AddReg:         return "AddReg";
        case Opcode::SubReg:         return "SubReg";
        case Opcode::ShiftRight:     return "ShiftRight";
        case Opcode::SubRegReverse:  return "SubRegReverse";
        case Opcode::ShiftLeft:      return "ShiftLeft";
        case Opcode::SkipNeqReg:     return "SkipNeqReg";
        case Opcode::LoadI:          return "LoadI";
        case Opcode::JumpV0Offset:   return "JumpV0Offset";
        case Opcode::DrawSprite:     return "DrawSprite";
        case Opcode::SkipIfKeyDown:  return "SkipIfKeyDown";
        case Opcode::SkipIfKeyUp:    return "SkipIfKeyUp";
        case Opcode::ReadDelayTimer: return "ReadDelayTimer";
        case Opcode::WaitForKey:     return "WaitForKey";
        case Opcode::SetDelayTimer:  return "SetDelayTimer";
        case Opcode::AddXToI:        return "AddXToI";
        case Opcode::LoadFontChar:   return "LoadFontChar";
        case Opcode::StoreBcd:       return "StoreBcd";
        case Opcode::StoreRegisters: return "StoreRegisters";
        case Opcode::LoadRegisters:  return "LoadRegisters";
    }
    return "?";

}

//=====================================================================
void FormatInstruction (const Instruction & instr, char * buf, unsigned bufSize) {

    if (!buf || !bufSize)
        return;

    const unsigned x = instr.x;
    const unsigned y = instr.y;

    switch (instr.op) {
        case Opcode::Clear:          std::snprintf(buf, bufSize, "CLS"); break;
        case Opcode::Return:         std::snprintf(buf, bufSize, "RET"); break;
        case Opcode::Jump:           std::snprintf(buf, bufSize, "JP 0x%03X", instr.address); break;
        case Opcode::Call:           std::snprintf(buf, bufSize, "CALL 0x%03X", instr.address); break;
        case Opcode::SkipEqImm:      std::snprintf(buf, bufSize, "SE V%X, 0x%02X", x, instr.byte); break;
        case Opcode::SkipNeqImm:     std::snprintf(buf, bufSize, "SNE V%X, 0x%02X", x, instr.byte); break;
        case Opcode::SkipEqReg:      std::snprintf(buf, bufSize, "SE V%X, V%X", x, y); break;
        case Opcode::LoadImm:        std::snprintf(buf, bufSize, "LD V%X, 0x%02X", x, instr.byte); break;
        case Opcode::AddImm:         std::snprintf(buf, bufSize, "ADD V%X, 0x%02X", x, instr.byte); break;
        case Opcode::Copy:           std::snprintf(buf, bufSize, "LD V%X, V%X", x, y); break;
        case Opcode::Or:             std::snprintf(buf, bufSize, "OR V%X, V%X", x, y); break;
        case Opcode::And:            std::snprintf(buf, bufSize, "AND V%X, V%X", x, y); break;
        case Opcode::Xor:            std::snprintf(buf, bufSize, "XOR V%X, V%X", x, y); break;
        case Opcode::AddReg:         std::snprintf(buf, bufSize, "ADD V%X, V%X", x, y); break;
        case Opcode::SubReg:         std::snprintf(buf, bufSize, "SUB V%X, V%X", x, y); break;
        case Opcode::ShiftRight:     std::snprintf(buf, bufSize, "SHR V%X, V%X", x, y); break;
        case Opcode::SubRegReverse:  std::snprintf(buf, bufSize, "SUBN V%X, V%X", x, y); break;
        case Opcode::ShiftLeft:      std::snprintf(buf, bufSize, "SHL V%X, V%X", x, y); break;
        case Opcode::SkipNeqReg:     std::snprintf(buf, bufSize, "SNE V%X, V%X", x, y); break;
        case Opcode::LoadI:          std::snprintf(buf, bufSize, "LD I, 0x%03X", instr.address); break;
        case Opcode::JumpV0Offset:   std::snprintf(buf, bufSize, "JP V0, 0x%03X", instr.address); break;
        case Opcode::DrawSprite:     std::snprintf(buf, bufSize, "DRW V%X, V%X, %u", x, y, unsigned(instr.n)); break;
        case Opcode::SkipIfKeyDown:  std::snprintf(buf, bufSize, "SKP V%X", x); break;
        case Opcode::SkipIfKeyUp:    std::snprintf(buf, bufSize, "SKNP V%X", x); break;
        case Opcode::ReadDelayTimer: std::snprintf(buf, bufSize, "LD V%X, DT", x); break;
        case Opcode::WaitForKey:     std::snprintf(buf, bufSize, "LD V%X, K", x); break;
        case Opcode::SetDelayTimer:  std::snprintf(buf, bufSize, "LD DT, V%X", x); break;
        case Opcode::AddXToI:        std::snprintf(buf, bufSize, "ADD I, V%X", x); break;
        case Opcode::LoadFontChar:   std::snprintf(buf, bufSize, "LD F, V%X", x); break;
        case Opcode::StoreBcd:       std::snprintf(buf, bufSize, "LD B, V%X", x); break;
        case Opcode::StoreRegisters: std::snprintf(buf, bufSize, "LD [I], V%X", x); break;
        case Opcode::LoadRegisters:  std::snprintf(buf, bufSize, "LD V%X, [I]", x); break;
    }

}

} // namespace Chip8Vm
