#include <cstdio>

#include "chip8vm/error.hpp"

namespace Chip8Vm {

//=====================================================================
bool Error::IsFatal () const {

    switch (code) {
        case ErrorCode::StackUnderflow:
        case ErrorCode::StackOverflow:
        case ErrorCode::MemoryOutOfRange:
            return true;
        case ErrorCode::None:
        case ErrorCode::UnknownInstruction:
        case ErrorCode::RomTooLarge:
        case ErrorCode::RomReadFailed:
            return false;
    }
    return false;

}

//=====================================================================
const char * ErrorCodeName (ErrorCode code) {

    switch (code) {
        case ErrorCode::None:               return "None";
        case ErrorCode::UnknownInstruction: return "UnknownInstruction";
        case ErrorCode::StackUnderflow:     return "StackUnderflow";
        case ErrorCode::StackOverflow:      return "StackOverflow";
        case ErrorCode::MemoryOutOfRange:   return "MemoryOutOfRange";
        case ErrorCode::RomTooLarge:        return "RomTooLarge";
        case ErrorCode::RomReadFailed:      return "RomReadFailed";
    }
    return "?";

}

//=====================================================================
void FormatError (const Error & error, char * buf, unsigned bufSize) {

    if (!buf || !bufSize)
        return;

    switch (error.code) {
        case ErrorCode::UnknownInstruction:
            std::snprintf(buf, bufSize, "unknown instruction {0x%04X} at {0x%04X}", error.word, error.address);
            break;
        case ErrorCode::StackUnderflow:
            std::snprintf(buf, bufSize, "return with empty stack at {0x%04X}", error.address);
            break;
        case ErrorCode::StackOverflow:
            std::snprintf(buf, bufSize, "call {0x%04X} with full stack at {0x%04X}", error.word, error.address);
            break;
        case ErrorCode::MemoryOutOfRange:
            std::snprintf(buf, bufSize, "memory access out of range {0x%04X} (opcode {0x%04X})", error.address, error.word);
            break;
        default:
            std::snprintf(buf, bufSize, "%s", ErrorCodeName(error.code));
            break;
    }

}

} // namespace Chip8Vm
