#pragma once

#include <cstdint>

namespace Chip8Vm {

enum class ErrorCode : uint8_t {
    None,
    UnknownInstruction, // recoverable; the driver decides what to do
    StackUnderflow,     // 00EE with nothing to return to
    StackOverflow,      // 2nnn with a full stack
    MemoryOutOfRange,   // fetch, sprite read or store past 0xFFF
    RomTooLarge,
    RomReadFailed,
};

struct Error {
    ErrorCode code;
    uint16_t  word;    // raw instruction word, when one was fetched
    uint16_t  address; // PC of the instruction, or the offending address

    Error () : code(ErrorCode::None), word(0), address(0) {}
    Error (ErrorCode c, uint16_t w, uint16_t a) : code(c), word(w), address(a) {}

    bool Ok () const { return code == ErrorCode::None; }
    bool IsFatal () const;
};

const char * ErrorCodeName (ErrorCode code);

// Writes a one-line description of the error into buf (always terminated).
void FormatError (const Error & error, char * buf, unsigned bufSize);

} // namespace Chip8Vm
