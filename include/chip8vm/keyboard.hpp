#pragma once

#include <cstdint>

namespace Chip8Vm {

// Hex keypad state, one bit per key 0x0-0xF.
struct Keyboard {
    static const unsigned s_keyCount = 16;

    uint16_t m_mask;

    Keyboard () : m_mask(0) {}

    void SetDown (uint8_t key);
    void SetUp (uint8_t key);
    bool IsDown (uint8_t key) const;
    void Reset ();
};

// Maps the usual QWERTY block onto the hex keypad:
//
//   1 2 3 4      1 2 3 C
//   q w e r  ->  4 5 6 D
//   a s d f      7 8 9 E
//   z x c v      A 0 B F
//
// Returns false for characters outside the block.
bool KeyForChar (char c, uint8_t * key);

} // namespace Chip8Vm
