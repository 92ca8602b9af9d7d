#include <cctype>

#include "chip8vm/keyboard.hpp"

namespace Chip8Vm {

//=====================================================================
//
// Static locals
//
//=====================================================================

//=====================================================================
static const char s_keyChars[Keyboard::s_keyCount] = {
    'x', '1', '2', '3', // 0 1 2 3
    'q', 'w', 'e', 'a', // 4 5 6 7
    's', 'd', 'z', 'c', // 8 9 A B
    '4', 'r', 'f', 'v', // C D E F
};


//=====================================================================
//
// Keyboard definitions
//
//=====================================================================

const unsigned Keyboard::s_keyCount;

//=====================================================================
void Keyboard::SetDown (uint8_t key) {
    if (key < s_keyCount)
        m_mask |= static_cast<uint16_t>(1u << key);
}

//=====================================================================
void Keyboard::SetUp (uint8_t key) {
    if (key < s_keyCount)
        m_mask &= static_cast<uint16_t>(~(1u << key));
}

//=====================================================================
bool Keyboard::IsDown (uint8_t key) const {
    if (key >= s_keyCount)
        return false;
    return (m_mask & (1u << key)) != 0;
}

//=====================================================================
void Keyboard::Reset () {
    m_mask = 0;
}

//=====================================================================
bool KeyForChar (char c, uint8_t * key) {

    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (unsigned i = 0; i < Keyboard::s_keyCount; ++i) {
        if (s_keyChars[i] == lower) {
            if (key)
                *key = static_cast<uint8_t>(i);
            return true;
        }
    }
    return false;

}

} // namespace Chip8Vm
