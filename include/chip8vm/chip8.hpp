#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

#include "error.hpp"
#include "instruction.hpp"
#include "keyboard.hpp"

namespace Chip8Vm {

// Behavioural switches for opcodes that differ between CHIP-8
// interpreters.
struct Config {
    bool     logicOpsResetVf;    // 8xy1/8xy2/8xy3 clear VF
    bool     loadStoreAdvancesI; // Fx55/Fx65 leave I at I + x + 1
    unsigned historyCapacity;    // decoded instructions kept for debugging

    Config ()
        : logicOpsResetVf(true)
        , loadStoreAdvancesI(true)
        , historyCapacity(32)
    {}
};

enum class ModeKind : uint8_t {
    Running,
    WaitForKey,
    Paused,
};

struct Mode {
    ModeKind kind;
    uint8_t  reg; // destination register while in WaitForKey

    Mode () : kind(ModeKind::Running), reg(0) {}
    Mode (ModeKind k, uint8_t r = 0) : kind(k), reg(r) {}

    bool operator== (const Mode & rhs) const {
        return kind == rhs.kind && (kind != ModeKind::WaitForKey || reg == rhs.reg);
    }
    bool operator!= (const Mode & rhs) const { return !(*this == rhs); }
};

const char * ModeName (ModeKind kind);

struct HistoryEntry {
    uint16_t    pc; // address the instruction was fetched from
    Instruction instr;
};

// Read-only copy of the machine state for debuggers.
struct Snapshot {
    uint8_t  v[16];
    uint16_t i;
    uint16_t pc;
    uint8_t  delayTimer;
    uint8_t  stackDepth;
    uint16_t keys;
    Mode     mode;
    bool     drawFlag;
};

struct Chip8 {
    static const unsigned s_memoryBytes   = 4096;
    static const unsigned s_registerCount =   16;
    static const unsigned s_renderWidth   =   64;
    static const unsigned s_renderHeight  =   32;
    static const unsigned s_stackSize     =   16;
    static const unsigned s_flagRegister  =  0xF;

    static const uint16_t s_fontBegin        = 0x000;
    static const uint16_t s_fontEnd          = 0x050;
    static const uint16_t s_fontGlyphBytes   =     5;
    static const uint16_t s_progRomRamBegin  = 0x200;
    static const uint16_t s_progRomRamEnd    = 0xFFF;
    static const unsigned s_progMaxBytes     = s_memoryBytes - s_progRomRamBegin;

    uint8_t  m_memory[s_memoryBytes];
    uint8_t  m_v[s_registerCount]; // registers V0-VF
    uint16_t m_i;  // index register
    uint16_t m_pc; // program counter
    uint8_t  m_delayTimer; // decrement if not 0
    Keyboard m_keyboard; // hex keypad buttonstates

    uint16_t m_opcode; // last fetched word
    uint16_t m_stack[s_stackSize];
    uint8_t  m_sp; // stack pointer
    uint8_t  m_renderOut[s_renderWidth * s_renderHeight]; // 64x32 B&W display

    bool     m_drawFlag; // whether or not a GUI application should render

    Mode     m_mode;
    bool     m_stepRequested; // one cycle allowed while Paused
    bool     m_waitFromPaused; // WaitForKey was entered by a paused step

    Config                   m_config;
    std::deque<HistoryEntry> m_history;

    Chip8 ();

    void Initialize (const Config & config = Config());

    // Copies the ROM to s_progRomRamBegin. On failure memory is left
    // untouched and error (if given) says why.
    bool LoadProgram (const char * path, Error * error = nullptr);
    bool LoadProgram (const uint8_t * bytes, std::size_t size, Error * error = nullptr);

    // One fetch-decode-execute step if the current mode allows it.
    // executed reports whether an instruction ran.
    Error EmulateCycle (bool * executed = nullptr);

    // One fetch-decode-execute step regardless of mode.
    Error Step ();

    // Applies a decoded instruction. PC must already point past it.
    Error Execute (const Instruction & instr);

    void TickTimer ();

    void KeyDown (uint8_t key);
    void KeyUp (uint8_t key);

    bool CanCycle () const;
    bool SetPaused (bool paused);
    bool RequestStep ();

    Snapshot GetSnapshot () const;

    // Fills pixel index for (x, y); false when outside the display.
    static bool VramIndex (unsigned x, unsigned y, unsigned * index);
};

} // namespace Chip8Vm
