#include <cstdio>
#include <cstring>

#include <csaru-core-cpp/csaru-core-cpp.h>

#include "chip8vm/chip8.hpp"
#include "chip8vm/log.hpp"

namespace Chip8Vm {

//=====================================================================
//
// Static locals
//
//=====================================================================

//=====================================================================
static const uint8_t s_fontSet[80] = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

//=====================================================================
static void LogKeyboard (const Keyboard & keyboard) {

    if (!LogEnabled(LogLevel::Trace))
        return;

    char line[Keyboard::s_keyCount + 1];
    for (unsigned key = 0; key < Keyboard::s_keyCount; ++key)
        line[key] = keyboard.IsDown(static_cast<uint8_t>(key)) ? '1' : '.';
    line[Keyboard::s_keyCount] = '\0';

    Log(LogLevel::Trace, LogTarget::Input, "keys 0..F [%s]", line);

}

//=====================================================================
static void LogVram (const uint8_t * vram) {

    if (!LogEnabled(LogLevel::Trace))
        return;

    char row[Chip8::s_renderWidth + 1];
    for (unsigned y = 0; y < Chip8::s_renderHeight; ++y) {
        for (unsigned x = 0; x < Chip8::s_renderWidth; ++x)
            row[x] = vram[Chip8::s_renderWidth * y + x] ? '#' : '.';
        row[Chip8::s_renderWidth] = '\0';
        Log(LogLevel::Trace, LogTarget::Drawing, "%s", row);
    }

}


//=====================================================================
//
// Mode definitions
//
//=====================================================================

//=====================================================================
const char * ModeName (ModeKind kind) {

    switch (kind) {
        case ModeKind::Running:    return "Running";
        case ModeKind::WaitForKey: return "WaitForKey";
        case ModeKind::Paused:     return "Paused";
    }
    return "?";

}


//=====================================================================
//
// Chip8 definitions
//
//=====================================================================

const unsigned Chip8::s_memoryBytes;
const unsigned Chip8::s_registerCount;
const unsigned Chip8::s_renderWidth;
const unsigned Chip8::s_renderHeight;
const unsigned Chip8::s_stackSize;
const unsigned Chip8::s_flagRegister;
const uint16_t Chip8::s_fontBegin;
const uint16_t Chip8::s_fontEnd;
const uint16_t Chip8::s_fontGlyphBytes;
const uint16_t Chip8::s_progRomRamBegin;
const uint16_t Chip8::s_progRomRamEnd;
const unsigned Chip8::s_progMaxBytes;

//=====================================================================
Chip8::Chip8 () {
    Initialize();
}

//=====================================================================
void Chip8::Initialize (const Config & config) {

    CSaruCore::SecureZero(m_memory, sizeof(m_memory));
    CSaruCore::SecureZero(m_v, sizeof(m_v));
    m_i          = 0x0000;
    m_pc         = s_progRomRamBegin;
    m_delayTimer = 0;
    m_keyboard.Reset();

    m_opcode = 0x0000;
    CSaruCore::SecureZero(m_stack, sizeof(m_stack));
    m_sp     = 0x00;
    CSaruCore::SecureZero(m_renderOut, sizeof(m_renderOut));

    m_drawFlag       = false;
    m_mode           = Mode();
    m_stepRequested  = false;
    m_waitFromPaused = false;

    m_config = config;
    m_history.clear();

    std::memcpy(m_memory + s_fontBegin, s_fontSet, sizeof(s_fontSet));

}

//=====================================================================
bool Chip8::LoadProgram (const char * path, Error * error) {

    std::FILE * progFile = std::fopen(path, "rb");
    if (!progFile) {
        Log(LogLevel::Error, LogTarget::Core, "Failed to open program file at {%s}.", path);
        if (error)
            *error = Error(ErrorCode::RomReadFailed, 0, 0);
        return false;
    }

    // one byte more than fits, so an oversized ROM can be told apart
    std::vector<uint8_t> rom(s_progMaxBytes + 1);
    std::size_t readCount = std::fread(
        rom.data(),
        1, /* size of element to read (in bytes) */
        rom.size(), /* number of element to read */
        progFile
    );
    const bool readFailed = std::ferror(progFile) != 0;
    std::fclose(progFile);
    if (readFailed) {
        Log(LogLevel::Error, LogTarget::Core, "Failed to read from program file {%s}.", path);
        if (error)
            *error = Error(ErrorCode::RomReadFailed, 0, 0);
        return false;
    }

    return LoadProgram(rom.data(), readCount, error);

}

//=====================================================================
bool Chip8::LoadProgram (const uint8_t * bytes, std::size_t size, Error * error) {

    if (!bytes || !size) {
        Log(LogLevel::Error, LogTarget::Core, "Program is empty.");
        if (error)
            *error = Error(ErrorCode::RomReadFailed, 0, 0);
        return false;
    }

    if (size > s_progMaxBytes) {
        Log(
            LogLevel::Error,
            LogTarget::Core,
            "Program of %u bytes does not fit in %u bytes at {0x%04X}.",
            static_cast<unsigned>(size),
            s_progMaxBytes,
            s_progRomRamBegin
        );
        if (error)
            *error = Error(ErrorCode::RomTooLarge, 0, s_progRomRamBegin);
        return false;
    }

    CSaruCore::SecureZero(m_memory + s_progRomRamBegin, s_progMaxBytes);
    std::memcpy(m_memory + s_progRomRamBegin, bytes, size);

    Log(LogLevel::Info, LogTarget::Core, "Loaded %u program bytes.", static_cast<unsigned>(size));
    if (error)
        *error = Error();
    return true;

}

//=====================================================================
bool Chip8::CanCycle () const {

    switch (m_mode.kind) {
        case ModeKind::Running:    return true;
        case ModeKind::WaitForKey: return false;
        case ModeKind::Paused:     return m_stepRequested;
    }
    return false;

}

//=====================================================================
Error Chip8::EmulateCycle (bool * executed) {

    if (executed)
        *executed = false;

    if (!CanCycle())
        return Error();

    if (m_mode.kind == ModeKind::Paused)
        m_stepRequested = false;

    if (executed)
        *executed = true;
    return Step();

}

//=====================================================================
Error Chip8::Step () {

    const uint16_t pc = m_pc;

    // Fetch opcode
    if (pc + 1u >= s_memoryBytes) {
        Log(LogLevel::Error, LogTarget::Core, "Program counter {0x%04X} outside memory.", pc);
        return Error(ErrorCode::MemoryOutOfRange, 0, pc);
    }
    m_opcode = static_cast<uint16_t>(m_memory[pc] << 8 | m_memory[pc + 1]);
    m_pc    += 2;

    // Decode opcode
    Instruction instr;
    if (Decode(m_opcode, &instr) != ErrorCode::None) {
        Log(
            LogLevel::Warn,
            LogTarget::Instructions,
            "Bad opcode {0x%04X} at {0x%04X} ({0x%04X}).",
            m_opcode,
            pc,
            pc - s_progRomRamBegin
        );
        return Error(ErrorCode::UnknownInstruction, m_opcode, pc);
    }

    if (LogEnabled(LogLevel::Trace)) {
        char text[32];
        FormatInstruction(instr, text, sizeof(text));
        Log(LogLevel::Trace, LogTarget::Instructions, "0x%04X: %04X %s", pc, m_opcode, text);
    }

    if (m_config.historyCapacity) {
        HistoryEntry entry;
        entry.pc    = pc;
        entry.instr = instr;
        m_history.push_back(entry);
        while (m_history.size() > m_config.historyCapacity)
            m_history.pop_front();
    }

    // Execute opcode
    return Execute(instr);

}

//=====================================================================
Error Chip8::Execute (const Instruction & instr) {

    uint8_t & vx = m_v[instr.x];
    uint8_t & vy = m_v[instr.y];
    uint8_t & vf = m_v[s_flagRegister];

    switch (instr.op) {
        case Opcode::Clear: { // 0x00E0: clear the screen
            std::memset(m_renderOut, 0, sizeof(m_renderOut));
            m_drawFlag = true;
        } break;

        case Opcode::Return: { // 0x00EE: return from call
            if (!m_sp) {
                Log(LogLevel::Error, LogTarget::Core, "Return with empty stack at {0x%04X}.", m_pc - 2);
                return Error(ErrorCode::StackUnderflow, instr.word, static_cast<uint16_t>(m_pc - 2));
            }
            m_pc = m_stack[--m_sp];
        } break;

        case Opcode::Jump: { // 0x1NNN: jump to NNN
            m_pc = instr.address;
        } break;

        case Opcode::Call: { // 0x2NNN: call NNN
            if (m_sp >= s_stackSize) {
                Log(LogLevel::Error, LogTarget::Core, "Call with full stack at {0x%04X}.", m_pc - 2);
                return Error(ErrorCode::StackOverflow, instr.word, static_cast<uint16_t>(m_pc - 2));
            }
            m_stack[m_sp++] = m_pc;
            m_pc = instr.address;
        } break;

        case Opcode::SkipEqImm: { // 0x3XNN: skip next instruction if VX == NN
            if (vx == instr.byte)
                m_pc += 2;
        } break;

        case Opcode::SkipNeqImm: { // 0x4XNN: skip next instruction if VX != NN
            if (vx != instr.byte)
                m_pc += 2;
        } break;

        case Opcode::SkipEqReg: { // 0x5XY0: skip next instruction if VX == VY
            if (vx == vy)
                m_pc += 2;
        } break;

        case Opcode::LoadImm: { // 0x6XNN: set VX to NN
            vx = instr.byte;
        } break;

        case Opcode::AddImm: { // 0x7XNN: add NN to VX, VF untouched
            vx = static_cast<uint8_t>(vx + instr.byte);
        } break;

        case Opcode::Copy: { // 0x8XY0: set VX to VY
            vx = vy;
        } break;

        case Opcode::Or: { // 0x8XY1
            vx |= vy;
            if (m_config.logicOpsResetVf)
                vf = 0;
        } break;

        case Opcode::And: { // 0x8XY2
            vx &= vy;
            if (m_config.logicOpsResetVf)
                vf = 0;
        } break;

        case Opcode::Xor: { // 0x8XY3
            vx ^= vy;
            if (m_config.logicOpsResetVf)
                vf = 0;
        } break;

        case Opcode::AddReg: { // 0x8XY4: VX += VY, VF set to carry
            const unsigned sum = unsigned(vx) + unsigned(vy);
            vx = static_cast<uint8_t>(sum);
            vf = sum > 0xFF ? 1 : 0;
        } break;

        case Opcode::SubReg: { // 0x8XY5: VX -= VY
            // VF is set to 0 on borrow; 1 otherwise.
            const uint8_t noBorrow = (vx >= vy) ? 1 : 0;
            vx = static_cast<uint8_t>(vx - vy);
            vf = noBorrow;
        } break;

        case Opcode::ShiftRight: { // 0x8XY6: VX = VY >> 1
            const uint8_t value = vy;
            vx = static_cast<uint8_t>(value >> 1);
            vf = value & 0x01;
        } break;

        case Opcode::SubRegReverse: { // 0x8XY7: VX = VY - VX
            const uint8_t noBorrow = (vy >= vx) ? 1 : 0;
            vx = static_cast<uint8_t>(vy - vx);
            vf = noBorrow;
        } break;

        case Opcode::ShiftLeft: { // 0x8XYE: VX = VY << 1
            const uint8_t value = vy;
            vx = static_cast<uint8_t>(value << 1);
            vf = (value & 0x80) ? 1 : 0;
        } break;

        case Opcode::SkipNeqReg: { // 0x9XY0: skip next instruction if VX != VY
            if (vx != vy)
                m_pc += 2;
        } break;

        case Opcode::LoadI: { // 0xANNN: set I to NNN
            m_i = instr.address;
        } break;

        case Opcode::JumpV0Offset: { // 0xBNNN: jump to NNN + V0
            m_pc = static_cast<uint16_t>(instr.address + m_v[0]);
        } break;

        case Opcode::DrawSprite: { // 0xDXYN
            // XOR-draw N rows of 8-bit-wide sprites from I
            // at (VX, VY), (VX, VY+1), etc.
            // VF set to 1 if a pixel is toggled off, otherwise 0.
            if (unsigned(m_i) + instr.n > s_memoryBytes) {
                Log(LogLevel::Error, LogTarget::Drawing, "Sprite at {0x%04X} reads past memory.", m_i);
                return Error(ErrorCode::MemoryOutOfRange, instr.word, m_i);
            }

            unsigned startX = vx;
            unsigned startY = vy;
            if (startX >= s_renderWidth)
                startX %= s_renderWidth;
            if (startY >= s_renderHeight)
                startY %= s_renderHeight;

            Log(LogLevel::Trace, LogTarget::Drawing, "drawing %u bytes at %u,%u", unsigned(instr.n), startX, startY);

            vf = 0;
            for (unsigned row = 0; row < instr.n; ++row) {
                const uint8_t bits = m_memory[m_i + row];
                for (unsigned col = 0; col < 8; ++col) {
                    if (!(bits & (0x80 >> col)))
                        continue;

                    unsigned index;
                    if (!VramIndex(startX + col, startY + row, &index))
                        continue;

                    if (m_renderOut[index])
                        vf = 1;
                    m_renderOut[index] ^= 1;
                }
            }

            Log(LogLevel::Trace, LogTarget::Drawing, "Finished drawing. VF: %u", unsigned(vf));
            LogVram(m_renderOut);

            m_drawFlag = true;
        } break;

        case Opcode::SkipIfKeyDown: { // 0xEX9E
            // skip next instruction if key at VX is pressed
            Log(LogLevel::Trace, LogTarget::Input, "SkipIfKeyDown: %X", unsigned(vx));
            LogKeyboard(m_keyboard);
            if (m_keyboard.IsDown(vx))
                m_pc += 2;
        } break;

        case Opcode::SkipIfKeyUp: { // 0xEXA1
            // skip next instruction if key at VX is not pressed
            Log(LogLevel::Trace, LogTarget::Input, "SkipIfKeyUp: %X", unsigned(vx));
            LogKeyboard(m_keyboard);
            if (!m_keyboard.IsDown(vx))
                m_pc += 2;
        } break;

        case Opcode::ReadDelayTimer: { // 0xFX07
            vx = m_delayTimer;
        } break;

        case Opcode::WaitForKey: { // 0xFX0A: block until a key is released
            m_waitFromPaused = (m_mode.kind == ModeKind::Paused);
            m_mode = Mode(ModeKind::WaitForKey, instr.x);
            Log(LogLevel::Trace, LogTarget::Input, "waiting for key into V%X", unsigned(instr.x));
        } break;

        case Opcode::SetDelayTimer: { // 0xFX15
            m_delayTimer = vx;
            Log(LogLevel::Trace, LogTarget::Timer, "set delay timer to %u", unsigned(m_delayTimer));
        } break;

        case Opcode::AddXToI: { // 0xFX1E: I += VX
            m_i = static_cast<uint16_t>(m_i + vx);
        } break;

        case Opcode::LoadFontChar: { // 0xFX29: I = glyph for the digit in VX
            m_i = static_cast<uint16_t>(s_fontBegin + s_fontGlyphBytes * vx);
        } break;

        case Opcode::StoreBcd: { // 0xFX33
            if (unsigned(m_i) + 3 > s_memoryBytes) {
                Log(LogLevel::Error, LogTarget::Core, "BCD store at {0x%04X} writes past memory.", m_i);
                return Error(ErrorCode::MemoryOutOfRange, instr.word, m_i);
            }
            const uint8_t value = vx;
            m_memory[m_i]     = value / 100;
            m_memory[m_i + 1] = (value % 100) / 10;
            m_memory[m_i + 2] = value % 10;
        } break;

        case Opcode::StoreRegisters: { // 0xFX55: memory[I..I+X] = V0..VX
            if (unsigned(m_i) + instr.x + 1 > s_memoryBytes) {
                Log(LogLevel::Error, LogTarget::Core, "Register store at {0x%04X} writes past memory.", m_i);
                return Error(ErrorCode::MemoryOutOfRange, instr.word, m_i);
            }
            for (unsigned reg = 0; reg <= instr.x; ++reg)
                m_memory[m_i + reg] = m_v[reg];
            if (m_config.loadStoreAdvancesI)
                m_i = static_cast<uint16_t>(m_i + instr.x + 1);
        } break;

        case Opcode::LoadRegisters: { // 0xFX65: V0..VX = memory[I..I+X]
            if (unsigned(m_i) + instr.x + 1 > s_memoryBytes) {
                Log(LogLevel::Error, LogTarget::Core, "Register load at {0x%04X} reads past memory.", m_i);
                return Error(ErrorCode::MemoryOutOfRange, instr.word, m_i);
            }
            for (unsigned reg = 0; reg <= instr.x; ++reg)
                m_v[reg] = m_memory[m_i + reg];
            if (m_config.loadStoreAdvancesI)
                m_i = static_cast<uint16_t>(m_i + instr.x + 1);
        } break;
    }

    return Error();

}

//=====================================================================
void Chip8::TickTimer () {

    if (m_delayTimer)
        --m_delayTimer;

}

//=====================================================================
void Chip8::KeyDown (uint8_t key) {

    m_keyboard.SetDown(key);
    Log(LogLevel::Trace, LogTarget::Input, "key %X down", unsigned(key));

}

//=====================================================================
void Chip8::KeyUp (uint8_t key) {

    if (key >= Keyboard::s_keyCount)
        return;

    m_keyboard.SetUp(key);
    Log(LogLevel::Trace, LogTarget::Input, "key %X up", unsigned(key));

    if (m_mode.kind == ModeKind::WaitForKey) {
        m_v[m_mode.reg] = key;
        m_mode = Mode(m_waitFromPaused ? ModeKind::Paused : ModeKind::Running);
        m_waitFromPaused = false;
    }

}

//=====================================================================
bool Chip8::SetPaused (bool paused) {

    if (paused && m_mode.kind == ModeKind::Running) {
        m_mode = Mode(ModeKind::Paused);
        m_stepRequested = false;
        return true;
    }
    if (!paused && m_mode.kind == ModeKind::Paused) {
        m_mode = Mode(ModeKind::Running);
        m_stepRequested = false;
        return true;
    }
    return paused == (m_mode.kind == ModeKind::Paused);

}

//=====================================================================
bool Chip8::RequestStep () {

    if (m_mode.kind != ModeKind::Paused)
        return false;

    m_stepRequested = true;
    return true;

}

//=====================================================================
Snapshot Chip8::GetSnapshot () const {

    Snapshot snap;
    std::memcpy(snap.v, m_v, sizeof(snap.v));
    snap.i          = m_i;
    snap.pc         = m_pc;
    snap.delayTimer = m_delayTimer;
    snap.stackDepth = m_sp;
    snap.keys       = m_keyboard.m_mask;
    snap.mode       = m_mode;
    snap.drawFlag   = m_drawFlag;
    return snap;

}

//=====================================================================
bool Chip8::VramIndex (unsigned x, unsigned y, unsigned * index) {

    if (x >= s_renderWidth || y >= s_renderHeight)
        return false;

    if (index)
        *index = s_renderWidth * y + x;
    return true;

}

} // namespace Chip8Vm
