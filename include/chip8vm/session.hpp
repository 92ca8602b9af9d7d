#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "chip8.hpp"

namespace Chip8Vm {

// Owns the one Chip8 instance shared by a stepping thread and a UI
// thread. Every call holds the lock for its whole duration, so readers
// only ever see the machine between two completed steps.
class Session {
public:
    explicit Session (const Config & config = Config());

    bool LoadProgram (const char * path, Error * error = nullptr);
    bool LoadProgram (const uint8_t * bytes, std::size_t size, Error * error = nullptr);

    Error EmulateCycle (bool * executed = nullptr);
    void  TickTimer ();

    // One driver slot under a single lock: a gated cycle, then a timer
    // tick when tickDue is set and the slot counts as elapsed time. A
    // slot counts unless the machine was paused and nothing executed.
    Error RunSlot (bool tickDue, bool * executed, bool * counted, bool * ticked);

    void KeyDown (uint8_t key);
    void KeyUp (uint8_t key);

    bool SetPaused (bool paused);
    bool RequestStep ();

    Mode     GetMode () const;
    Snapshot GetSnapshot () const;

    // Copies the display into out (s_renderWidth * s_renderHeight bytes)
    // and returns the redraw flag read with it. The flag is cleared.
    bool CopyDisplay (uint8_t * out);

    // Oldest first.
    void CopyHistory (std::vector<HistoryEntry> * out) const;

private:
    mutable std::mutex m_mutex;
    Chip8              m_chip8;
};

} // namespace Chip8Vm
