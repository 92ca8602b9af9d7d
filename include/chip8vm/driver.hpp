#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "error.hpp"
#include "session.hpp"

namespace Chip8Vm {

struct DriverConfig {
    unsigned instructionHz;
    unsigned timerHz;
    bool     haltOnUnknownInstruction;

    DriverConfig ()
        : instructionHz(700)
        , timerHz(60)
        , haltOnUnknownInstruction(true)
    {}

    // Cycle slots between two delay timer ticks, at least 1.
    unsigned SlotsPerTimerTick () const;
};

struct DriverResult {
    uint64_t slots;      // cycle slots elapsed, executed or not
    uint64_t steps;      // instructions executed
    uint64_t timerTicks;
    Error    lastError;
    bool     halted;     // stopped because of lastError

    DriverResult () : slots(0), steps(0), timerTicks(0), halted(false) {}
};

// Drives a Session: one cycle slot per instruction period, a timer tick
// every SlotsPerTimerTick() slots. The timer is frozen while the machine
// is paused.
class CycleDriver {
public:
    CycleDriver (Session & session, const DriverConfig & config = DriverConfig());

    // Runs up to slotCount slots as fast as possible.
    DriverResult RunSlots (uint64_t slotCount);

    // Runs slots paced at instructionHz for the given wall-clock time.
    DriverResult RunRealtime (std::chrono::milliseconds duration);

    // Asks a running loop to return after its current slot, or the next
    // run to return at once. The request is consumed when a run returns.
    // Safe to call from another thread.
    void Stop ();

private:
    bool RunSlot (DriverResult * result);

    Session &         m_session;
    DriverConfig      m_config;
    std::atomic<bool> m_stopRequested;
    uint64_t          m_slotsSinceTick;
};

} // namespace Chip8Vm
