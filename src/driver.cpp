#include <thread>

#include "chip8vm/driver.hpp"
#include "chip8vm/log.hpp"

namespace Chip8Vm {

//=====================================================================
//
// DriverConfig definitions
//
//=====================================================================

//=====================================================================
unsigned DriverConfig::SlotsPerTimerTick () const {

    if (!timerHz || instructionHz <= timerHz)
        return 1;
    return instructionHz / timerHz;

}


//=====================================================================
//
// CycleDriver definitions
//
//=====================================================================

//=====================================================================
CycleDriver::CycleDriver (Session & session, const DriverConfig & config)
    : m_session(session)
    , m_config(config)
    , m_stopRequested(false)
    , m_slotsSinceTick(0)
{}

//=====================================================================
void CycleDriver::Stop () {
    m_stopRequested = true;
}

//=====================================================================
bool CycleDriver::RunSlot (DriverResult * result) {

    const bool tickDue = m_slotsSinceTick + 1 >= m_config.SlotsPerTimerTick();

    bool executed = false;
    bool counted  = false;
    bool ticked   = false;
    const Error error = m_session.RunSlot(tickDue, &executed, &counted, &ticked);

    ++result->slots;
    if (executed)
        ++result->steps;

    if (counted)
        m_slotsSinceTick = tickDue ? 0 : m_slotsSinceTick + 1;
    if (ticked)
        ++result->timerTicks;

    if (error.Ok())
        return true;

    result->lastError = error;

    char text[96];
    FormatError(error, text, sizeof(text));

    if (error.IsFatal() || m_config.haltOnUnknownInstruction) {
        Log(LogLevel::Error, LogTarget::Core, "Stopping: %s.", text);
        result->halted = true;
        return false;
    }

    Log(LogLevel::Info, LogTarget::Core, "Skipping: %s.", text);
    return true;

}

//=====================================================================
DriverResult CycleDriver::RunSlots (uint64_t slotCount) {

    DriverResult result;

    for (uint64_t slot = 0; slot < slotCount && !m_stopRequested; ++slot) {
        if (!RunSlot(&result))
            break;
    }

    m_stopRequested = false;
    return result;

}

//=====================================================================
DriverResult CycleDriver::RunRealtime (std::chrono::milliseconds duration) {

    typedef std::chrono::steady_clock Clock;

    DriverResult result;

    const unsigned hz = m_config.instructionHz ? m_config.instructionHz : 1;
    const Clock::duration period = std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds(1000000000ull / hz)
    );

    const Clock::time_point end = Clock::now() + duration;
    Clock::time_point next = Clock::now();

    while (!m_stopRequested && Clock::now() < end) {
        if (!RunSlot(&result))
            break;

        next += period;
        std::this_thread::sleep_until(next);
    }

    m_stopRequested = false;
    return result;

}

} // namespace Chip8Vm
