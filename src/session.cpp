#include <cstring>

#include "chip8vm/session.hpp"

namespace Chip8Vm {

typedef std::lock_guard<std::mutex> Lock;

//=====================================================================
Session::Session (const Config & config) {
    m_chip8.Initialize(config);
}

//=====================================================================
bool Session::LoadProgram (const char * path, Error * error) {
    Lock lock(m_mutex);
    return m_chip8.LoadProgram(path, error);
}

//=====================================================================
bool Session::LoadProgram (const uint8_t * bytes, std::size_t size, Error * error) {
    Lock lock(m_mutex);
    return m_chip8.LoadProgram(bytes, size, error);
}

//=====================================================================
Error Session::EmulateCycle (bool * executed) {
    Lock lock(m_mutex);
    return m_chip8.EmulateCycle(executed);
}

//=====================================================================
void Session::TickTimer () {
    Lock lock(m_mutex);
    m_chip8.TickTimer();
}

//=====================================================================
Error Session::RunSlot (bool tickDue, bool * executed, bool * counted, bool * ticked) {

    Lock lock(m_mutex);

    const bool paused = m_chip8.m_mode.kind == ModeKind::Paused;

    bool stepped = false;
    const Error error = m_chip8.EmulateCycle(&stepped);

    const bool elapsed = !paused || stepped;
    if (elapsed && tickDue)
        m_chip8.TickTimer();

    if (executed)
        *executed = stepped;
    if (counted)
        *counted = elapsed;
    if (ticked)
        *ticked = elapsed && tickDue;
    return error;

}

//=====================================================================
void Session::KeyDown (uint8_t key) {
    Lock lock(m_mutex);
    m_chip8.KeyDown(key);
}

//=====================================================================
void Session::KeyUp (uint8_t key) {
    Lock lock(m_mutex);
    m_chip8.KeyUp(key);
}

//=====================================================================
bool Session::SetPaused (bool paused) {
    Lock lock(m_mutex);
    return m_chip8.SetPaused(paused);
}

//=====================================================================
bool Session::RequestStep () {
    Lock lock(m_mutex);
    return m_chip8.RequestStep();
}

//=====================================================================
Mode Session::GetMode () const {
    Lock lock(m_mutex);
    return m_chip8.m_mode;
}

//=====================================================================
Snapshot Session::GetSnapshot () const {
    Lock lock(m_mutex);
    return m_chip8.GetSnapshot();
}

//=====================================================================
bool Session::CopyDisplay (uint8_t * out) {

    Lock lock(m_mutex);

    if (out)
        std::memcpy(out, m_chip8.m_renderOut, sizeof(m_chip8.m_renderOut));

    const bool redraw = m_chip8.m_drawFlag;
    m_chip8.m_drawFlag = false;
    return redraw;

}

//=====================================================================
void Session::CopyHistory (std::vector<HistoryEntry> * out) const {

    if (!out)
        return;

    Lock lock(m_mutex);
    out->assign(m_chip8.m_history.begin(), m_chip8.m_history.end());

}

} // namespace Chip8Vm
