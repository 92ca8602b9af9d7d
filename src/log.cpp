#include <cstdarg> // for var args
#include <cstdio>

#include "chip8vm/log.hpp"

namespace Chip8Vm {

//=====================================================================
//
// Static locals
//
//=====================================================================

static LogLevel    s_level   = LogLevel::Warn;
static std::FILE * s_logFile = nullptr;

//=====================================================================
static const char * LevelName (LogLevel level) {

    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Trace: return "trace";
    }
    return "?";

}


//=====================================================================
//
// Log definitions
//
//=====================================================================

//=====================================================================
void SetLogLevel (LogLevel level) {
    s_level = level;
}

//=====================================================================
LogLevel GetLogLevel () {
    return s_level;
}

//=====================================================================
bool LogEnabled (LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(s_level);
}

//=====================================================================
bool OpenLogFile (const char * path) {

    CloseLogFile();

    s_logFile = std::fopen(path, "w");
    if (!s_logFile) {
        std::fprintf(stderr, "Chip8: Failed to open log file at {%s}.\n", path);
        return false;
    }

    return true;

}

//=====================================================================
void CloseLogFile () {

    if (s_logFile) {
        std::fclose(s_logFile);
        s_logFile = nullptr;
    }

}

//=====================================================================
const char * LogTargetName (LogTarget target) {

    switch (target) {
        case LogTarget::Core:         return "CORE";
        case LogTarget::Input:        return "INPUT";
        case LogTarget::Instructions: return "INSTR";
        case LogTarget::Drawing:      return "DRAW";
        case LogTarget::Timer:        return "TIMER";
    }
    return "?";

}

//=====================================================================
void Log (LogLevel level, LogTarget target, const char * fmt, ...) {

    if (!LogEnabled(level))
        return;

    char buff[1000];
    va_list args;

    va_start(args, fmt);
    std::vsnprintf(buff, sizeof(buff), fmt, args);
    va_end(args);

    std::FILE * out = s_logFile ? s_logFile : stderr;
    std::fprintf(out, "Chip8: [%s] %s: %s\n", LevelName(level), LogTargetName(target), buff);

    // keep the tail of the log when a run is cut short
    if (s_logFile)
        std::fflush(s_logFile);

}

} // namespace Chip8Vm
