#pragma once

namespace Chip8Vm {

enum class LogLevel {
    Error,
    Warn,
    Info,
    Trace,
};

enum class LogTarget {
    Core,
    Input,
    Instructions,
    Drawing,
    Timer,
};

void     SetLogLevel (LogLevel level);
LogLevel GetLogLevel ();
bool     LogEnabled (LogLevel level);

// Redirects log output from stderr to the named file. Returns false if
// the file could not be opened; output then stays on stderr.
bool OpenLogFile (const char * path);
void CloseLogFile ();

const char * LogTargetName (LogTarget target);

void Log (LogLevel level, LogTarget target, const char * fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace Chip8Vm
