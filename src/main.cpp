// chip8vm-run: loads a ROM, runs it headless for a number of cycles and
// dumps the machine state.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

#include "chip8vm/chip8.hpp"
#include "chip8vm/driver.hpp"
#include "chip8vm/log.hpp"
#include "chip8vm/session.hpp"

using namespace Chip8Vm;

//=====================================================================
//
// Static locals
//
//=====================================================================

struct Options {
    const char *  romPath;
    const char *  logPath;
    unsigned long slots;
    bool          realtime;
    bool          holdKey;
    uint8_t       key;
    LogLevel      logLevel;
    Config        config;
    DriverConfig  driver;

    Options ()
        : romPath(nullptr)
        , logPath(nullptr)
        , slots(1000)
        , realtime(false)
        , holdKey(false)
        , key(0)
        , logLevel(LogLevel::Warn)
    {}
};

//=====================================================================
static void PrintUsage (const char * argv0) {

    std::fprintf(
        stderr,
        "usage: %s [options] rom\n"
        "  -n SLOTS     cycles to run (default 1000)\n"
        "  -f HZ        instruction rate (default 700)\n"
        "  -r           pace the run in real time at the instruction rate\n"
        "  -k KEY       hold a key down (QWERTY: 1234 qwer asdf zxcv)\n"
        "  -v LEVEL     log level: error, warn, info, trace (default warn)\n"
        "  -l FILE      write the log to FILE instead of stderr\n"
        "  --keep-i     Fx55/Fx65 leave I unchanged\n"
        "  --keep-vf    8xy1/8xy2/8xy3 leave VF unchanged\n"
        "  --continue   log unknown instructions and keep running\n",
        argv0
    );

}

//=====================================================================
static bool ParseLevel (const char * text, LogLevel * level) {

    if (!std::strcmp(text, "error"))      *level = LogLevel::Error;
    else if (!std::strcmp(text, "warn"))  *level = LogLevel::Warn;
    else if (!std::strcmp(text, "info"))  *level = LogLevel::Info;
    else if (!std::strcmp(text, "trace")) *level = LogLevel::Trace;
    else return false;
    return true;

}

//=====================================================================
static bool ParseUnsigned (const char * text, unsigned long * value) {

    char * end = nullptr;
    const unsigned long parsed = std::strtoul(text, &end, 10);
    if (!*text || !end || *end)
        return false;
    *value = parsed;
    return true;

}

//=====================================================================
static bool ParseArgs (int argc, char ** argv, Options * opts) {

    for (int i = 1; i < argc; ++i) {
        const char * arg  = argv[i];
        const char * next = (i + 1 < argc) ? argv[i + 1] : nullptr;

        if (!std::strcmp(arg, "-n") && next) {
            if (!ParseUnsigned(next, &opts->slots))
                return false;
            ++i;
        }
        else if (!std::strcmp(arg, "-f") && next) {
            unsigned long hz = 0;
            if (!ParseUnsigned(next, &hz) || !hz)
                return false;
            opts->driver.instructionHz = static_cast<unsigned>(hz);
            ++i;
        }
        else if (!std::strcmp(arg, "-r")) {
            opts->realtime = true;
        }
        else if (!std::strcmp(arg, "-k") && next) {
            if (std::strlen(next) != 1 || !KeyForChar(next[0], &opts->key))
                return false;
            opts->holdKey = true;
            ++i;
        }
        else if (!std::strcmp(arg, "-v") && next) {
            if (!ParseLevel(next, &opts->logLevel))
                return false;
            ++i;
        }
        else if (!std::strcmp(arg, "-l") && next) {
            opts->logPath = next;
            ++i;
        }
        else if (!std::strcmp(arg, "--keep-i")) {
            opts->config.loadStoreAdvancesI = false;
        }
        else if (!std::strcmp(arg, "--keep-vf")) {
            opts->config.logicOpsResetVf = false;
        }
        else if (!std::strcmp(arg, "--continue")) {
            opts->driver.haltOnUnknownInstruction = false;
        }
        else if (arg[0] == '-' || opts->romPath) {
            return false;
        }
        else {
            opts->romPath = arg;
        }
    }

    return opts->romPath != nullptr;

}

//=====================================================================
static void PrintSnapshot (const Snapshot & snap) {

    std::printf("PC=%04X  I=%04X  DT=%02X  SP=%u  mode=%s", snap.pc, snap.i, snap.delayTimer, unsigned(snap.stackDepth), ModeName(snap.mode.kind));
    if (snap.mode.kind == ModeKind::WaitForKey)
        std::printf("(V%X)", unsigned(snap.mode.reg));
    std::printf("\n");

    for (unsigned reg = 0; reg < Chip8::s_registerCount; ++reg) {
        std::printf("V%X=%02X%s", reg, snap.v[reg], (reg % 8 == 7) ? "\n" : "  ");
    }

}

//=====================================================================
static void PrintHistory (const std::vector<HistoryEntry> & history) {

    char text[32];
    for (std::size_t i = 0; i < history.size(); ++i) {
        FormatInstruction(history[i].instr, text, sizeof(text));
        std::printf("  %04X:  %04X   %s\n", history[i].pc, history[i].instr.word, text);
    }

}

//=====================================================================
static void PrintDisplay (const uint8_t * vram) {

    char row[Chip8::s_renderWidth + 1];
    for (unsigned y = 0; y < Chip8::s_renderHeight; ++y) {
        for (unsigned x = 0; x < Chip8::s_renderWidth; ++x)
            row[x] = vram[Chip8::s_renderWidth * y + x] ? '#' : ' ';
        row[Chip8::s_renderWidth] = '\0';
        std::printf("|%s|\n", row);
    }

}


//=====================================================================
//
// Entry point
//
//=====================================================================

//=====================================================================
int main (int argc, char ** argv) {

    Options opts;
    if (!ParseArgs(argc, argv, &opts)) {
        PrintUsage(argv[0]);
        return 1;
    }

    SetLogLevel(opts.logLevel);
    if (opts.logPath && !OpenLogFile(opts.logPath))
        return 1;

    Session session(opts.config);

    Error error;
    if (!session.LoadProgram(opts.romPath, &error)) {
        std::fprintf(stderr, "Chip8: Failed to load {%s}: %s.\n", opts.romPath, ErrorCodeName(error.code));
        CloseLogFile();
        return 1;
    }

    if (opts.holdKey)
        session.KeyDown(opts.key);

    CycleDriver driver(session, opts.driver);
    DriverResult result;
    if (opts.realtime) {
        const unsigned long ms = opts.slots * 1000ul / opts.driver.instructionHz;
        result = driver.RunRealtime(std::chrono::milliseconds(ms));
    }
    else {
        result = driver.RunSlots(opts.slots);
    }

    std::printf(
        "slots=%llu  steps=%llu  timer ticks=%llu\n",
        static_cast<unsigned long long>(result.slots),
        static_cast<unsigned long long>(result.steps),
        static_cast<unsigned long long>(result.timerTicks)
    );
    if (!result.lastError.Ok()) {
        char text[96];
        FormatError(result.lastError, text, sizeof(text));
        std::printf("%s: %s\n", result.halted ? "halted" : "last error", text);
    }

    PrintSnapshot(session.GetSnapshot());

    std::vector<HistoryEntry> history;
    session.CopyHistory(&history);
    std::printf("recent instructions:\n");
    PrintHistory(history);

    std::vector<uint8_t> vram(Chip8::s_renderWidth * Chip8::s_renderHeight);
    session.CopyDisplay(vram.data());
    PrintDisplay(vram.data());

    CloseLogFile();
    return result.halted ? 2 : 0;

}
