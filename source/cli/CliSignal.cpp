#include "CliSignal.h"

#include <QtGlobal>

#ifdef Q_OS_WIN
#include <windows.h>
#include <cstdio>
#else
#include <csignal>
#include <unistd.h>
#endif

namespace Cli {

static std::atomic<bool> g_cancelled(false);

#ifdef Q_OS_WIN

static std::atomic<bool> g_noticeShown(false);

static BOOL WINAPI onConsoleControl(DWORD event)
{
    if (event != CTRL_C_EVENT && event != CTRL_BREAK_EVENT) {
        // Close, logoff and shutdown terminate the process as usual
        return FALSE;
    }

    g_cancelled = true;
    if (!g_noticeShown.exchange(true)) {
        std::fputs("\nCancelling, no output will be written...\n", stderr);
        std::fflush(stderr);
    }
    return TRUE;
}

void installSignalHandlers()
{
    if (!SetConsoleCtrlHandler(onConsoleControl, TRUE)) {
        std::fputs("Warning: Ctrl+C handler could not be installed\n", stderr);
    }
}

#else

static void onTerminationSignal(int)
{
    // Only async-signal-safe calls from here on
    if (!g_cancelled.exchange(true)) {
        static const char notice[] = "\nCancelling, no output will be written...\n";
        ssize_t written = write(STDERR_FILENO, notice, sizeof(notice) - 1);
        (void)written;
    }
}

void installSignalHandlers()
{
    struct sigaction action = {};
    action.sa_handler = onTerminationSignal;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: a blocking read or network wait should return early
    action.sa_flags = 0;

    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

#endif

std::atomic<bool>* getCancellationFlag()
{
    return &g_cancelled;
}

bool wasCancelled()
{
    return g_cancelled.load();
}

} // namespace Cli
