#include "CliSignal.h"

#include <QTextStream>

#ifdef Q_OS_WIN
#include <windows.h>
#else
#include <csignal>
#endif

namespace Cli {

static std::atomic<bool> g_cancelled(false);
static std::atomic<bool> g_noticePrinted(false);

// =============================================================================
// Platform Handlers
// =============================================================================

#ifdef Q_OS_WIN

static BOOL WINAPI consoleCtrlHandler(DWORD ctrlType)
{
    if (ctrlType == CTRL_C_EVENT || ctrlType == CTRL_BREAK_EVENT) {
        g_cancelled = true;
        return TRUE;
    }
    // Close, logoff and shutdown terminate the process
    return FALSE;
}

void installSignalHandlers()
{
    SetConsoleCtrlHandler(consoleCtrlHandler, TRUE);
}

#else

// Async-signal-safe: only touches the atomic flag
static void cancelHandler(int)
{
    g_cancelled = true;
}

void installSignalHandlers()
{
    struct sigaction sa;
    sa.sa_handler = cancelHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

#endif

// =============================================================================
// Public API
// =============================================================================

std::atomic<bool>* getCancellationFlag()
{
    return &g_cancelled;
}

bool wasCancelled()
{
    return g_cancelled.load();
}

void reportCancellation()
{
    if (!g_cancelled.load() || g_noticePrinted.exchange(true)) {
        return;
    }
    // stderr keeps JSON output on stdout intact
    QTextStream err(stderr);
    err << "\nCancellation requested. Remaining files are skipped.\n";
    err.flush();
}

} // namespace Cli
