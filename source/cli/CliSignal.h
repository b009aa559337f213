#ifndef CLISIGNAL_H
#define CLISIGNAL_H

/**
 * @file CliSignal.h
 * @brief Ctrl+C handling for batch commands.
 *
 * The first Ctrl+C sets a cancellation flag. Batch operations check it
 * between files, so the current file is finished and the partial results
 * are still reported.
 *
 * - Unix/Linux: sigaction() for SIGINT and SIGTERM
 * - Windows: SetConsoleCtrlHandler() for Ctrl+C and Ctrl+Break
 */

#include <atomic>

namespace Cli {

/// @brief Install the handlers. Called once before any batch operation.
void installSignalHandlers();

/**
 * @brief The flag set by the handlers, for BatchOps functions.
 * @return Never null
 */
std::atomic<bool>* getCancellationFlag();

bool wasCancelled();

/**
 * @brief Print the cancellation notice to stderr, once per cancellation.
 *
 * Signal handlers can't safely write output, so the notice is printed
 * from the normal flow after the flag has been seen.
 */
void reportCancellation();

} // namespace Cli

#endif // CLISIGNAL_H
