#ifndef CLISIGNAL_H
#define CLISIGNAL_H

/**
 * @file CliSignal.h
 * @brief Ctrl+C handling for encode and decode runs.
 *
 * SIGINT and SIGTERM (CTRL_C_EVENT / CTRL_BREAK_EVENT on Windows) raise a
 * process-wide flag. The pipelines poll it between QR symbols and between
 * pages; a cancelled run leaves no output file behind and exits with
 * ExitCode::Cancelled.
 */

#include <atomic>

namespace Cli {

/**
 * @brief Route Ctrl+C to the cancellation flag.
 *
 * Call once before starting a pipeline. A second Ctrl+C is not special:
 * the run still stops at the next checkpoint.
 */
void installSignalHandlers();

/// Flag to pass as the @c cancelled argument of the Paper:: pipelines.
std::atomic<bool>* getCancellationFlag();

/// True once Ctrl+C has been pressed.
bool wasCancelled();

} // namespace Cli

#endif // CLISIGNAL_H
