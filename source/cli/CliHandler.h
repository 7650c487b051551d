#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for the qrpaper CLI.
 * 
 * Provides handler functions for each CLI command:
 * - encode: Archive a URL or file as a QR code PDF
 * - decode: Rebuild the original bytes from a QR code PDF
 * 
 * Each handler merges its options with the PaperSettings defaults, runs
 * the pipeline, and reports the result.
 */

#include "CliParser.h"
#include "../core/PaperTypes.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief Handle the encode command.
 * 
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleEncode(const QCommandLineParser& parser);

/**
 * @brief Handle the decode command.
 * 
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleDecode(const QCommandLineParser& parser);

/**
 * @brief Determine the output mode from parser options.
 * 
 * Checks for --verbose and --json flags.
 * Priority: --json > --verbose > Simple
 * 
 * @param parser The QCommandLineParser with parsed arguments
 * @return The output mode to use
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief Map a pipeline error to a CLI exit code.
 * 
 * - Cancelled → Cancelled (5)
 * - InvalidArgument → InvalidArgs (3)
 * - Io, Fetch → IoError (4)
 * - Anything else → TotalFailure (2)
 * 
 * @param error The error reported by the pipeline
 * @return Exit code
 */
int exitCodeFromError(PaperError error);

/**
 * @brief Default output PDF for an encode source.
 * 
 * URLs use the host name ("example.com.pdf"), files their base name
 * ("notes.pdf"), both in the current directory.
 */
QString defaultEncodeOutput(const QString& source, bool forceFile);

} // namespace Cli

#endif // CLIHANDLER_H
