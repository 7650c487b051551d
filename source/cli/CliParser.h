#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for qrpaper.
 * 
 * qrpaper is a headless tool: the first argument selects the command and
 * the remaining arguments are parsed by a command-specific
 * QCommandLineParser.
 * 
 * Supported commands:
 * - encode: Archive a file or web page as a printable QR code PDF
 * - decode: Rebuild the original bytes from such a PDF
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No or unknown command
    Help,           ///< Show help message
    Version,        ///< Show version information
    Encode,         ///< Payload to paper document
    Decode          ///< Paper document to payload
};

/**
 * @brief Output mode for CLI progress/results.
 */
enum class OutputMode {
    Simple,         ///< One line per stage (default)
    Verbose,        ///< Per-symbol and per-page progress, debug log
    Json            ///< JSON lines for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;        ///< Operation succeeded
    constexpr int PartialFailure = 1; ///< Succeeded, but pages or symbols were skipped
    constexpr int TotalFailure = 2;   ///< Operation failed
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments
    constexpr int IoError = 4;        ///< Can't read/write files or fetch the source
    constexpr int Cancelled = 5;      ///< Operation cancelled (Ctrl+C)
}

// =============================================================================
// CLI Detection
// =============================================================================

/**
 * @brief Quick check if the arguments name a CLI command or global flag.
 * 
 * @param argc Argument count from main()
 * @param argv Argument vector from main()
 * @return true if a command, --help or --version was given
 */
bool isCliMode(int argc, char* argv[]);

/**
 * @brief Parse the command from command-line arguments.
 * 
 * Extracts the command keyword from argv[1] if present.
 * 
 * @param argc Argument count
 * @param argv Argument vector
 * @return The detected command, or Command::None
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Get command name as string.
 * @param cmd The command
 * @return Command name string (e.g., "encode")
 */
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 * 
 * @param parser The parser to configure
 * @param cmd The command to set up options for
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Show help message for a command.
 * 
 * If cmd is Command::None or Command::Help, shows general help with
 * available commands. Otherwise shows command-specific help.
 * 
 * @param parser The configured parser
 * @param cmd The command
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

/**
 * @brief Show version information.
 */
void showVersion();

/**
 * @brief Application version string (matches CMakeLists.txt project VERSION).
 */
const char* appVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run CLI operations.
 * 
 * Parses arguments, executes the requested command, and returns an exit
 * code.
 * 
 * @param app The QCoreApplication instance
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
