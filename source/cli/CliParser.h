#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for the inkcore tool.
 *
 * Supported commands:
 * - export: Export .inkc documents as SVG, PDF, Xournal++ or page images
 * - info: Summarize .inkc documents
 * - test: Run the built-in test suites
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
    Export,         ///< Export documents
    Info,           ///< Summarize documents
    Test            ///< Run test suites
};

/**
 * @brief Output mode for CLI progress/results.
 */
enum class OutputMode {
    Simple,         ///< One line per file (default)
    Verbose,        ///< Detailed per-file info
    Json            ///< JSON lines for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

namespace ExitCode {
    constexpr int Success = 0;        ///< All operations succeeded
    constexpr int PartialFailure = 1; ///< Some files failed
    constexpr int TotalFailure = 2;   ///< All files failed
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments
    constexpr int IoError = 4;        ///< Can't read/write files
    constexpr int Cancelled = 5;      ///< Operation cancelled (Ctrl+C)
}

// =============================================================================
// Command Detection
// =============================================================================

/**
 * @brief Extract the command keyword from argv[1].
 * @return The detected command, or Command::None
 */
Command parseCommand(int argc, char* argv[]);

/// @brief Command name as typed on the command line (e.g., "export").
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser with the options of a command.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Print the help text of a command.
 *
 * Command::None and Command::Help print the general help.
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Parse arguments, run the requested command and return an exit code.
 *
 * @param app The application instance (a QGuiApplication, exports paint text)
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
