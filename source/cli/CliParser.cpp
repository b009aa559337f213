#include "CliParser.h"
#include "CliHandler.h"
#include "CliSignal.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

namespace Cli {

// Matches the project VERSION in CMakeLists.txt
static const char* APP_VERSION = "0.4.0";

// =============================================================================
// Command Detection
// =============================================================================

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }

    const char* arg1 = argv[1];

    if (std::strcmp(arg1, "export") == 0) {
        return Command::Export;
    }
    if (std::strcmp(arg1, "info") == 0) {
        return Command::Info;
    }
    if (std::strcmp(arg1, "test") == 0) {
        return Command::Test;
    }
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0
        || std::strcmp(arg1, "help") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }

    return Command::None;
}

QString commandName(Command cmd)
{
    switch (cmd) {
        case Command::Export:  return QStringLiteral("export");
        case Command::Info:    return QStringLiteral("info");
        case Command::Test:    return QStringLiteral("test");
        case Command::Help:    return QStringLiteral("help");
        case Command::Version: return QStringLiteral("version");
        default:               return QString();
    }
}

// =============================================================================
// Parser Setup
// =============================================================================

static void addFlag(QCommandLineParser& parser, const QString& name, const char* description)
{
    parser.addOption(QCommandLineOption(name, QCoreApplication::translate("CLI", description)));
}

static void addValueOption(QCommandLineParser& parser, const QStringList& names,
                           const char* description, const QString& valueName)
{
    parser.addOption(QCommandLineOption(names, QCoreApplication::translate("CLI", description),
                                        valueName));
}

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "InkCore - stroke store and export engine"));

    parser.addHelpOption();
    parser.addVersionOption();

    switch (cmd) {
        case Command::Export:
            parser.addPositionalArgument(
                QStringLiteral("input"),
                QCoreApplication::translate("CLI", "Documents (.inkc files) or directories"),
                QStringLiteral("[input...]"));

            addValueOption(parser, {QStringLiteral("o"), QStringLiteral("output")},
                           "Output file (single document) or directory", QStringLiteral("path"));
            addValueOption(parser, {QStringLiteral("f"), QStringLiteral("format")},
                           "svg, pdf or xopp; with --pages or --selection: svg, png or jpeg",
                           QStringLiteral("format"));
            addFlag(parser, QStringLiteral("pages"), "Export one file per page");
            addFlag(parser, QStringLiteral("selection"), "Export the selected strokes only");
            addFlag(parser, QStringLiteral("no-background"), "Leave out the background");
            addFlag(parser, QStringLiteral("no-pattern"), "Leave out the background pattern");
            addFlag(parser, QStringLiteral("optimize-printing"), "White background, dark strokes");
            addFlag(parser, QStringLiteral("column-major"), "Order pages column by column");
            addValueOption(parser, {QStringLiteral("scale")},
                           "Bitmap pixels per document unit", QStringLiteral("N"));
            addValueOption(parser, {QStringLiteral("quality")},
                           "JPEG quality, 1 to 100", QStringLiteral("N"));
            addValueOption(parser, {QStringLiteral("margin")},
                           "Margin around an exported selection", QStringLiteral("N"));
            addFlag(parser, QStringLiteral("overwrite"), "Overwrite existing output files");
            addFlag(parser, QStringLiteral("recursive"), "Search input directories recursively");
            addFlag(parser, QStringLiteral("fail-fast"), "Stop on first error");
            addFlag(parser, QStringLiteral("verbose"), "Show detailed progress");
            addFlag(parser, QStringLiteral("json"), "Output results as JSON");
            addFlag(parser, QStringLiteral("dry-run"), "Preview without creating files");
            break;

        case Command::Info:
            parser.addPositionalArgument(
                QStringLiteral("input"),
                QCoreApplication::translate("CLI", "Documents (.inkc files) or directories"),
                QStringLiteral("[input...]"));

            addFlag(parser, QStringLiteral("recursive"), "Search input directories recursively");
            addFlag(parser, QStringLiteral("json"), "Output results as JSON");
            break;

        case Command::Test:
            parser.addPositionalArgument(
                QStringLiteral("suite"),
                QCoreApplication::translate("CLI", "Test suite to run (default: all)"),
                QStringLiteral("[suite]"));
            break;

        default:
            break;
    }
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: inkcore <command> [options] [files...]\n"
            "\n"
            "InkCore - stroke store and export engine for handwritten notes.\n"
            "\n"
            "COMMANDS:\n"
            "  export          Export documents as SVG, PDF, Xournal++ or images\n"
            "  info            Show stroke counts and bounds of documents\n"
            "  test [suite]    Run the built-in test suites\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help      Show this help message\n"
            "  -v, --version   Show version information\n"
            "\n"
            "QUICK START:\n"
            "  # Export a document to PDF\n"
            "  inkcore export Lecture.inkc -o lecture.pdf\n"
            "\n"
            "  # Export every page of every document as PNG\n"
            "  inkcore export ~/Notes/ -o ~/Images/ --pages --format png\n"
            "\n"
            "  # Summarize documents as JSON\n"
            "  inkcore info ~/Notes/ --json\n"
            "\n"
            "EXIT CODES:\n"
            "  0   All operations succeeded\n"
            "  1   Some files failed\n"
            "  2   All files failed\n"
            "  3   Invalid arguments\n"
            "  4   Output directory could not be created\n"
            "  5   Cancelled (Ctrl+C)\n"
            "\n"
            "Run 'inkcore <command> --help' for command-specific options.\n");
    } else if (cmd == Command::Export) {
        out << QCoreApplication::translate("CLI",
            "Usage: inkcore export [OPTIONS] <input>... -o <output>\n"
            "\n"
            "Export documents. Options that are not given are taken from the\n"
            "export preferences stored in each document.\n"
            "\n"
            "ARGUMENTS:\n"
            "  <input>...              .inkc files or directories\n"
            "\n"
            "OUTPUT OPTIONS:\n"
            "  -o, --output <path>     Output file (single document) or directory [required]\n"
            "  -f, --format <format>   svg, pdf or xopp (document)\n"
            "                          svg, png or jpeg (--pages, --selection)\n"
            "  --pages                 One file per page, named \"<name> - page <N>.<ext>\"\n"
            "  --selection             Only the selected strokes\n"
            "  --overwrite             Overwrite existing files\n"
            "\n"
            "EXPORT OPTIONS:\n"
            "  --no-background         Leave out the background color and pattern\n"
            "  --no-pattern            Leave out the background pattern\n"
            "  --optimize-printing     White background, dark strokes\n"
            "  --column-major          Order pages column by column\n"
            "  --scale <N>             Bitmap pixels per document unit (default: 1.8)\n"
            "  --quality <N>           JPEG quality, 1 to 100 (default: 85)\n"
            "  --margin <N>            Margin around an exported selection (default: 12)\n"
            "\n"
            "COMMON OPTIONS:\n"
            "  --recursive             Search directories recursively\n"
            "  --verbose               Show detailed progress\n"
            "  --json                  Output results as JSON\n"
            "  --fail-fast             Stop on first error\n"
            "  --dry-run               Preview without creating files\n"
            "  -h, --help              Show this help\n"
            "\n"
            "EXAMPLES:\n"
            "  inkcore export Lecture.inkc -o lecture.pdf\n"
            "  inkcore export ~/Notes/ -o ~/Export/ --format xopp --recursive\n"
            "  inkcore export Sketch.inkc -o ~/Images/ --pages --format jpeg --quality 70\n"
            "  inkcore export Sketch.inkc -o figure.svg --selection --no-background\n");
    } else if (cmd == Command::Info) {
        out << QCoreApplication::translate("CLI",
            "Usage: inkcore info [OPTIONS] <input>...\n"
            "\n"
            "Show layout, page count, stroke counts and bounds of documents.\n"
            "\n"
            "OPTIONS:\n"
            "  --recursive             Search directories recursively\n"
            "  --json                  Output one JSON object per document\n"
            "  -h, --help              Show this help\n");
    } else if (cmd == Command::Test) {
        out << QCoreApplication::translate("CLI",
            "Usage: inkcore test [suite]\n"
            "\n"
            "Run the built-in test suites. Suites:\n"
            "  strokes, spatial_index, stroke_store, history, render_scheduler,\n"
            "  export, snapshot, document, all (default)\n");
    } else {
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "InkCore " << APP_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)

    installSignalHandlers();

    const Command cmd = parseCommand(argc, argv);

    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        if (cmd == Command::None && argc >= 2) {
            QTextStream err(stderr);
            err << QCoreApplication::translate("CLI", "Error: unknown command '%1'\n\n")
                       .arg(QString::fromLocal8Bit(argv[1]));
        }
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // QCommandLineParser doesn't understand subcommands
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }

    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }
    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    switch (cmd) {
        case Command::Export:
            return handleExport(parser);
        case Command::Info:
            return handleInfo(parser);
        case Command::Test:
            return handleTest(parser);
        default:
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
