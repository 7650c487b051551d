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

// Application version (matches CMakeLists.txt project VERSION)
static const char* APP_VERSION = "1.0.0";

const char* appVersion()
{
    return APP_VERSION;
}

// =============================================================================
// CLI Detection
// =============================================================================

bool isCliMode(int argc, char* argv[])
{
    return parseCommand(argc, argv) != Command::None;
}

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }
    
    const char* arg1 = argv[1];
    
    // Check for commands
    if (std::strcmp(arg1, "encode") == 0) {
        return Command::Encode;
    }
    if (std::strcmp(arg1, "decode") == 0) {
        return Command::Decode;
    }
    
    // Check for global flags
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
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
        case Command::Encode:  return QStringLiteral("encode");
        case Command::Decode:  return QStringLiteral("decode");
        case Command::Help:    return QStringLiteral("help");
        case Command::Version: return QStringLiteral("version");
        default:               return QString();
    }
}

// =============================================================================
// Parser Setup
// =============================================================================

static void addCommonOptions(QCommandLineParser& parser)
{
    parser.addOption(QCommandLineOption(
        QStringLiteral("overwrite"),
        QCoreApplication::translate("CLI", "Overwrite an existing output file")));
    
    parser.addOption(QCommandLineOption(
        QStringLiteral("verbose"),
        QCoreApplication::translate("CLI", "Show detailed progress")));
    
    parser.addOption(QCommandLineOption(
        QStringLiteral("json"),
        QCoreApplication::translate("CLI", "Output results as JSON")));
}

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "qrpaper - Archive data on paper as QR codes"));
    
    // Add standard help option (--help, -h)
    parser.addHelpOption();
    
    // Add version option (--version, -v)
    parser.addVersionOption();
    
    switch (cmd) {
        case Command::Encode:
            parser.addPositionalArgument(
                QStringLiteral("source"),
                QCoreApplication::translate("CLI", "URL or file to archive"),
                QStringLiteral("<source>"));
            
            parser.addPositionalArgument(
                QStringLiteral("output"),
                QCoreApplication::translate("CLI", "Output PDF (default: <source name>.pdf)"),
                QStringLiteral("[output.pdf]"));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("file"),
                QCoreApplication::translate("CLI", "Treat the source as a local file even if it looks like a URL")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("layout"),
                QCoreApplication::translate("CLI", "Page layout: single or stacked"),
                QStringLiteral("name")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("dpi"),
                QCoreApplication::translate("CLI", "Composition DPI (default: 300)"),
                QStringLiteral("N")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("chunk-size"),
                QCoreApplication::translate("CLI", "Characters per QR code (default: layout dependent)"),
                QStringLiteral("N")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("threads"),
                QCoreApplication::translate("CLI", "QR rendering workers (default: 1)"),
                QStringLiteral("N")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("no-info-page"),
                QCoreApplication::translate("CLI", "Don't add the information page")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("indexed"),
                QCoreApplication::translate("CLI", "Prefix every QR code with its index")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("timeout"),
                QCoreApplication::translate("CLI", "Download timeout in milliseconds"),
                QStringLiteral("ms")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("dry-run"),
                QCoreApplication::translate("CLI", "Print the encoded text instead of writing a PDF")));
            
            addCommonOptions(parser);
            break;
            
        case Command::Decode:
            parser.addPositionalArgument(
                QStringLiteral("input"),
                QCoreApplication::translate("CLI", "PDF written by qrpaper encode"),
                QStringLiteral("<input.pdf>"));
            
            parser.addPositionalArgument(
                QStringLiteral("output"),
                QCoreApplication::translate("CLI", "File to write the recovered data to"),
                QStringLiteral("<output-file>"));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("dpi"),
                QCoreApplication::translate("CLI", "Scan DPI (must match the document)"),
                QStringLiteral("N")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("layout"),
                QCoreApplication::translate("CLI", "Page layout for documents without QrPaper properties"),
                QStringLiteral("name")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("info-pages"),
                QCoreApplication::translate("CLI", "Leading pages without QR codes, for documents without QrPaper properties (default: 0 for single, 1 for stacked)"),
                QStringLiteral("N")));
            
            addCommonOptions(parser);
            break;
            
        default:
            // No command-specific options for Help/Version/None
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
        // General help - show available commands
        out << QCoreApplication::translate("CLI",
            "Usage: qrpaper <command> [options] [arguments...]\n"
            "\n"
            "qrpaper - Archive a web page or file on paper as a series of QR codes,\n"
            "and rebuild the original bytes from the printed (or rendered) PDF.\n"
            "\n"
            "COMMANDS:\n"
            "  encode          Compress, encode and print data as a QR code PDF\n"
            "  decode          Scan a QR code PDF and rebuild the original data\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help      Show this help message\n"
            "  -v, --version   Show version information\n"
            "\n"
            "COMMON OPTIONS (work with all commands):\n"
            "  --verbose       Show detailed progress\n"
            "  --json          Output results as JSON (for scripting)\n"
            "  --overwrite     Overwrite an existing output file\n"
            "\n"
            "QUICK START:\n"
            "  # Archive a web page\n"
            "  qrpaper encode https://example.com page.pdf\n"
            "\n"
            "  # Get it back\n"
            "  qrpaper decode page.pdf page.html\n"
            "\n"
            "EXIT CODES:\n"
            "  0   Operation succeeded\n"
            "  1   Succeeded, but some pages or symbols were skipped\n"
            "  2   Operation failed\n"
            "  3   Invalid arguments\n"
            "  4   File or network error\n"
            "  5   Cancelled (Ctrl+C)\n"
            "\n"
            "Run 'qrpaper <command> --help' for command-specific options.\n");
    } else if (cmd == Command::Encode) {
        out << QCoreApplication::translate("CLI",
            "Usage: qrpaper encode [OPTIONS] <source> [output.pdf]\n"
            "\n"
            "Archive a URL or file as printable QR codes.\n"
            "The data is zlib-compressed, base64-encoded and split into chunks;\n"
            "each chunk becomes one QR code at error-correction level H.\n"
            "\n"
            "ARGUMENTS:\n"
            "  <source>                http(s) URL or local file\n"
            "  [output.pdf]            Output PDF (default: <source name>.pdf)\n"
            "\n"
            "SOURCE OPTIONS:\n"
            "  --file                  Treat <source> as a local file\n"
            "  --timeout <ms>          Page download timeout (default: 10000)\n"
            "                          Images on a page are inlined with a 5000 ms\n"
            "                          timeout each; failed images are dropped\n"
            "\n"
            "LAYOUT OPTIONS:\n"
            "  --layout <name>         single  - one large QR code per 8x8 in page (default)\n"
            "                          stacked - two 100 mm QR codes per Letter page\n"
            "  --dpi <N>               Composition DPI (default: 300)\n"
            "  --chunk-size <N>        Characters per QR code\n"
            "                          (default: 1000 single, 800 stacked)\n"
            "  --no-info-page          Don't add the information page\n"
            "  --indexed               Prefix every QR code with its 6-digit index\n"
            "  --threads <N>           QR rendering workers (default: 1)\n"
            "\n"
            "COMMON OPTIONS:\n"
            "  --overwrite             Overwrite an existing output file\n"
            "  --dry-run               Print the encoded text, write nothing\n"
            "  --verbose               Show detailed progress\n"
            "  --json                  Output results as JSON\n"
            "  -h, --help              Show this help\n"
            "\n"
            "EXAMPLES:\n"
            "  # Archive a web page with its images\n"
            "  qrpaper encode https://example.com example.pdf\n"
            "\n"
            "  # Archive a local file, two codes per page\n"
            "  qrpaper encode notes.txt notes.pdf --layout stacked\n"
            "\n"
            "  # See how many QR codes a file needs\n"
            "  qrpaper encode big.bin --dry-run --verbose > /dev/null\n"
            "\n"
            "Defaults can be changed in the qrpaper settings file (QSettings).\n");
    } else if (cmd == Command::Decode) {
        out << QCoreApplication::translate("CLI",
            "Usage: qrpaper decode [OPTIONS] <input.pdf> <output-file>\n"
            "\n"
            "Rebuild the original data from a qrpaper PDF.\n"
            "Pages are rendered at the DPI stored in the document, every QR code\n"
            "is decoded and the chunks are put back in order. The output file is\n"
            "only written if every chunk was recovered.\n"
            "\n"
            "ARGUMENTS:\n"
            "  <input.pdf>             PDF written by qrpaper encode\n"
            "  <output-file>           Where to write the recovered data\n"
            "\n"
            "SCAN OPTIONS:\n"
            "  --dpi <N>               Scan DPI; must equal the stored DPI\n"
            "                          (default: stored DPI, or 300)\n"
            "  --layout <name>         Layout of documents without QrPaper properties\n"
            "  --info-pages <N>        Leading pages without QR codes, for documents\n"
            "                          without QrPaper properties\n"
            "                          (default: 0 for single, 1 for stacked)\n"
            "\n"
            "COMMON OPTIONS:\n"
            "  --overwrite             Overwrite an existing output file\n"
            "  --verbose               Show detailed progress\n"
            "  --json                  Output results as JSON\n"
            "  -h, --help              Show this help\n"
            "\n"
            "EXAMPLES:\n"
            "  qrpaper decode example.pdf example.html\n"
            "  qrpaper decode scan.pdf data.bin --json\n");
    } else {
        // Fallback to parser's help text
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "qrpaper " << APP_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)
    
    // Install signal handlers for graceful Ctrl+C handling
    installSignalHandlers();
    
    // Parse the command
    Command cmd = parseCommand(argc, argv);
    
    // Handle help and version immediately
    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }
    
    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }
    
    // Set up parser for the specific command
    QCommandLineParser parser;
    setupParser(parser, cmd);
    
    // Build argument list without the command name
    // (QCommandLineParser doesn't understand subcommands)
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);  // Program name
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }
    
    // Parse arguments
    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ") 
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }
    
    // Check for help flag on specific command
    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }
    
    // Check for version flag
    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }
    
    // Dispatch to command handlers
    switch (cmd) {
        case Command::Encode:
            return handleEncode(parser);
        case Command::Decode:
            return handleDecode(parser);
        default:
            // Should not reach here - Help/Version/None handled above
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
