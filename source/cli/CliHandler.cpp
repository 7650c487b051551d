#include "CliHandler.h"
#include "CliProgress.h"
#include "CliSignal.h"
#include "../core/PaperSettings.h"
#include "../payload/PayloadSource.h"
#include "../pipeline/PaperPipeline.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTextStream>
#include <QUrl>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 * 
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

int exitCodeFromError(PaperError error)
{
    switch (error) {
        case PaperError::None:            return ExitCode::Success;
        case PaperError::Cancelled:       return ExitCode::Cancelled;
        case PaperError::InvalidArgument: return ExitCode::InvalidArgs;
        case PaperError::Io:
        case PaperError::Fetch:           return ExitCode::IoError;
        default:                          return ExitCode::TotalFailure;
    }
}

QString defaultEncodeOutput(const QString& source, bool forceFile)
{
    QString base;
    if (!forceFile && PayloadSource::isUrl(source)) {
        base = QUrl(source).host();
    } else {
        base = QFileInfo(source).completeBaseName();
    }
    if (base.isEmpty()) {
        base = QStringLiteral("qrpaper");
    }
    return QDir::current().absoluteFilePath(base + QStringLiteral(".pdf"));
}

// Debug output only with --verbose
static void configureLogging(OutputMode mode)
{
    if (mode != OutputMode::Verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("default.debug=false"));
    }
}

// Read a positive integer option; false with an error reported if malformed
static bool readPositiveOption(const QCommandLineParser& parser, const QString& name,
                               int* value, ConsoleProgress& progress)
{
    if (!parser.isSet(name)) {
        return true;
    }
    bool ok = false;
    const int parsed = parser.value(name).toInt(&ok);
    if (!ok || parsed <= 0) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Invalid value for --%1: %2 (expected a positive integer)")
            .arg(name, parser.value(name)));
        return false;
    }
    *value = parsed;
    return true;
}

static bool readLayoutOption(const QCommandLineParser& parser, LayoutKind* layout,
                             ConsoleProgress& progress)
{
    if (!parser.isSet(QStringLiteral("layout"))) {
        return true;
    }
    const QString name = parser.value(QStringLiteral("layout"));
    if (!parseLayoutKind(name, layout)) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Unknown layout '%1' (expected single or stacked)").arg(name));
        return false;
    }
    return true;
}

static int cancelledExit(ConsoleProgress& progress)
{
    progress.reportWarning(QCoreApplication::translate("CLI", "Operation cancelled, nothing was written."));
    return ExitCode::Cancelled;
}

// =============================================================================
// Encode Handler
// =============================================================================

int handleEncode(const QCommandLineParser& parser)
{
    OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);
    configureLogging(outputMode);
    
    const QStringList args = parser.positionalArguments();
    if (args.isEmpty() || args.size() > 2) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Expected <source> [output.pdf]. Use 'qrpaper encode --help' for usage."));
        return ExitCode::InvalidArgs;
    }
    
    const PaperSettings settings = PaperSettings::load();
    const bool forceFile = parser.isSet(QStringLiteral("file"));
    const QString source = args.at(0);
    
    Paper::EncodeOptions options;
    options.layout = settings.layout;
    options.dpi = settings.dpi;
    options.threads = settings.threads;
    options.includeInfoPage = settings.infoPage && !parser.isSet(QStringLiteral("no-info-page"));
    options.indexed = settings.indexed || parser.isSet(QStringLiteral("indexed"));
    options.dryRun = parser.isSet(QStringLiteral("dry-run"));
    
    int timeoutMs = settings.fetchTimeoutMs;
    
    if (!readLayoutOption(parser, &options.layout, progress) ||
        !readPositiveOption(parser, QStringLiteral("dpi"), &options.dpi, progress) ||
        !readPositiveOption(parser, QStringLiteral("chunk-size"), &options.chunkSize, progress) ||
        !readPositiveOption(parser, QStringLiteral("threads"), &options.threads, progress) ||
        !readPositiveOption(parser, QStringLiteral("timeout"), &timeoutMs, progress)) {
        return ExitCode::InvalidArgs;
    }
    
    if (!options.dryRun) {
        options.outputPath = (args.size() == 2)
            ? QDir::cleanPath(QDir::current().absoluteFilePath(args.at(1)))
            : defaultEncodeOutput(source, forceFile);
        
        if (QFileInfo::exists(options.outputPath) && !parser.isSet(QStringLiteral("overwrite"))) {
            progress.reportError(QCoreApplication::translate("CLI",
                "%1 already exists. Use --overwrite to replace it.").arg(options.outputPath));
            return ExitCode::InvalidArgs;
        }
    }
    
    // ===== Fetch =====
    std::unique_ptr<PayloadSource> payloadSource =
        PayloadSource::create(source, forceFile, timeoutMs, settings.imageTimeoutMs);
    
    progress.callback()(0, 0, QCoreApplication::translate("CLI", "Fetching %1").arg(source));
    FetchResult fetched = payloadSource->fetch(source);
    if (!fetched.success) {
        progress.reportError(fetched.errorMessage);
        return ExitCode::IoError;
    }
    
    if (wasCancelled()) {
        return cancelledExit(progress);
    }
    
    // ===== Encode =====
    Paper::EncodeResult result = Paper::encodePayload(
        fetched.data, options, progress.callback(), getCancellationFlag());
    
    if (result.error == PaperError::Cancelled) {
        return cancelledExit(progress);
    }
    
    if (result.success && options.dryRun && outputMode != OutputMode::Json) {
        QTextStream out(stdout);
        out << result.encodedText << "\n";
        out.flush();
    }
    
    progress.reportEncode(result, source, options.outputPath, options.dryRun);
    return exitCodeFromError(result.error);
}

// =============================================================================
// Decode Handler
// =============================================================================

int handleDecode(const QCommandLineParser& parser)
{
    OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);
    configureLogging(outputMode);
    
    const QStringList args = parser.positionalArguments();
    if (args.size() != 2) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Expected <input.pdf> <output-file>. Use 'qrpaper decode --help' for usage."));
        return ExitCode::InvalidArgs;
    }
    
    const QString inputPath = QDir::cleanPath(QDir::current().absoluteFilePath(args.at(0)));
    const QString outputPath = QDir::cleanPath(QDir::current().absoluteFilePath(args.at(1)));
    
    ScanOptions options;
    options.layoutSpecified = parser.isSet(QStringLiteral("layout"));
    
    if (!readLayoutOption(parser, &options.layout, progress) ||
        !readPositiveOption(parser, QStringLiteral("dpi"), &options.dpi, progress)) {
        return ExitCode::InvalidArgs;
    }
    
    if (parser.isSet(QStringLiteral("info-pages"))) {
        bool ok = false;
        options.infoPages = parser.value(QStringLiteral("info-pages")).toInt(&ok);
        if (!ok || options.infoPages < 0) {
            progress.reportError(QCoreApplication::translate("CLI",
                "Invalid value for --info-pages: %1").arg(parser.value(QStringLiteral("info-pages"))));
            return ExitCode::InvalidArgs;
        }
    }
    
    if (!QFileInfo::exists(inputPath)) {
        progress.reportError(QCoreApplication::translate("CLI", "%1 does not exist.").arg(inputPath));
        return ExitCode::IoError;
    }
    
    if (QFileInfo::exists(outputPath) && !parser.isSet(QStringLiteral("overwrite"))) {
        progress.reportError(QCoreApplication::translate("CLI",
            "%1 already exists. Use --overwrite to replace it.").arg(outputPath));
        return ExitCode::InvalidArgs;
    }
    
    Paper::DecodeResult result = Paper::decodeDocument(
        inputPath, outputPath, options, progress.callback(), getCancellationFlag());
    
    if (result.error == PaperError::Cancelled) {
        return cancelledExit(progress);
    }
    
    progress.reportDecode(result, inputPath, outputPath);
    
    if (!result.success) {
        return exitCodeFromError(result.error);
    }
    return result.failedPages.isEmpty() ? ExitCode::Success : ExitCode::PartialFailure;
}

} // namespace Cli
