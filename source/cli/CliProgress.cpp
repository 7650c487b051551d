#include "CliProgress.h"

#include <QCoreApplication>

/**
 * @file CliProgress.cpp
 * @brief Implementation of console progress reporter.
 * 
 * @see CliProgress.h for API documentation
 */

namespace Cli {

// =============================================================================
// Constructor
// =============================================================================

ConsoleProgress::ConsoleProgress(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

// =============================================================================
// Progress Callback
// =============================================================================

PaperProgressCallback ConsoleProgress::callback()
{
    return [this](int current, int total, const QString& status) {
        if (m_mode == OutputMode::Json) {
            // In JSON mode, we don't output progress, only the result
            return;
        }
        
        // Progress goes to stderr so stdout stays clean for --dry-run output
        if (total == 0) {
            m_err << status << "...\n";
        } else if (m_mode == OutputMode::Verbose) {
            m_err << QStringLiteral("[%1/%2] %3\n").arg(current).arg(total).arg(status);
        } else if (current == total) {
            // Simple: one line when a counted stage completes
            m_err << QStringLiteral("[%1/%2] %3... OK\n").arg(current).arg(total).arg(status);
        }
        m_err.flush();
    };
}

// =============================================================================
// Encode Reporting
// =============================================================================

void ConsoleProgress::reportEncode(const Paper::EncodeResult& result, const QString& source,
                                   const QString& output, bool dryRun)
{
    if (m_mode == OutputMode::Json) {
        reportEncodeJson(result, source, output, dryRun);
    } else {
        reportEncodeText(result, source, output, dryRun);
    }
}

void ConsoleProgress::reportEncodeText(const Paper::EncodeResult& result, const QString& source,
                                       const QString& output, bool dryRun)
{
    if (!result.success) {
        reportError(result.errorMessage);
        return;
    }
    
    // Dry runs print the encoded text on stdout; the summary goes to stderr
    QTextStream& out = dryRun ? m_err : m_out;
    
    if (m_mode == OutputMode::Verbose) {
        out << "\n";
        out << QCoreApplication::translate("CLI", "=== Encode Summary ===\n");
        out << QCoreApplication::translate("CLI", "Source:      ") << source << "\n";
        if (!dryRun) {
            out << QCoreApplication::translate("CLI", "Output:      ") << output << "\n";
        }
        out << QCoreApplication::translate("CLI", "Original:    ") << formatSize(result.stats.originalSize) << "\n";
        out << QCoreApplication::translate("CLI", "Compressed:  ") << formatSize(result.stats.compressedSize) << "\n";
        out << QCoreApplication::translate("CLI", "Base64:      ") << result.stats.encodedSize
            << QCoreApplication::translate("CLI", " characters\n");
        out << QCoreApplication::translate("CLI", "QR codes:    ") << result.stats.chunkCount
            << QStringLiteral(" (%1 characters each)\n").arg(result.chunkSize);
        if (!dryRun) {
            out << QCoreApplication::translate("CLI", "Symbol size: ") << result.symbolPixelSize << " px\n";
            out << QCoreApplication::translate("CLI", "Pages:       ") << result.pagesWritten
                << QStringLiteral(" (%1 data)\n").arg(result.dataPages);
            out << QCoreApplication::translate("CLI", "Size:        ") << formatSize(result.fileSizeBytes) << "\n";
        }
        out << QCoreApplication::translate("CLI", "Time:        ") << formatDuration(result.elapsedMs) << "\n";
    } else if (dryRun) {
        out << QCoreApplication::translate("CLI", "%1 QR codes would be written (%2 base64 characters)\n")
                   .arg(result.stats.chunkCount).arg(result.stats.encodedSize);
    } else {
        out << QCoreApplication::translate("CLI", "%1 -> %2: %3 QR codes on %4 pages (%5)\n")
                   .arg(source, output)
                   .arg(result.stats.chunkCount)
                   .arg(result.pagesWritten)
                   .arg(formatSize(result.fileSizeBytes));
    }
    out.flush();
}

void ConsoleProgress::reportEncodeJson(const Paper::EncodeResult& result, const QString& source,
                                       const QString& output, bool dryRun)
{
    // JSON format (one object per line):
    // {"type":"encode","status":"success","source":"...","output":"...","original_size":1200,...}
    
    if (!result.success) {
        m_out << "{\"type\":\"encode\",\"status\":\"error\""
              << ",\"error\":\"" << paperErrorName(result.error) << "\""
              << ",\"message\":\"" << jsonEscape(result.errorMessage) << "\"}\n";
        m_out.flush();
        return;
    }
    
    m_out << "{\"type\":\"encode\",\"status\":\"success\""
          << ",\"source\":\"" << jsonEscape(source) << "\""
          << ",\"output\":\"" << (dryRun ? QString() : jsonEscape(output)) << "\""
          << ",\"original_size\":" << result.stats.originalSize
          << ",\"compressed_size\":" << result.stats.compressedSize
          << ",\"encoded_size\":" << result.stats.encodedSize
          << ",\"chunks\":" << result.stats.chunkCount
          << ",\"chunk_size\":" << result.chunkSize
          << ",\"pages\":" << result.pagesWritten
          << ",\"size\":" << result.fileSizeBytes
          << ",\"elapsed_ms\":" << result.elapsedMs
          << ",\"dry_run\":" << (dryRun ? "true" : "false");
    if (dryRun) {
        m_out << ",\"encoded_text\":\"" << QString::fromLatin1(result.encodedText) << "\"";
    }
    m_out << "}\n";
    m_out.flush();
}

// =============================================================================
// Decode Reporting
// =============================================================================

void ConsoleProgress::reportDecode(const Paper::DecodeResult& result, const QString& input, const QString& output)
{
    if (m_mode == OutputMode::Json) {
        reportDecodeJson(result, input, output);
    } else {
        reportDecodeText(result, input, output);
    }
}

void ConsoleProgress::reportDecodeText(const Paper::DecodeResult& result, const QString& input, const QString& output)
{
    for (const QString& warning : result.warnings) {
        reportWarning(warning);
    }
    
    if (!result.success) {
        reportError(result.errorMessage);
        if (result.error == PaperError::Reconstruction && !result.causeMessage.isEmpty()) {
            m_err << QCoreApplication::translate("CLI", "  Cause: ")
                  << paperErrorName(result.cause) << " - " << result.causeMessage << "\n";
            m_err.flush();
        }
        return;
    }
    
    if (m_mode == OutputMode::Verbose) {
        m_out << "\n";
        m_out << QCoreApplication::translate("CLI", "=== Decode Summary ===\n");
        m_out << QCoreApplication::translate("CLI", "Input:    ") << input << "\n";
        m_out << QCoreApplication::translate("CLI", "Output:   ") << output << "\n";
        m_out << QCoreApplication::translate("CLI", "Pages:    ") << result.pageCount
              << QStringLiteral(" (%1 DPI, %2 layout)\n").arg(result.dpi).arg(layoutKindName(result.layout));
        m_out << QCoreApplication::translate("CLI", "Symbols:  ") << result.symbolCount << "\n";
        m_out << QCoreApplication::translate("CLI", "Chunks:   ") << result.chunkCount << "\n";
        if (!result.failedPages.isEmpty()) {
            m_out << QCoreApplication::translate("CLI", "Skipped:  pages ") << joinInts(result.failedPages) << "\n";
        }
        m_out << QCoreApplication::translate("CLI", "Size:     ") << formatSize(result.payload.size()) << "\n";
        m_out << QCoreApplication::translate("CLI", "Time:     ") << formatDuration(result.elapsedMs) << "\n";
    } else {
        m_out << QCoreApplication::translate("CLI", "%1 -> %2: %3 chunks, %4\n")
                     .arg(input, output)
                     .arg(result.chunkCount)
                     .arg(formatSize(result.payload.size()));
    }
    m_out.flush();
}

void ConsoleProgress::reportDecodeJson(const Paper::DecodeResult& result, const QString& input, const QString& output)
{
    // JSON format:
    // {"type":"decode","status":"error","error":"missing_chunk","missing_positions":[3],"missing_pages":[5],...}
    
    m_out << "{\"type\":\"decode\""
          << ",\"status\":\"" << (result.success ? "success" : "error") << "\""
          << ",\"input\":\"" << jsonEscape(input) << "\""
          << ",\"output\":\"" << (result.success ? jsonEscape(output) : QString()) << "\""
          << ",\"pages\":" << result.pageCount
          << ",\"dpi\":" << result.dpi
          << ",\"layout\":\"" << layoutKindName(result.layout) << "\""
          << ",\"symbols\":" << result.symbolCount
          << ",\"failed_pages\":[" << joinInts(result.failedPages) << "]";
    
    if (result.success) {
        m_out << ",\"chunks\":" << result.chunkCount
              << ",\"size\":" << result.payload.size();
    } else {
        m_out << ",\"error\":\"" << paperErrorName(result.error) << "\""
              << ",\"message\":\"" << jsonEscape(result.errorMessage) << "\"";
        if (!result.missingPositions.isEmpty()) {
            m_out << ",\"missing_positions\":[" << joinInts(result.missingPositions) << "]"
                  << ",\"missing_pages\":[" << joinInts(result.missingPages) << "]";
        }
        if (result.cause != PaperError::None) {
            m_out << ",\"cause\":\"" << paperErrorName(result.cause) << "\""
                  << ",\"cause_message\":\"" << jsonEscape(result.causeMessage) << "\"";
        }
    }
    
    m_out << ",\"warnings\":" << result.warnings.size()
          << ",\"elapsed_ms\":" << result.elapsedMs
          << "}\n";
    m_out.flush();
}

// =============================================================================
// Error/Warning Reporting
// =============================================================================

void ConsoleProgress::reportError(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        m_err << "{\"type\":\"error\",\"message\":\"" << jsonEscape(message) << "\"}\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
    }
    m_err.flush();
}

void ConsoleProgress::reportWarning(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        m_err << "{\"type\":\"warning\",\"message\":\"" << jsonEscape(message) << "\"}\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Warning: ") << message << "\n";
    }
    m_err.flush();
}

// =============================================================================
// Utility Functions
// =============================================================================

QString ConsoleProgress::formatSize(qint64 bytes)
{
    if (bytes < 1024) {
        return QStringLiteral("%1 B").arg(bytes);
    }
    if (bytes < 1024 * 1024) {
        return QStringLiteral("%1 KB").arg(bytes / 1024.0, 0, 'f', 1);
    }
    if (bytes < 1024 * 1024 * 1024) {
        return QStringLiteral("%1 MB").arg(bytes / (1024.0 * 1024.0), 0, 'f', 1);
    }
    return QStringLiteral("%1 GB").arg(bytes / (1024.0 * 1024.0 * 1024.0), 0, 'f', 2);
}

QString ConsoleProgress::formatDuration(qint64 ms)
{
    if (ms < 1000) {
        return QStringLiteral("%1 ms").arg(ms);
    }
    if (ms < 60 * 1000) {
        return QStringLiteral("%1 s").arg(ms / 1000.0, 0, 'f', 1);
    }
    qint64 minutes = ms / (60 * 1000);
    qint64 seconds = (ms % (60 * 1000)) / 1000;
    return QStringLiteral("%1m %2s").arg(minutes).arg(seconds);
}

QString ConsoleProgress::joinInts(const QVector<int>& values)
{
    QStringList parts;
    parts.reserve(values.size());
    for (int value : values) {
        parts << QString::number(value);
    }
    return parts.join(QLatin1Char(','));
}

QString ConsoleProgress::jsonEscape(const QString& str)
{
    QString result;
    result.reserve(str.size() + 10);
    
    for (const QChar& c : str) {
        switch (c.unicode()) {
            case '"':  result += QStringLiteral("\\\""); break;
            case '\\': result += QStringLiteral("\\\\"); break;
            case '\n': result += QStringLiteral("\\n"); break;
            case '\r': result += QStringLiteral("\\r"); break;
            case '\t': result += QStringLiteral("\\t"); break;
            default:
                if (c.unicode() < 32) {
                    // Control character - escape as \uXXXX
                    // Cast to uint for cross-platform QString::arg() compatibility
                    result += QStringLiteral("\\u%1").arg(static_cast<uint>(c.unicode()), 4, 16, QLatin1Char('0'));
                } else {
                    result += c;
                }
                break;
        }
    }
    
    return result;
}

} // namespace Cli
