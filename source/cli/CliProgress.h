#ifndef CLIPROGRESS_H
#define CLIPROGRESS_H

/**
 * @file CliProgress.h
 * @brief Console progress reporter for encode/decode runs.
 * 
 * Formats progress updates and results for terminal display.
 * Supports three output modes:
 * - Simple: One line per stage, then a short result line
 * - Verbose: Every symbol and page, plus detailed results
 * - JSON: One structured result object for scripting
 */

#include "CliParser.h"
#include "../core/PaperTypes.h"
#include "../pipeline/PaperPipeline.h"

#include <QTextStream>

namespace Cli {

/**
 * @brief Progress reporter for console output.
 * 
 * Usage:
 * @code
 *   ConsoleProgress progress(OutputMode::Simple);
 *   Paper::EncodeResult result = Paper::encodePayload(payload, options, progress.callback());
 *   progress.reportEncode(result, source, output, options.dryRun);
 * @endcode
 */
class ConsoleProgress {
public:
    /**
     * @brief Construct a progress reporter.
     * @param mode Output mode (Simple, Verbose, or Json)
     */
    explicit ConsoleProgress(OutputMode mode = OutputMode::Simple);
    
    /**
     * @brief Get progress callback for the pipeline.
     * 
     * A total of 0 marks a stage message; other calls count symbols or
     * pages within the current stage.
     * 
     * @return Progress callback function
     */
    PaperProgressCallback callback();
    
    /**
     * @brief Report the result of an encode run.
     * 
     * @param result The encode result
     * @param source Locator the payload came from
     * @param output PDF path (ignored for dry runs)
     * @param dryRun Whether no document was written
     */
    void reportEncode(const Paper::EncodeResult& result, const QString& source,
                      const QString& output, bool dryRun);
    
    /**
     * @brief Report the result of a decode run.
     * 
     * @param result The decode result
     * @param input PDF that was scanned
     * @param output File the payload was written to
     */
    void reportDecode(const Paper::DecodeResult& result, const QString& input, const QString& output);
    
    /**
     * @brief Report an error message.
     * 
     * Outputs an error to stderr. In JSON mode, outputs as JSON object.
     * 
     * @param message Error message to display
     */
    void reportError(const QString& message);
    
    /**
     * @brief Report a warning message.
     * 
     * Outputs a warning to stderr. In JSON mode, outputs as JSON object.
     * 
     * @param message Warning message to display
     */
    void reportWarning(const QString& message);

    // Format file size for display (e.g., "1.5 MB")
    static QString formatSize(qint64 bytes);
    
    // Format duration for display (e.g., "1.5 s" or "125 ms")
    static QString formatDuration(qint64 ms);
    
    // Escape string for JSON output
    static QString jsonEscape(const QString& str);

private:
    void reportEncodeText(const Paper::EncodeResult& result, const QString& source,
                          const QString& output, bool dryRun);
    void reportEncodeJson(const Paper::EncodeResult& result, const QString& source,
                          const QString& output, bool dryRun);
    void reportDecodeText(const Paper::DecodeResult& result, const QString& input, const QString& output);
    void reportDecodeJson(const Paper::DecodeResult& result, const QString& input, const QString& output);
    
    // Comma-separated list of integers (positions, pages)
    static QString joinInts(const QVector<int>& values);

private:
    OutputMode m_mode;
    QTextStream m_out;      ///< stdout stream
    QTextStream m_err;      ///< stderr stream
};

} // namespace Cli

#endif // CLIPROGRESS_H
