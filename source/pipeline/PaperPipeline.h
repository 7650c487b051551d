#ifndef PAPERPIPELINE_H
#define PAPERPIPELINE_H

/**
 * @file PaperPipeline.h
 * @brief End-to-end encode and decode of paper documents.
 *
 * Glues the stages together in a fixed order.
 *
 * Encode:
 *   payload -> compress -> base64 -> chunk -> [index frame] -> QR render
 *           -> layout -> PDF
 *
 * Decode:
 *   PDF -> rasterize at the stored DPI -> decode symbols -> positions
 *       -> reassemble -> base64 decode -> inflate -> output file
 *
 * Used by the CLI handlers and by the pipeline tests. All functions block
 * the calling thread; QR rendering alone fans out to a worker pool.
 */

#include "../core/PaperTypes.h"
#include "../layout/LayoutPolicy.h"
#include "../pdf/DocumentScanner.h"

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVector>

#include <atomic>

namespace Paper {

// =============================================================================
// Encode
// =============================================================================

/// Smallest module edge, in device pixels, that scans back reliably.
constexpr int MIN_PIXELS_PER_MODULE = 3;

/**
 * @brief Options for encoding a payload into a paper document.
 */
struct EncodeOptions {
    QString outputPath;                     ///< PDF to write (unused for dry runs)
    LayoutKind layout = LayoutKind::Single; ///< Page layout
    int dpi = 300;                          ///< Composition DPI
    int chunkSize = 0;                      ///< Characters per symbol (0 = layout default)
    int threads = 1;                        ///< QR render workers
    bool includeInfoPage = true;            ///< Prepend the information page
    bool indexed = false;                   ///< Prefix chunks with "NNNNNN:"
    bool dryRun = false;                    ///< Stop after chunking, write nothing
};

/**
 * @brief Result of an encode run.
 */
struct EncodeResult {
    bool success = false;
    PaperError error = PaperError::None;
    QString errorMessage;

    DocumentStats stats;                    ///< Sizes and chunk count
    QByteArray encodedText;                 ///< base64(zlib(payload))
    int chunkSize = 0;                      ///< Chunk size actually used
    int symbolPixelSize = 0;                ///< Edge of each rendered symbol
    int pagesWritten = 0;                   ///< All pages, information page included
    int dataPages = 0;
    qint64 fileSizeBytes = 0;
    qint64 elapsedMs = 0;
};

/**
 * @brief Encode a payload into a paper document.
 *
 * Nothing is written on failure or cancellation.
 *
 * @param payload Bytes to archive (may be empty)
 * @param options Layout, DPI and output settings
 * @param progress Reports each stage and each symbol/page (may be empty)
 * @param cancelled Checked between symbols and pages (may be null)
 */
EncodeResult encodePayload(const QByteArray& payload, const EncodeOptions& options,
                           const PaperProgressCallback& progress = PaperProgressCallback(),
                           std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Largest chunk size that fits one level H symbol.
 */
int maxChunkSize(bool indexed);

// =============================================================================
// Decode
// =============================================================================

/**
 * @brief Result of reconstructing a payload from a scan.
 */
struct DecodeResult {
    bool success = false;
    PaperError error = PaperError::None;
    QString errorMessage;

    PaperError cause = PaperError::None;    ///< Inner error for Reconstruction
    QString causeMessage;

    QVector<int> missingPositions;          ///< Chunk positions not recovered
    QVector<int> missingPages;              ///< 1-based pages those positions live on
    QVector<int> failedPages;               ///< Pages with no decodable symbol
    QStringList warnings;                   ///< Non-fatal scan problems

    int pageCount = 0;
    int dpi = 0;
    LayoutKind layout = LayoutKind::Single;
    int symbolCount = 0;                    ///< Symbols recovered by the scan
    int chunkCount = 0;                     ///< Chunks used for reassembly
    QByteArray payload;                     ///< Reconstructed bytes (valid when success)
    qint64 elapsedMs = 0;

    /// True if the payload was rebuilt but some pages or symbols were skipped.
    bool hasWarnings() const { return !failedPages.isEmpty() || !warnings.isEmpty(); }
};

/**
 * @brief Scan a document for chunk symbols.
 * @see DocumentScanner::scanFile
 */
ScanResult scanDocument(const QString& pdfPath, const ScanOptions& options,
                        const PaperProgressCallback& progress = PaperProgressCallback(),
                        std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Rebuild the payload from a successful scan.
 *
 * Missing chunk errors name the document pages the missing positions were
 * printed on.
 */
DecodeResult reconstruct(const ScanResult& scan);

/**
 * @brief Scan, reconstruct and write the payload to outputPath.
 *
 * The output file is only created once the payload has been rebuilt
 * completely.
 */
DecodeResult decodeDocument(const QString& pdfPath, const QString& outputPath,
                            const ScanOptions& options,
                            const PaperProgressCallback& progress = PaperProgressCallback(),
                            std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Atomically write bytes to a file (QSaveFile).
 * @return false with errorMessage set if the file could not be committed
 */
bool writeOutput(const QString& path, const QByteArray& data, QString* errorMessage);

} // namespace Paper

#endif // PAPERPIPELINE_H
