#include "PaperPipeline.h"

#include "../core/Codec.h"
#include "../core/Reassembler.h"
#include "../pdf/PaperPdfWriter.h"
#include "../qr/QrRenderer.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QSaveFile>

#include <algorithm>

/**
 * @file PaperPipeline.cpp
 * @brief Implementation of the encode/decode pipelines.
 *
 * @see PaperPipeline.h for API documentation
 */

namespace Paper {

static void report(const PaperProgressCallback& progress, int current, int total, const QString& status)
{
    if (progress) {
        progress(current, total, status);
    }
}

// =============================================================================
// Encode
// =============================================================================

int maxChunkSize(bool indexed)
{
    return Codec::MAX_SYMBOL_BYTES - (indexed ? Codec::FRAME_INDEX_DIGITS + 1 : 0);
}

EncodeResult encodePayload(const QByteArray& payload, const EncodeOptions& options,
                           const PaperProgressCallback& progress, std::atomic<bool>* cancelled)
{
    EncodeResult result;
    QElapsedTimer timer;
    timer.start();

    std::unique_ptr<LayoutPolicy> layout = LayoutPolicy::create(options.layout);

    result.chunkSize = options.chunkSize > 0 ? options.chunkSize : layout->defaultChunkSize();
    if (result.chunkSize > maxChunkSize(options.indexed)) {
        result.error = PaperError::InvalidArgument;
        result.errorMessage = QStringLiteral("Chunk size %1 exceeds the symbol capacity (%2)")
                                  .arg(result.chunkSize).arg(maxChunkSize(options.indexed));
        return result;
    }
    if (options.dpi <= 0) {
        result.error = PaperError::InvalidArgument;
        result.errorMessage = QStringLiteral("DPI must be positive");
        return result;
    }
    if (!options.dryRun && options.outputPath.isEmpty()) {
        result.error = PaperError::InvalidArgument;
        result.errorMessage = QStringLiteral("No output path specified");
        return result;
    }

    // ===== Compress and encode =====
    report(progress, 0, 0, QStringLiteral("Compressing %1 bytes").arg(payload.size()));

    Codec::CodecResult packed = Codec::compress(payload);
    if (!packed.success) {
        result.error = packed.error;
        result.errorMessage = packed.errorMessage;
        return result;
    }

    result.encodedText = Codec::encodeText(packed.data);
    const QVector<Chunk> chunks = Codec::chunk(result.encodedText, result.chunkSize);

    result.stats.originalSize = payload.size();
    result.stats.compressedSize = packed.data.size();
    result.stats.encodedSize = result.encodedText.size();
    result.stats.chunkCount = static_cast<int>(chunks.size());

    qDebug() << "[Paper] Payload" << result.stats.originalSize << "bytes, compressed"
             << result.stats.compressedSize << ", base64" << result.stats.encodedSize
             << "->" << result.stats.chunkCount << "chunks of" << result.chunkSize;

    if (options.indexed && chunks.size() > 999999) {
        result.error = PaperError::InvalidArgument;
        result.errorMessage = QStringLiteral("%1 chunks do not fit the 6-digit index frame").arg(chunks.size());
        return result;
    }

    if (options.dryRun) {
        result.elapsedMs = timer.elapsed();
        result.success = true;
        return result;
    }

    // ===== Render =====
    QVector<QByteArray> texts;
    texts.reserve(chunks.size());
    for (const Chunk& c : chunks) {
        texts.append(options.indexed ? Codec::frameChunk(c) : c.data);
    }

    result.symbolPixelSize = layout->symbolPixelSize(options.dpi);

    // Every chunk but the last is full length, so the first symbol is the densest
    const int modules = QrRenderer::moduleCount(texts.first());
    if (modules > 0) {
        const int span = modules + 2 * QrRenderer::QUIET_ZONE_MODULES;
        if (result.symbolPixelSize / span < MIN_PIXELS_PER_MODULE) {
            result.error = PaperError::InvalidArgument;
            result.errorMessage = QStringLiteral("%1 DPI gives %2 px for a %3-module symbol; "
                                                 "need at least %4 px per module")
                                      .arg(options.dpi).arg(result.symbolPixelSize).arg(span)
                                      .arg(MIN_PIXELS_PER_MODULE);
            qWarning() << "[Paper]" << result.errorMessage;
            return result;
        }
    }

    QrRenderer::BatchResult rendered = QrRenderer::renderAll(
        texts, result.symbolPixelSize, options.threads,
        [&progress](int current, int total, const QString& status) {
            report(progress, current, total, status);
        },
        cancelled);

    if (!rendered.success) {
        result.error = rendered.error;
        result.errorMessage = rendered.errorMessage;
        return result;
    }

    // ===== Write =====
    PaperWriteOptions writeOptions;
    writeOptions.outputPath = options.outputPath;
    writeOptions.layout = options.layout;
    writeOptions.dpi = options.dpi;
    writeOptions.chunkSize = result.chunkSize;
    writeOptions.includeInfoPage = options.includeInfoPage;
    writeOptions.indexed = options.indexed;
    writeOptions.stats = result.stats;

    PaperPdfWriter writer;
    QObject::connect(&writer, &PaperPdfWriter::progressUpdated, &writer,
                     [&writer, &progress, cancelled](int current, int total) {
        if (cancelled && cancelled->load()) {
            writer.cancel();
        }
        report(progress, current, total, QStringLiteral("Writing page %1").arg(current));
    });

    PaperWriteResult written = writer.writePdf(rendered.images, writeOptions);
    if (!written.success) {
        result.error = written.error;
        result.errorMessage = written.errorMessage;
        return result;
    }

    result.pagesWritten = written.pagesWritten;
    result.dataPages = written.dataPages;
    result.fileSizeBytes = written.fileSizeBytes;
    result.elapsedMs = timer.elapsed();
    result.success = true;
    return result;
}

// =============================================================================
// Decode
// =============================================================================

ScanResult scanDocument(const QString& pdfPath, const ScanOptions& options,
                        const PaperProgressCallback& progress, std::atomic<bool>* cancelled)
{
    return DocumentScanner::scanFile(pdfPath, options, progress, cancelled);
}

DecodeResult reconstruct(const ScanResult& scan)
{
    DecodeResult result;
    result.pageCount = scan.pageCount;
    result.dpi = scan.dpi;
    result.layout = scan.layout;
    result.failedPages = scan.failedPages;
    result.warnings = scan.warnings;
    result.symbolCount = static_cast<int>(scan.symbols.size());

    if (!scan.success) {
        result.error = scan.error;
        result.errorMessage = scan.errorMessage;
        return result;
    }

    Reassembler::ReassemblyResult rebuilt = Reassembler::reassemble(scan.symbols, scan.expectedCount);
    result.chunkCount = rebuilt.chunkCount;
    result.missingPositions = rebuilt.missingPositions;

    if (!rebuilt.success) {
        result.error = rebuilt.error;
        result.errorMessage = rebuilt.errorMessage;
        result.cause = rebuilt.cause;
        result.causeMessage = rebuilt.causeMessage;

        if (rebuilt.error == PaperError::MissingChunk && !rebuilt.missingPositions.isEmpty()) {
            std::unique_ptr<LayoutPolicy> layout = LayoutPolicy::create(scan.layout);
            for (int position : rebuilt.missingPositions) {
                const int page = DocumentScanner::pageForPosition(position, *layout, scan.infoPages);
                if (!result.missingPages.contains(page)) {
                    result.missingPages.append(page);
                }
            }
            std::sort(result.missingPages.begin(), result.missingPages.end());

            QStringList pages;
            for (int page : result.missingPages) {
                pages << QString::number(page);
            }
            result.errorMessage += QStringLiteral(" (expected on page %1)").arg(pages.join(QStringLiteral(", ")));
        }
        return result;
    }

    result.payload = rebuilt.payload;
    result.success = true;
    return result;
}

DecodeResult decodeDocument(const QString& pdfPath, const QString& outputPath,
                            const ScanOptions& options, const PaperProgressCallback& progress,
                            std::atomic<bool>* cancelled)
{
    QElapsedTimer timer;
    timer.start();

    ScanResult scan = scanDocument(pdfPath, options, progress, cancelled);
    DecodeResult result = reconstruct(scan);

    if (result.success) {
        QString errorMessage;
        if (!writeOutput(outputPath, result.payload, &errorMessage)) {
            result.success = false;
            result.error = PaperError::Io;
            result.errorMessage = errorMessage;
        }
    }

    result.elapsedMs = timer.elapsed();
    return result;
}

bool writeOutput(const QString& path, const QByteArray& data, QString* errorMessage)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        *errorMessage = QStringLiteral("Cannot create %1: %2").arg(path, file.errorString());
        qWarning() << "[Paper]" << *errorMessage;
        return false;
    }

    if (file.write(data) != data.size()) {
        *errorMessage = QStringLiteral("Write to %1 failed: %2").arg(path, file.errorString());
        qWarning() << "[Paper]" << *errorMessage;
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        *errorMessage = QStringLiteral("Cannot commit %1: %2").arg(path, file.errorString());
        qWarning() << "[Paper]" << *errorMessage;
        return false;
    }

    qDebug() << "[Paper] Wrote" << data.size() << "bytes to" << path;
    return true;
}

} // namespace Paper
