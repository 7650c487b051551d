#pragma once

// ============================================================================
// PaperPipelineTests - End-to-end tests for encode and decode
// ============================================================================
// Writes real PDFs into a temporary directory, scans them back and checks
// the rebuilt payload, the document properties and the failure reports.
// ============================================================================

#include "PaperPipeline.h"
#include "../core/Codec.h"
#include "../pdf/PaperPdfWriter.h"
#include "../pdf/PdfProvider.h"
#include "../qr/QrRenderer.h"
#include "../qr/QrSymbolDecoder.h"

#include <QDebug>
#include <QFile>
#include <QTemporaryDir>

namespace PaperPipelineTests {

// Deterministic, poorly compressible payload
inline QByteArray noisyPayload(int size)
{
    QByteArray data;
    data.reserve(size);
    quint32 state = 0x12345678u;
    for (int i = 0; i < size; ++i) {
        state = state * 1664525u + 1013904223u;
        data.append(static_cast<char>(state >> 24));
    }
    return data;
}

inline bool encodeTo(const QByteArray& payload, const Paper::EncodeOptions& options,
                     Paper::EncodeResult* out)
{
    *out = Paper::encodePayload(payload, options);
    if (!out->success) {
        qDebug() << "FAIL: encode failed:" << out->errorMessage;
        return false;
    }
    if (!QFile::exists(options.outputPath)) {
        qDebug() << "FAIL: encode did not create" << options.outputPath;
        return false;
    }
    return true;
}

/**
 * @brief "hello world" goes to one symbol on one data page and back.
 */
inline bool testHelloWorld()
{
    qDebug() << "=== Test: hello world Round-Trip ===";
    bool success = true;

    QTemporaryDir dir;
    Paper::EncodeOptions options;
    options.outputPath = dir.filePath(QStringLiteral("hello.pdf"));

    Paper::EncodeResult encoded;
    if (!encodeTo(QByteArray("hello world"), options, &encoded)) {
        return false;
    }
    if (encoded.stats.chunkCount != 1 || encoded.pagesWritten != 2 || encoded.dataPages != 1) {
        qDebug() << "FAIL: expected 1 chunk on 2 pages, got" << encoded.stats.chunkCount
                 << encoded.pagesWritten;
        success = false;
    }
    if (encoded.symbolPixelSize != 1770 || encoded.fileSizeBytes <= 0) {
        qDebug() << "FAIL: symbol size / file size" << encoded.symbolPixelSize << encoded.fileSizeBytes;
        success = false;
    }

    const QString outPath = dir.filePath(QStringLiteral("hello.txt"));
    Paper::DecodeResult decoded = Paper::decodeDocument(options.outputPath, outPath, ScanOptions());
    if (!decoded.success) {
        qDebug() << "FAIL: decode failed:" << decoded.errorMessage;
        return false;
    }
    if (decoded.payload != QByteArray("hello world") || decoded.pageCount != 2 || decoded.dpi != 300) {
        qDebug() << "FAIL: wrong payload or metadata";
        success = false;
    }

    QFile out(outPath);
    if (!out.open(QIODevice::ReadOnly) || out.readAll() != QByteArray("hello world")) {
        qDebug() << "FAIL: output file content";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: hello world round trip";
    }
    return success;
}

/**
 * @brief Stacked layout over several pages, last page half full.
 */
inline bool testStackedMultiPage()
{
    qDebug() << "=== Test: Stacked Multi-Page Round-Trip ===";
    bool success = true;

    QTemporaryDir dir;
    Paper::EncodeOptions options;
    options.outputPath = dir.filePath(QStringLiteral("stacked.pdf"));
    options.layout = LayoutKind::Stacked;
    options.dpi = 200;
    options.chunkSize = 300;
    options.threads = 3;

    const QByteArray payload = noisyPayload(1000);
    Paper::EncodeResult encoded;
    if (!encodeTo(payload, options, &encoded)) {
        return false;
    }

    // 1348 base64 characters: five chunks, the last page holds one symbol
    const int chunks = encoded.stats.chunkCount;
    if (encoded.dataPages != (chunks + 1) / 2 || encoded.pagesWritten != encoded.dataPages + 1) {
        qDebug() << "FAIL: page counts" << encoded.dataPages << encoded.pagesWritten;
        success = false;
    }

    ScanResult scan = Paper::scanDocument(options.outputPath, ScanOptions());
    if (!scan.success || !scan.properties.present) {
        qDebug() << "FAIL: scan failed:" << scan.errorMessage;
        return false;
    }
    if (scan.layout != LayoutKind::Stacked || scan.dpi != 200 || scan.expectedCount != chunks
        || scan.infoPages != 1 || scan.properties.chunkSize != 300) {
        qDebug() << "FAIL: document properties not honored";
        success = false;
    }
    if (scan.symbols.size() != chunks || !scan.failedPages.isEmpty()) {
        qDebug() << "FAIL: recovered" << scan.symbols.size() << "of" << chunks;
        success = false;
    }

    Paper::DecodeResult decoded = Paper::reconstruct(scan);
    if (!decoded.success || decoded.payload != payload) {
        qDebug() << "FAIL: payload mismatch:" << decoded.errorMessage;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Stacked multi-page round trip";
    }
    return success;
}

/**
 * @brief Losing a page names the missing chunks and their page; nothing is written.
 */
inline bool testMissingPage()
{
    qDebug() << "=== Test: Missing Page ===";
    bool success = true;

    QTemporaryDir dir;
    Paper::EncodeOptions options;
    options.outputPath = dir.filePath(QStringLiteral("lost.pdf"));
    options.dpi = 150;
    options.chunkSize = 400;

    Paper::EncodeResult encoded;
    if (!encodeTo(noisyPayload(700), options, &encoded)) {
        return false;
    }
    if (encoded.stats.chunkCount < 3) {
        qDebug() << "FAIL: need at least 3 chunks, got" << encoded.stats.chunkCount;
        return false;
    }

    ScanResult scan = Paper::scanDocument(options.outputPath, ScanOptions());
    if (!scan.success) {
        qDebug() << "FAIL: scan failed:" << scan.errorMessage;
        return false;
    }

    // Drop everything printed on document page 3 (second data page)
    QVector<RecoveredSymbol> kept;
    for (const RecoveredSymbol& s : scan.symbols) {
        if (s.pageNumber != 3) {
            kept.append(s);
        }
    }
    scan.symbols = kept;

    Paper::DecodeResult decoded = Paper::reconstruct(scan);
    if (decoded.success || decoded.error != PaperError::MissingChunk) {
        qDebug() << "FAIL: expected MissingChunk";
        return false;
    }
    if (decoded.missingPositions != QVector<int>{1} || decoded.missingPages != QVector<int>{3}) {
        qDebug() << "FAIL: missing" << decoded.missingPositions << "on" << decoded.missingPages;
        success = false;
    }
    if (!decoded.errorMessage.contains(QStringLiteral("page 3"))) {
        qDebug() << "FAIL: message does not name the page:" << decoded.errorMessage;
        success = false;
    }
    if (!decoded.payload.isEmpty()) {
        qDebug() << "FAIL: partial payload returned";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Missing page reported";
    }
    return success;
}

// Symbol images for a payload, chunked and sized for the layout at the given DPI
inline QVector<QImage> symbolImages(const QByteArray& payload, LayoutKind kind, int dpi,
                                    int chunkSize, DocumentStats* stats)
{
    std::unique_ptr<LayoutPolicy> layout = LayoutPolicy::create(kind);
    const QByteArray compressed = Codec::compress(payload).data;
    const QByteArray text = Codec::encodeText(compressed);
    const QVector<Chunk> chunks = Codec::chunk(text, chunkSize);

    stats->originalSize = payload.size();
    stats->compressedSize = compressed.size();
    stats->encodedSize = text.size();
    stats->chunkCount = static_cast<int>(chunks.size());

    QVector<QImage> images;
    for (const Chunk& c : chunks) {
        images.append(QrRenderer::render(c.data, layout->symbolPixelSize(dpi)));
    }
    return images;
}

/**
 * @brief A page without a readable symbol is listed, named and blocks the output.
 */
inline bool testUnreadablePage()
{
    qDebug() << "=== Test: Unreadable Page ===";
    bool success = true;

    QTemporaryDir dir;
    PaperWriteOptions options;
    options.outputPath = dir.filePath(QStringLiteral("smudged.pdf"));
    options.dpi = 150;
    options.chunkSize = 400;

    QVector<QImage> images = symbolImages(noisyPayload(700), LayoutKind::Single, options.dpi,
                                          options.chunkSize, &options.stats);
    if (images.size() != 3) {
        qDebug() << "FAIL: expected 3 symbols, got" << images.size();
        return false;
    }

    // Second data page printed blank
    QImage blank(images[1].size(), QImage::Format_Grayscale8);
    blank.fill(255);
    images[1] = blank;

    PaperPdfWriter writer;
    const PaperWriteResult written = writer.writePdf(images, options);
    if (!written.success || written.pagesWritten != 4) {
        qDebug() << "FAIL: write failed:" << written.errorMessage;
        return false;
    }

    ScanResult scan = Paper::scanDocument(options.outputPath, ScanOptions());
    if (!scan.success) {
        qDebug() << "FAIL: one unreadable page should not fail the scan:" << scan.errorMessage;
        return false;
    }
    if (scan.failedPages != QVector<int>{3} || scan.symbols.size() != 2) {
        qDebug() << "FAIL: failed pages" << scan.failedPages << "symbols" << scan.symbols.size();
        success = false;
    }

    Paper::DecodeResult decoded = Paper::reconstruct(scan);
    if (decoded.success || decoded.error != PaperError::MissingChunk
        || decoded.missingPositions != QVector<int>{1} || decoded.missingPages != QVector<int>{3}) {
        qDebug() << "FAIL: expected MissingChunk at position 1 on page 3, got"
                 << paperErrorName(decoded.error) << decoded.missingPositions << decoded.missingPages;
        success = false;
    }
    if (!decoded.errorMessage.contains(QStringLiteral("page 3"))) {
        qDebug() << "FAIL: message does not name the page:" << decoded.errorMessage;
        success = false;
    }

    // The sheet the message points at carries the same number in its caption
    std::unique_ptr<PdfProvider> pdf = PdfProvider::create(options.outputPath);
    if (!pdf || !pdf->pageText(2).contains(QStringLiteral("Page 3"))
        || !pdf->pageText(1).contains(QStringLiteral("Page 2"))) {
        qDebug() << "FAIL: captions do not match document page numbers";
        success = false;
    }

    const QString outPath = dir.filePath(QStringLiteral("smudged.out"));
    decoded = Paper::decodeDocument(options.outputPath, outPath, ScanOptions());
    if (decoded.success || QFile::exists(outPath)) {
        qDebug() << "FAIL: output written despite a missing chunk";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Unreadable page reported";
    }
    return success;
}

/**
 * @brief Documents without QrPaper properties decode from the caller's options.
 */
inline bool testLegacyDocument()
{
    qDebug() << "=== Test: Document Without Properties ===";
    bool success = true;

    QTemporaryDir dir;

    // Single layout, no information page, nothing recorded
    PaperWriteOptions single;
    single.outputPath = dir.filePath(QStringLiteral("legacy-single.pdf"));
    single.includeInfoPage = false;
    single.recordProperties = false;
    const QByteArray text("archived before properties existed");
    const QVector<QImage> singleImages = symbolImages(text, LayoutKind::Single, single.dpi,
                                                      Codec::DEFAULT_CHUNK_SIZE, &single.stats);
    PaperPdfWriter singleWriter;
    if (!singleWriter.writePdf(singleImages, single).success) {
        qDebug() << "FAIL: single write failed";
        return false;
    }

    ScanResult scan = Paper::scanDocument(single.outputPath, ScanOptions());
    if (!scan.success || scan.properties.present || scan.expectedCount != -1
        || scan.infoPages != 0 || scan.dpi != DocumentScanner::DEFAULT_DPI) {
        qDebug() << "FAIL: legacy defaults" << scan.properties.present << scan.expectedCount
                 << scan.infoPages << scan.dpi;
        success = false;
    }
    if (scan.warnings.filter(QStringLiteral("no QrPaper properties")).isEmpty()) {
        qDebug() << "FAIL: missing properties not reported" << scan.warnings;
        success = false;
    }
    Paper::DecodeResult decoded = Paper::reconstruct(scan);
    if (!decoded.success || decoded.payload != text) {
        qDebug() << "FAIL: single legacy decode:" << decoded.errorMessage;
        success = false;
    }

    // Stacked layout given by the caller, leading information page assumed
    PaperWriteOptions stacked;
    stacked.outputPath = dir.filePath(QStringLiteral("legacy-stacked.pdf"));
    stacked.layout = LayoutKind::Stacked;
    stacked.recordProperties = false;
    const QByteArray payload = noisyPayload(1000);
    const QVector<QImage> stackedImages = symbolImages(payload, LayoutKind::Stacked, stacked.dpi,
                                                       Codec::STACKED_CHUNK_SIZE, &stacked.stats);
    PaperPdfWriter stackedWriter;
    if (!stackedWriter.writePdf(stackedImages, stacked).success) {
        qDebug() << "FAIL: stacked write failed";
        return false;
    }

    ScanOptions scanOptions;
    scanOptions.layout = LayoutKind::Stacked;
    scanOptions.layoutSpecified = true;
    scan = Paper::scanDocument(stacked.outputPath, scanOptions);
    if (!scan.success || scan.properties.present || scan.infoPages != 1 || !scan.failedPages.isEmpty()) {
        qDebug() << "FAIL: stacked legacy scan" << scan.infoPages << scan.failedPages;
        success = false;
    }
    decoded = Paper::reconstruct(scan);
    if (!decoded.success || decoded.payload != payload) {
        qDebug() << "FAIL: stacked legacy decode:" << decoded.errorMessage;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Documents without properties";
    }
    return success;
}

/**
 * @brief Reading at a different DPI than the stored one is refused.
 */
inline bool testResolutionMismatch()
{
    qDebug() << "=== Test: Resolution Mismatch ===";
    bool success = true;

    QTemporaryDir dir;
    Paper::EncodeOptions options;
    options.outputPath = dir.filePath(QStringLiteral("dpi.pdf"));
    options.dpi = 200;

    Paper::EncodeResult encoded;
    if (!encodeTo(QByteArray("resolution"), options, &encoded)) {
        return false;
    }

    const QString outPath = dir.filePath(QStringLiteral("dpi.out"));
    ScanOptions scanOptions;
    scanOptions.dpi = 300;
    Paper::DecodeResult decoded = Paper::decodeDocument(options.outputPath, outPath, scanOptions);
    if (decoded.success || decoded.error != PaperError::ResolutionMismatch) {
        qDebug() << "FAIL: expected ResolutionMismatch, got" << paperErrorName(decoded.error);
        success = false;
    }
    if (QFile::exists(outPath)) {
        qDebug() << "FAIL: output written on failure";
        success = false;
    }

    // Matching explicit DPI is fine
    scanOptions.dpi = 200;
    decoded = Paper::decodeDocument(options.outputPath, outPath, scanOptions);
    if (!decoded.success || decoded.payload != QByteArray("resolution")) {
        qDebug() << "FAIL: matching DPI rejected:" << decoded.errorMessage;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Resolution coupling";
    }
    return success;
}

/**
 * @brief Empty payload, indexed frames and no information page.
 */
inline bool testVariants()
{
    qDebug() << "=== Test: Encode Variants ===";
    bool success = true;

    QTemporaryDir dir;

    // Empty payload still produces one symbol
    Paper::EncodeOptions empty;
    empty.outputPath = dir.filePath(QStringLiteral("empty.pdf"));
    empty.dpi = 150;
    Paper::EncodeResult encoded;
    if (encodeTo(QByteArray(), empty, &encoded)) {
        Paper::DecodeResult decoded = Paper::decodeDocument(empty.outputPath,
                                                            dir.filePath(QStringLiteral("empty.out")),
                                                            ScanOptions());
        if (encoded.stats.chunkCount != 1 || !decoded.success || !decoded.payload.isEmpty()) {
            qDebug() << "FAIL: empty payload round trip";
            success = false;
        }
    } else {
        success = false;
    }

    // Indexed frames, no information page
    Paper::EncodeOptions indexed;
    indexed.outputPath = dir.filePath(QStringLiteral("indexed.pdf"));
    indexed.dpi = 150;
    indexed.chunkSize = 200;
    indexed.indexed = true;
    indexed.includeInfoPage = false;
    const QByteArray payload = noisyPayload(400);
    if (encodeTo(payload, indexed, &encoded)) {
        if (encoded.pagesWritten != encoded.dataPages) {
            qDebug() << "FAIL: information page written";
            success = false;
        }
        ScanResult scan = Paper::scanDocument(indexed.outputPath, ScanOptions());
        if (!scan.indexed || scan.infoPages != 0 || scan.symbols.isEmpty()
            || scan.symbols.first().text.contains(':')) {
            qDebug() << "FAIL: index frames not stripped";
            success = false;
        }
        Paper::DecodeResult decoded = Paper::reconstruct(scan);
        if (!decoded.success || decoded.payload != payload) {
            qDebug() << "FAIL: indexed round trip:" << decoded.errorMessage;
            success = false;
        }
    } else {
        success = false;
    }

    // Chunk size beyond the symbol capacity
    Paper::EncodeOptions tooBig;
    tooBig.outputPath = dir.filePath(QStringLiteral("big.pdf"));
    tooBig.chunkSize = Paper::maxChunkSize(true) + 1;
    tooBig.indexed = true;
    Paper::EncodeResult rejected = Paper::encodePayload(payload, tooBig);
    if (rejected.success || rejected.error != PaperError::InvalidArgument || QFile::exists(tooBig.outputPath)) {
        qDebug() << "FAIL: oversize chunk accepted";
        success = false;
    }

    // Stacked symbols at 72 DPI come out under 2 px per module
    Paper::EncodeOptions coarse;
    coarse.outputPath = dir.filePath(QStringLiteral("coarse.pdf"));
    coarse.layout = LayoutKind::Stacked;
    coarse.dpi = 72;
    rejected = Paper::encodePayload(noisyPayload(1000), coarse);
    if (rejected.success || rejected.error != PaperError::InvalidArgument || QFile::exists(coarse.outputPath)) {
        qDebug() << "FAIL: unreadable module size accepted";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Encode variants";
    }
    return success;
}

/**
 * @brief Dry runs stop after chunking and write nothing.
 */
inline bool testDryRun()
{
    qDebug() << "=== Test: Dry Run ===";
    bool success = true;

    QTemporaryDir dir;
    Paper::EncodeOptions options;
    options.outputPath = dir.filePath(QStringLiteral("dry.pdf"));
    options.dryRun = true;

    const QByteArray payload("dry run payload");
    Paper::EncodeResult result = Paper::encodePayload(payload, options);
    if (!result.success || QFile::exists(options.outputPath)) {
        qDebug() << "FAIL: dry run wrote a file or failed";
        success = false;
    }
    if (result.encodedText != Codec::encodeText(Codec::compress(payload).data)) {
        qDebug() << "FAIL: encoded text mismatch";
        success = false;
    }
    if (result.stats.originalSize != payload.size() || result.stats.chunkCount != 1) {
        qDebug() << "FAIL: stats" << result.stats.originalSize << result.stats.chunkCount;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Dry run";
    }
    return success;
}

/**
 * @brief Information page text reflects the statistics.
 */
inline bool testInfoPageLines()
{
    qDebug() << "=== Test: Information Page Text ===";
    bool success = true;

    DocumentStats stats;
    stats.originalSize = 12345;
    stats.compressedSize = 678;
    stats.encodedSize = 904;
    stats.chunkCount = 2;

    PaperWriteOptions options;
    options.layout = LayoutKind::Stacked;
    options.dpi = 600;

    const QStringList lines = PaperPdfWriter::infoPageLines(stats, options);
    const QString all = lines.join('\n');
    const QStringList expected = {
        QStringLiteral("DATA STATISTICS"), QStringLiteral("12345 bytes"),
        QStringLiteral("678 bytes"), QStringLiteral("904 bytes"),
        QStringLiteral("stacked (2 per page)"), QStringLiteral("600 DPI"),
        QStringLiteral("DECODING INSTRUCTIONS (EN)"), QStringLiteral("(ES)"), QStringLiteral("(ZH)")
    };
    for (const QString& text : expected) {
        if (!all.contains(text)) {
            qDebug() << "FAIL: missing" << text;
            success = false;
        }
    }
    if (all.contains(QStringLiteral("6-digit index"))) {
        qDebug() << "FAIL: index note on a non-indexed document";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Information page text";
    }
    return success;
}

/**
 * @brief Symbols map to slots by position on the page.
 */
inline bool testAssignPositions()
{
    qDebug() << "=== Test: Slot Assignment ===";
    bool success = true;

    std::unique_ptr<LayoutPolicy> layout = LayoutPolicy::create(LayoutKind::Stacked);
    const int dpi = 100;
    const qreal scale = dpi / 72.0;
    auto symbolAt = [scale](const QPointF& pt, const QByteArray& text) {
        DecodedSymbol s;
        s.text = text;
        s.center = pt * scale;
        return s;
    };

    // Bottom symbol listed first; slot comes from geometry, not order
    QVector<DecodedSymbol> decoded = {
        symbolAt(layout->slotRect(1).center(), QByteArray("BBBB")),
        symbolAt(layout->slotRect(0).center(), QByteArray("AAAA")),
        symbolAt(QPointF(10, 10), QByteArray("CCCC"))
    };

    QStringList warnings;
    const QVector<RecoveredSymbol> symbols =
        DocumentScanner::assignPositions(decoded, *layout, dpi, 3, 5, false, &warnings);
    if (symbols.size() != 2) {
        qDebug() << "FAIL: expected 2 symbols, got" << symbols.size();
        return false;
    }
    for (const RecoveredSymbol& s : symbols) {
        const int expected = (s.text == "AAAA") ? 6 : 7;
        if (s.position != expected || s.pageNumber != 5) {
            qDebug() << "FAIL:" << s.text << "at position" << s.position;
            success = false;
        }
    }
    if (warnings.size() != 1) {
        qDebug() << "FAIL: stray symbol not reported" << warnings;
        success = false;
    }

    if (DocumentScanner::pageForPosition(7, *layout, 1) != 5
        || DocumentScanner::pageForPosition(0, *layout, 0) != 1) {
        qDebug() << "FAIL: pageForPosition";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Slot assignment";
    }
    return success;
}

/**
 * @brief Run all pipeline tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Paper Pipeline Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testHelloWorld();
    qDebug() << "";

    allPass &= testStackedMultiPage();
    qDebug() << "";

    allPass &= testMissingPage();
    qDebug() << "";

    allPass &= testUnreadablePage();
    qDebug() << "";

    allPass &= testLegacyDocument();
    qDebug() << "";

    allPass &= testResolutionMismatch();
    qDebug() << "";

    allPass &= testVariants();
    qDebug() << "";

    allPass &= testDryRun();
    qDebug() << "";

    allPass &= testInfoPageLines();
    qDebug() << "";

    allPass &= testAssignPositions();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace PaperPipelineTests
