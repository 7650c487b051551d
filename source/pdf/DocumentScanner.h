#pragma once

// ============================================================================
// DocumentScanner - Recovers chunk text from a paper document
// ============================================================================
// Rasterizes every data page at the composition DPI, decodes the QR
// symbols on it and turns each symbol into a RecoveredSymbol whose
// position comes from page order and the slot the symbol was printed in.
//
// Scan parameters come from the document properties when present:
// - The DPI is the stored one; an explicit different DPI is refused
// - The layout and information page count are the stored ones
// Documents without properties are scanned with the caller's options.
// ============================================================================

#include "../core/PaperTypes.h"
#include "../layout/LayoutPolicy.h"
#include "PaperDocumentProperties.h"

#include <QString>
#include <QStringList>
#include <QVector>

#include <atomic>

class PdfProvider;
struct DecodedSymbol;

/**
 * @brief Caller-side scan parameters.
 */
struct ScanOptions {
    int dpi = 0;                            ///< Requested DPI (0 = use the stored one)
    LayoutKind layout = LayoutKind::Single; ///< Layout for documents without properties
    bool layoutSpecified = false;           ///< True if layout was given explicitly
    int infoPages = -1;                     ///< Leading non-data pages without properties (-1 = legacyInfoPages())
};

/**
 * @brief Everything recovered from a document.
 *
 * success is false only for fatal problems (unreadable file, resolution
 * mismatch, cancellation). Pages without symbols are listed in
 * failedPages and do not clear success.
 */
struct ScanResult {
    bool success = false;
    PaperError error = PaperError::None;
    QString errorMessage;

    PaperDocumentProperties properties;     ///< As read from the document
    LayoutKind layout = LayoutKind::Single; ///< Layout used for slot assignment
    int dpi = 0;                            ///< Rasterization DPI used
    int infoPages = 0;                      ///< Leading pages skipped
    int pageCount = 0;                      ///< Pages in the document
    int expectedCount = -1;                 ///< Chunks in the document (-1 unknown)
    bool indexed = false;                   ///< Symbols carry an index frame

    QVector<RecoveredSymbol> symbols;       ///< In page then slot order
    QVector<int> failedPages;               ///< 1-based pages with no decodable symbol
    QStringList warnings;                   ///< Non-fatal problems, one per line
};

class DocumentScanner {
public:
    /// DPI used for documents that do not record one.
    static constexpr int DEFAULT_DPI = 300;

    /**
     * @brief Open and scan a PDF file.
     *
     * @param pdfPath Path to the document
     * @param options Requested DPI and fallbacks for legacy documents
     * @param progress Called once per page (may be empty)
     * @param cancelled Checked before each page (may be null)
     */
    static ScanResult scanFile(const QString& pdfPath, const ScanOptions& options,
                               const PaperProgressCallback& progress = PaperProgressCallback(),
                               std::atomic<bool>* cancelled = nullptr);

    /**
     * @brief Scan an already opened document.
     */
    static ScanResult scan(const PdfProvider& provider, const ScanOptions& options,
                           const PaperProgressCallback& progress = PaperProgressCallback(),
                           std::atomic<bool>* cancelled = nullptr);

    /**
     * @brief Map the symbols of one data page to chunk positions.
     *
     * A symbol's slot is the layout slot containing its center. Symbols
     * outside every slot and second symbols in an occupied slot are
     * dropped with a warning. With indexed symbols the frame index is the
     * position and the frame is stripped from the text.
     *
     * @param decoded Symbols found on the page raster (pixel coordinates)
     * @param layout Layout the page was composed with
     * @param dpi Raster DPI, used to convert pixels to points
     * @param dataPageIndex 0-based index among data pages
     * @param pageNumber 1-based page number in the document (for reports)
     * @param indexed True if symbols carry an index frame
     * @param warnings Receives one line per dropped or suspicious symbol
     */
    static QVector<RecoveredSymbol> assignPositions(const QVector<DecodedSymbol>& decoded,
                                                    const LayoutPolicy& layout, int dpi,
                                                    int dataPageIndex, int pageNumber,
                                                    bool indexed, QStringList* warnings);

    /**
     * @brief 1-based document page that holds a chunk position.
     */
    static int pageForPosition(int position, const LayoutPolicy& layout, int infoPages);

    /**
     * @brief Information pages assumed for a document without properties.
     *
     * Single-layout documents from older encoders start with a data page;
     * stacked ones start with one information page.
     */
    static int legacyInfoPages(LayoutKind layout);
};
