#pragma once

// ============================================================================
// PaperPdfWriter - Composes QR symbols into a printable PDF using MuPDF
// ============================================================================
// Builds the paper document page by page:
// - Optional information page: size statistics and decoding instructions
//   in English, Spanish and Chinese
// - Data pages: symbols placed by the selected LayoutPolicy, plus the
//   layout's caption and crop marks
// - Info dictionary: the protocol parameters the scanner checks
//
// Symbol images are embedded losslessly (PNG -> Flate) at their native
// pixel size so printing or rasterizing at the composition DPI maps each
// image pixel to one device pixel.
// ============================================================================

#include "../core/PaperTypes.h"
#include "../layout/LayoutPolicy.h"

#include <QImage>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <atomic>
#include <memory>

// Forward declarations for MuPDF types (avoid exposing mupdf headers in public API)
struct fz_context;
struct fz_font;
struct pdf_document;
struct pdf_obj;

/**
 * @brief Options for writing a paper document.
 */
struct PaperWriteOptions {
    QString outputPath;                         ///< Path to output PDF file
    LayoutKind layout = LayoutKind::Single;     ///< Page layout
    int dpi = 300;                              ///< Composition DPI (recorded for the scanner)
    int chunkSize = 0;                          ///< Chunk size used (recorded)
    bool includeInfoPage = true;                ///< Prepend the information page
    bool indexed = false;                       ///< Symbols carry an index frame (recorded)
    bool recordProperties = true;               ///< Write the QrPaper* Info entries
    DocumentStats stats;                        ///< Printed on the information page
};

/**
 * @brief Result of writing a paper document.
 */
struct PaperWriteResult {
    bool success = false;
    PaperError error = PaperError::None;
    QString errorMessage;
    int pagesWritten = 0;       ///< All pages, information page included
    int dataPages = 0;          ///< Pages holding symbols
    qint64 fileSizeBytes = 0;
};

/**
 * @brief PDF writer for paper documents.
 *
 * Thread Safety: NOT thread-safe. A writer owns its MuPDF context for the
 * duration of writePdf().
 *
 * Usage:
 * @code
 * PaperPdfWriter writer;
 * PaperWriteOptions options;
 * options.outputPath = "/path/to/archive.pdf";
 * options.layout = LayoutKind::Stacked;
 *
 * PaperWriteResult result = writer.writePdf(symbolImages, options);
 * if (!result.success) {
 *     qWarning() << "Write failed:" << result.errorMessage;
 * }
 * @endcode
 */
class PaperPdfWriter : public QObject {
    Q_OBJECT

public:
    explicit PaperPdfWriter(QObject* parent = nullptr);
    ~PaperPdfWriter() override;

    // Disable copy (MuPDF context is not copyable)
    PaperPdfWriter(const PaperPdfWriter&) = delete;
    PaperPdfWriter& operator=(const PaperPdfWriter&) = delete;

    /**
     * @brief Write the document.
     *
     * Symbols are placed in order: symbol i goes to data page
     * i / slotsPerPage, slot i % slotsPerPage. Page order is never changed.
     * On failure any partially written file is removed.
     *
     * @param symbols Rendered symbols in chunk order
     * @param options Output path, layout and recorded parameters
     */
    PaperWriteResult writePdf(const QVector<QImage>& symbols, const PaperWriteOptions& options);

    /**
     * @brief Request cancellation (checked between pages).
     */
    void cancel();

    /**
     * @brief Lines of the information page, in drawing order.
     *
     * Each entry is prefixed with the font role: "H:" heading, "T:" text,
     * "B:" bold text, "C:" CJK text, "" (empty) for extra spacing.
     */
    static QStringList infoPageLines(const DocumentStats& stats, const PaperWriteOptions& options);

signals:
    /**
     * @brief Emitted before each page is written.
     * @param current 1-based page number
     * @param total Total page count
     */
    void progressUpdated(int current, int total);

private:
    bool initContext();
    void cleanup();

    /// Load the base14 fonts and, if available, the CJK font.
    bool loadFonts();

    bool writeInfoPage();
    bool writeDataPage(int pageNumber, const QVector<QImage>& images);
    bool writeMetadata(int dataPages);
    bool saveDocument(const QString& outputPath);

    /// Resources dictionary with the fonts used by text content.
    pdf_obj* newFontResources();

    /// Width of a Latin string in the given font, in points.
    float textWidth(fz_font* font, const QString& text, float size) const;

    fz_context* m_ctx = nullptr;            ///< MuPDF context
    pdf_document* m_doc = nullptr;          ///< Output document
    fz_font* m_regularFont = nullptr;       ///< Helvetica
    fz_font* m_boldFont = nullptr;          ///< Helvetica-Bold
    fz_font* m_cjkFont = nullptr;           ///< Adobe-GB CJK font (may be null)
    pdf_obj* m_regularRef = nullptr;        ///< Indirect font object for F1
    pdf_obj* m_boldRef = nullptr;           ///< Indirect font object for F2
    pdf_obj* m_cjkRef = nullptr;            ///< Indirect font object for F3

    std::unique_ptr<LayoutPolicy> m_layout;
    PaperWriteOptions m_options;
    std::atomic<bool> m_cancelled{false};
};
