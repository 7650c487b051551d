#pragma once

// ============================================================================
// PdfProvider - Abstract interface for reading paper documents
// ============================================================================
// The scanner only needs three things from a PDF backend: the page count,
// the document properties the writer stored in the Info dictionary, and
// a raster of each page at a given DPI. Keeping that behind an interface
// lets tests feed the scanner from a different backend.
//
// QrPaper uses MuPDF for both writing and reading, so rendering matches
// the geometry the writer produced.
// ============================================================================

#include <QString>
#include <QSizeF>
#include <QImage>
#include <memory>

/**
 * @brief Abstract interface for PDF document access.
 *
 * Currently implemented by MuPdfProvider.
 */
class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    // ===== Document Info =====

    /**
     * @brief Check if the PDF was loaded successfully.
     * @return True if a valid PDF with at least one page is loaded.
     */
    virtual bool isValid() const = 0;

    /// True if the document needs a password we don't have.
    virtual bool isLocked() const = 0;

    /**
     * @brief Get the total number of pages.
     * @return Page count, or 0 if invalid.
     */
    virtual int pageCount() const = 0;

    /// Path the document was opened from.
    virtual QString filePath() const = 0;

    /**
     * @brief Look up an entry of the document Info dictionary.
     * @param key Entry name without the leading slash (e.g. "Producer")
     * @return Entry value, or an empty string if absent.
     */
    virtual QString infoValue(const QString& key) const = 0;

    // ===== Page Info =====

    /// Page size in points, or an empty size if pageIndex is out of range.
    virtual QSizeF pageSize(int pageIndex) const = 0;

    /**
     * @brief Plain text drawn on a page, one line per text line.
     * @return Extracted text, or an empty string on error.
     */
    virtual QString pageText(int pageIndex) const = 0;

    // ===== Rendering =====

    /**
     * @brief Render a page to an 8-bit grayscale image.
     * @param pageIndex 0-based page index.
     * @param dpi Resolution in dots per inch.
     * @return Rendered image on a white background, or null QImage on error.
     */
    virtual QImage renderPageToImage(int pageIndex, qreal dpi) const = 0;

    // ===== Factory =====

    /**
     * @brief Open a PDF with the available backend.
     * @param pdfPath Path to the PDF file.
     * @return Provider instance, or nullptr if the file cannot be opened.
     */
    static std::unique_ptr<PdfProvider> create(const QString& pdfPath);
};
