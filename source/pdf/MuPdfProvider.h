#pragma once

// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================
// Opens a paper document with MuPDF, exposes its Info dictionary and
// rasterizes pages in grayscale for QR detection.
// ============================================================================

#include "PdfProvider.h"

struct fz_context;
struct fz_document;

/**
 * @brief Read-only MuPDF view of a paper document.
 *
 * Owns its own fz_context, so one instance must stay on one thread.
 */
class MuPdfProvider : public PdfProvider {
public:
    /// Opens pdfPath; failures are logged and leave isValid() false.
    explicit MuPdfProvider(const QString& pdfPath);

    ~MuPdfProvider() override;

    MuPdfProvider(const MuPdfProvider&) = delete;
    MuPdfProvider& operator=(const MuPdfProvider&) = delete;

    bool isValid() const override;
    bool isLocked() const override;
    int pageCount() const override;
    QString filePath() const override;
    QString infoValue(const QString& key) const override;
    QSizeF pageSize(int pageIndex) const override;
    QString pageText(int pageIndex) const override;
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;

private:
    fz_context* m_ctx = nullptr;
    fz_document* m_doc = nullptr;
    QString m_path;
    int m_pageCount = 0;                ///< Read once at open time
};
