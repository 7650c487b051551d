// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================

#include "MuPdfProvider.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QStringList>

#include <cstring>

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfProvider::MuPdfProvider(const QString& pdfPath)
    : m_path(pdfPath)
{
    // Create MuPDF context
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfProvider] Failed to create MuPDF context";
        return;
    }

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Failed to register document handlers";
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return;
    }

    QByteArray pathUtf8 = pdfPath.toUtf8();
    fz_try(m_ctx) {
        m_doc = fz_open_document(m_ctx, pathUtf8.constData());
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Failed to open" << pdfPath
                   << "-" << fz_caught_message(m_ctx);
        return;
    }

    fz_try(m_ctx) {
        m_pageCount = fz_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Failed to get page count";
        m_pageCount = 0;
    }

    qDebug() << "[MuPdfProvider] Loaded" << pdfPath << "with" << m_pageCount << "pages";
}

MuPdfProvider::~MuPdfProvider()
{
    if (m_doc) {
        fz_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

// ============================================================================
// Document Info
// ============================================================================

bool MuPdfProvider::isValid() const
{
    return m_ctx != nullptr && m_doc != nullptr && m_pageCount > 0;
}

bool MuPdfProvider::isLocked() const
{
    if (!m_doc) return false;

    return fz_needs_password(m_ctx, m_doc) != 0;
}

int MuPdfProvider::pageCount() const
{
    return m_pageCount;
}

QString MuPdfProvider::filePath() const
{
    return m_path;
}

QString MuPdfProvider::infoValue(const QString& key) const
{
    if (!isValid()) return QString();

    // "info:" keys are looked up directly in the trailer's Info dictionary,
    // which also covers the custom QrPaper entries
    QByteArray lookup = QByteArray(FZ_META_INFO) + key.toLatin1();

    char buf[256] = {0};
    int length = -1;
    fz_try(m_ctx) {
        length = fz_lookup_metadata(m_ctx, m_doc, lookup.constData(), buf, sizeof(buf));
    }
    fz_catch(m_ctx) {
        return QString();
    }

    if (length <= 0) {
        return QString();
    }
    return QString::fromUtf8(buf);
}

// ============================================================================
// Page Info
// ============================================================================

QSizeF MuPdfProvider::pageSize(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QSizeF();
    }

    fz_rect bounds = fz_empty_rect;
    fz_page* page = nullptr;
    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        bounds = fz_bound_page(m_ctx, page);
    }
    fz_always(m_ctx) {
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        return QSizeF();
    }

    return QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
}

QString MuPdfProvider::pageText(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QString();
    }

    QStringList lines;
    fz_page* page = nullptr;
    fz_stext_page* textPage = nullptr;

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);

        fz_stext_options opts = {0};
        textPage = fz_new_stext_page_from_page(m_ctx, page, &opts);

        for (fz_stext_block* block = textPage->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) continue;

            for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
                QString text;
                for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                    text += QChar(ch->c);
                }
                lines.append(text);
            }
        }
    }
    fz_always(m_ctx) {
        if (textPage) fz_drop_stext_page(m_ctx, textPage);
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Text extraction failed for page" << pageIndex;
        return QString();
    }

    return lines.join('\n');
}

// ============================================================================
// Rendering
// ============================================================================

QImage MuPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount || dpi <= 0) {
        return QImage();
    }

    // Scale factor: PDF points are 72 dpi
    float scale = static_cast<float>(dpi / 72.0);

    fz_page* page = nullptr;
    fz_pixmap* pix = nullptr;
    fz_device* dev = nullptr;
    QImage result;

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);

        fz_matrix ctm = fz_scale(scale, scale);
        fz_rect bounds = fz_bound_page(m_ctx, page);
        fz_irect bbox = fz_round_rect(fz_transform_rect(bounds, ctm));

        // Single gray channel, no alpha: maps directly onto Format_Grayscale8
        pix = fz_new_pixmap_with_bbox(m_ctx, fz_device_gray(m_ctx), bbox, nullptr, 0);
        fz_clear_pixmap_with_value(m_ctx, pix, 255);

        dev = fz_new_draw_device(m_ctx, ctm, pix);
        fz_run_page(m_ctx, page, dev, fz_identity, nullptr);
        fz_close_device(m_ctx, dev);

        int width = fz_pixmap_width(m_ctx, pix);
        int height = fz_pixmap_height(m_ctx, pix);
        int stride = static_cast<int>(fz_pixmap_stride(m_ctx, pix));
        unsigned char* samples = fz_pixmap_samples(m_ctx, pix);

        result = QImage(width, height, QImage::Format_Grayscale8);
        for (int y = 0; y < height; ++y) {
            std::memcpy(result.scanLine(y), samples + y * stride, width);
        }
    }
    fz_always(m_ctx) {
        if (dev) fz_drop_device(m_ctx, dev);
        if (pix) fz_drop_pixmap(m_ctx, pix);
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Render failed for page" << pageIndex
                   << ":" << fz_caught_message(m_ctx);
        return QImage();
    }

    return result;
}
