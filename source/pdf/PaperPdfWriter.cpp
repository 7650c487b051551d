// ============================================================================
// PaperPdfWriter - Composes QR symbols into a printable PDF using MuPDF
// ============================================================================

#include "PaperPdfWriter.h"
#include "PaperDocumentProperties.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QBuffer>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QFileInfo>

static constexpr float INFO_MARGIN_PT = 36.0f;     ///< Left margin of the information page
static constexpr float INFO_TOP_PT = 72.0f;        ///< First baseline, from the top edge
static constexpr float INFO_HEADING_SIZE = 14.0f;
static constexpr float INFO_TEXT_SIZE = 12.0f;
static constexpr float INFO_HEADING_ADVANCE = 18.0f;
static constexpr float INFO_LINE_ADVANCE = 14.0f;
static constexpr float INFO_GAP = 10.0f;
static constexpr float MARK_LINE_WIDTH = 0.5f;

static const char* PRODUCER = "QrPaper 1.0.0";

// ============================================================================
// String helpers
// ============================================================================

/**
 * @brief Encode text as a PDF literal string for a WinAnsi simple font.
 *
 * Characters outside Latin-1 are replaced by '?'. Delimiters and bytes
 * above 0x7E are escaped.
 */
static QByteArray pdfLatinString(const QString& text)
{
    QByteArray out;
    out.reserve(text.size() + 2);
    out.append('(');
    for (const QChar& ch : text) {
        const ushort code = ch.unicode();
        if (code == '(' || code == ')' || code == '\\') {
            out.append('\\');
            out.append(static_cast<char>(code));
        } else if (code >= 0x20 && code < 0x7F) {
            out.append(static_cast<char>(code));
        } else if (code >= 0xA0 && code <= 0xFF) {
            out.append(QByteArray("\\") + QByteArray::number(code, 8).rightJustified(3, '0'));
        } else {
            out.append('?');
        }
    }
    out.append(')');
    return out;
}

/**
 * @brief Encode text as a hex string of UTF-16BE code units (UniGB-UTF16-H).
 */
static QByteArray pdfUtf16HexString(const QString& text)
{
    QByteArray out;
    out.reserve(text.size() * 4 + 2);
    out.append('<');
    for (const QChar& ch : text) {
        out.append(QByteArray::number(ch.unicode(), 16).rightJustified(4, '0').toUpper());
    }
    out.append('>');
    return out;
}

// ============================================================================
// Construction / Destruction
// ============================================================================

PaperPdfWriter::PaperPdfWriter(QObject* parent)
    : QObject(parent)
{
}

PaperPdfWriter::~PaperPdfWriter()
{
    cleanup();
}

// ============================================================================
// Public API
// ============================================================================

PaperWriteResult PaperPdfWriter::writePdf(const QVector<QImage>& symbols, const PaperWriteOptions& options)
{
    PaperWriteResult result;

    if (options.outputPath.isEmpty()) {
        result.error = PaperError::InvalidArgument;
        result.errorMessage = tr("No output path specified");
        return result;
    }

    m_layout = LayoutPolicy::create(options.layout);
    if (!m_layout) {
        result.error = PaperError::InvalidArgument;
        result.errorMessage = tr("Unknown page layout");
        return result;
    }

    const int slots = m_layout->slotsPerPage();
    const int dataPages = m_layout->pageCountFor(static_cast<int>(symbols.size()));
    const int infoPages = options.includeInfoPage ? 1 : 0;
    const int total = infoPages + dataPages;

    if (total == 0) {
        result.error = PaperError::InvalidArgument;
        result.errorMessage = tr("Nothing to write: no symbols and no information page");
        return result;
    }

    m_options = options;
    m_cancelled.store(false);

    qDebug() << "[PaperPdfWriter] Writing" << symbols.size() << "symbols on"
             << dataPages << "data pages (" << m_layout->name() << "layout,"
             << options.dpi << "DPI ) to" << options.outputPath;

    if (!initContext()) {
        result.error = PaperError::Io;
        result.errorMessage = tr("Failed to initialize PDF engine");
        cleanup();
        return result;
    }

    if (!loadFonts()) {
        result.error = PaperError::Io;
        result.errorMessage = tr("Failed to load PDF fonts");
        cleanup();
        return result;
    }

    int page = 0;

    if (options.includeInfoPage) {
        emit progressUpdated(++page, total);
        if (!writeInfoPage()) {
            result.error = PaperError::Io;
            result.errorMessage = tr("Failed to write information page");
            cleanup();
            return result;
        }
        result.pagesWritten++;
    }

    for (int dataPage = 0; dataPage < dataPages; ++dataPage) {
        if (m_cancelled.load()) {
            result.error = PaperError::Cancelled;
            result.errorMessage = tr("Write cancelled");
            cleanup();
            return result;
        }

        emit progressUpdated(++page, total);

        const int first = dataPage * slots;
        const int count = qMin(slots, static_cast<int>(symbols.size()) - first);
        if (!writeDataPage(page, symbols.mid(first, count))) {
            result.error = PaperError::Io;
            result.errorMessage = tr("Failed to write data page %1").arg(dataPage + 1);
            cleanup();
            return result;
        }
        result.pagesWritten++;
        result.dataPages++;
    }

    if (m_cancelled.load()) {
        result.error = PaperError::Cancelled;
        result.errorMessage = tr("Write cancelled");
        cleanup();
        return result;
    }

    if (!writeMetadata(dataPages)) {
        // The scanner relies on these entries, so this is fatal here
        result.error = PaperError::Io;
        result.errorMessage = tr("Failed to write document properties");
        cleanup();
        return result;
    }

    if (!saveDocument(options.outputPath)) {
        result.error = PaperError::Io;
        result.errorMessage = tr("Failed to save PDF file");
        cleanup();
        if (QFile::exists(options.outputPath) && !QFile::remove(options.outputPath)) {
            qWarning() << "[PaperPdfWriter] Could not remove partial file" << options.outputPath;
        }
        return result;
    }

    result.fileSizeBytes = QFileInfo(options.outputPath).size();

    cleanup();
    result.success = true;

    qDebug() << "[PaperPdfWriter] Write complete:"
             << result.pagesWritten << "pages,"
             << (result.fileSizeBytes / 1024) << "KB";

    return result;
}

void PaperPdfWriter::cancel()
{
    m_cancelled.store(true);
}

QStringList PaperPdfWriter::infoPageLines(const DocumentStats& stats, const PaperWriteOptions& options)
{
    std::unique_ptr<LayoutPolicy> layout = LayoutPolicy::create(options.layout);
    const int slots = layout ? layout->slotsPerPage() : 1;

    QStringList lines;
    lines << QStringLiteral("H:DATA STATISTICS");
    lines << QStringLiteral("T:Original size   : %1 bytes").arg(stats.originalSize);
    lines << QStringLiteral("T:Compressed size : %1 bytes").arg(stats.compressedSize);
    lines << QStringLiteral("T:Base64 size     : %1 bytes").arg(stats.encodedSize);
    lines << QStringLiteral("T:Total QR codes  : %1").arg(stats.chunkCount);
    lines << QStringLiteral("T:Layout          : %1 (%2 per page)")
                 .arg(layoutKindName(options.layout)).arg(slots);
    lines << QStringLiteral("T:Resolution      : %1 DPI").arg(options.dpi);
    if (options.indexed) {
        lines << QStringLiteral("T:Each QR code starts with its 6-digit index and ':'");
    }
    lines << QString();

    lines << QStringLiteral("B:DECODING INSTRUCTIONS (EN):");
    lines << QStringLiteral("B:1. Scan all QR codes in order.");
    lines << QStringLiteral("B:2. Concatenate the scanned outputs.");
    lines << QStringLiteral("B:3. Base64-decode the result.");
    lines << QStringLiteral("B:4. zlib-decompress the output.");
    lines << QString();

    lines << QString::fromUtf8("B:INSTRUCCIONES DE DECODIFICACI\u00d3N (ES):");
    lines << QString::fromUtf8("B:1. Escanee todos los c\u00f3digos QR en orden.");
    lines << QStringLiteral("B:2. Concatenar las salidas escaneadas.");
    lines << QStringLiteral("B:3. Decodificar Base64 el resultado.");
    lines << QStringLiteral("B:4. Descomprimir con zlib la salida.");
    lines << QString();

    lines << QString::fromUtf8("C:\u89e3\u7801\u8bf4\u660e (ZH)\uff1a");
    lines << QString::fromUtf8("C:1. \u6309\u987a\u5e8f\u626b\u63cf\u6240\u6709\u4e8c\u7ef4\u7801\u3002");
    lines << QString::fromUtf8("C:2. \u5c06\u626b\u63cf\u8f93\u51fa\u8fde\u63a5\u6210\u4e00\u4e2a\u5b57\u7b26\u4e32\u3002");
    lines << QString::fromUtf8("C:3. \u5bf9\u7ed3\u679c\u8fdb\u884c Base64 \u89e3\u7801\u3002");
    lines << QString::fromUtf8("C:4. \u4f7f\u7528 zlib \u89e3\u538b\u7f29\u8f93\u51fa\u3002");

    return lines;
}

// ============================================================================
// Initialization
// ============================================================================

bool PaperPdfWriter::initContext()
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[PaperPdfWriter] Failed to create MuPDF context";
        return false;
    }

    fz_try(m_ctx) {
        m_doc = pdf_create_document(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "[PaperPdfWriter] Failed to create output PDF:" << fz_caught_message(m_ctx);
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return false;
    }

    return true;
}

void PaperPdfWriter::cleanup()
{
    if (m_ctx) {
        pdf_drop_obj(m_ctx, m_regularRef);
        pdf_drop_obj(m_ctx, m_boldRef);
        pdf_drop_obj(m_ctx, m_cjkRef);
        fz_drop_font(m_ctx, m_regularFont);
        fz_drop_font(m_ctx, m_boldFont);
        fz_drop_font(m_ctx, m_cjkFont);
    }
    m_regularRef = nullptr;
    m_boldRef = nullptr;
    m_cjkRef = nullptr;
    m_regularFont = nullptr;
    m_boldFont = nullptr;
    m_cjkFont = nullptr;

    if (m_doc) {
        pdf_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }

    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

bool PaperPdfWriter::loadFonts()
{
    fz_try(m_ctx) {
        m_regularFont = fz_new_base14_font(m_ctx, "Helvetica");
        m_boldFont = fz_new_base14_font(m_ctx, "Helvetica-Bold");
        m_regularRef = pdf_add_simple_font(m_ctx, m_doc, m_regularFont, PDF_SIMPLE_ENCODING_LATIN);
        m_boldRef = pdf_add_simple_font(m_ctx, m_doc, m_boldFont, PDF_SIMPLE_ENCODING_LATIN);
    }
    fz_catch(m_ctx) {
        qWarning() << "[PaperPdfWriter] Failed to load base14 fonts:" << fz_caught_message(m_ctx);
        return false;
    }

    if (!m_options.includeInfoPage) {
        return true;
    }

    // MuPDF builds without CJK fonts throw here; the Chinese block is then skipped
    fz_try(m_ctx) {
        m_cjkFont = fz_new_cjk_font(m_ctx, FZ_ADOBE_GB);
        m_cjkRef = pdf_add_cjk_font(m_ctx, m_doc, m_cjkFont, FZ_ADOBE_GB, 0, 1);
    }
    fz_catch(m_ctx) {
        qWarning() << "[PaperPdfWriter] CJK font unavailable, Chinese instructions skipped:"
                   << fz_caught_message(m_ctx);
        fz_drop_font(m_ctx, m_cjkFont);
        m_cjkFont = nullptr;
        m_cjkRef = nullptr;
    }

    return true;
}

pdf_obj* PaperPdfWriter::newFontResources()
{
    pdf_obj* resources = pdf_new_dict(m_ctx, m_doc, 2);
    pdf_obj* fonts = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(Font), 3);
    pdf_dict_puts(m_ctx, fonts, "F1", m_regularRef);
    pdf_dict_puts(m_ctx, fonts, "F2", m_boldRef);
    if (m_cjkRef) {
        pdf_dict_puts(m_ctx, fonts, "F3", m_cjkRef);
    }
    return resources;
}

float PaperPdfWriter::textWidth(fz_font* font, const QString& text, float size) const
{
    float width = 0.0f;
    for (const QChar& ch : text) {
        int glyph = fz_encode_character(m_ctx, font, ch.unicode());
        width += fz_advance_glyph(m_ctx, font, glyph, 0);
    }
    return width * size;
}

// ============================================================================
// Page Writing
// ============================================================================

bool PaperPdfWriter::writeInfoPage()
{
    const QSizeF pageSize = m_layout->pageSize();
    const float widthPt = static_cast<float>(pageSize.width());
    const float heightPt = static_cast<float>(pageSize.height());

    const QStringList lines = infoPageLines(m_options.stats, m_options);

    fz_buffer* content = nullptr;
    pdf_obj* resources = nullptr;
    pdf_obj* pageObj = nullptr;

    fz_try(m_ctx) {
        resources = newFontResources();
        content = fz_new_buffer(m_ctx, 2048);

        float y = heightPt - INFO_TOP_PT;
        for (const QString& entry : lines) {
            if (entry.isEmpty()) {
                y -= INFO_GAP;
                continue;
            }

            const QChar role = entry.at(0);
            const QString text = entry.mid(2);

            if (role == QLatin1Char('C')) {
                if (!m_cjkRef) {
                    continue;
                }
                fz_append_printf(m_ctx, content, "BT /F3 %g Tf %g %g Td ",
                                 INFO_TEXT_SIZE, INFO_MARGIN_PT, y);
                fz_append_string(m_ctx, content, pdfUtf16HexString(text).constData());
                fz_append_string(m_ctx, content, " Tj ET\n");
                y -= INFO_LINE_ADVANCE;
                continue;
            }

            const bool heading = (role == QLatin1Char('H'));
            const char* fontName = (role == QLatin1Char('T')) ? "F1" : "F2";
            const float size = heading ? INFO_HEADING_SIZE : INFO_TEXT_SIZE;

            fz_append_printf(m_ctx, content, "BT /%s %g Tf %g %g Td ", fontName, size, INFO_MARGIN_PT, y);
            fz_append_string(m_ctx, content, pdfLatinString(text).constData());
            fz_append_string(m_ctx, content, " Tj ET\n");

            y -= heading ? INFO_HEADING_ADVANCE : INFO_LINE_ADVANCE;
        }

        fz_rect mediabox = fz_make_rect(0, 0, widthPt, heightPt);
        pageObj = pdf_add_page(m_ctx, m_doc, mediabox, 0, resources, content);
        pdf_insert_page(m_ctx, m_doc, -1, pageObj);
    }
    fz_always(m_ctx) {
        fz_drop_buffer(m_ctx, content);
        pdf_drop_obj(m_ctx, resources);
        pdf_drop_obj(m_ctx, pageObj);
    }
    fz_catch(m_ctx) {
        qWarning() << "[PaperPdfWriter] Failed to create information page:" << fz_caught_message(m_ctx);
        return false;
    }

    return true;
}

bool PaperPdfWriter::writeDataPage(int pageNumber, const QVector<QImage>& images)
{
    const PagePlacement placement = m_layout->placeImages(pageNumber, static_cast<int>(images.size()));
    const float widthPt = static_cast<float>(placement.pageSize.width());
    const float heightPt = static_cast<float>(placement.pageSize.height());

    // Encode every symbol up front; Qt work stays outside the fz_try block
    QVector<QByteArray> pngData;
    pngData.reserve(images.size());
    for (const QImage& image : images) {
        QByteArray bytes;
        QBuffer buffer(&bytes);
        buffer.open(QIODevice::WriteOnly);
        if (!image.save(&buffer, "PNG")) {
            qWarning() << "[PaperPdfWriter] Failed to encode symbol image on page" << pageNumber;
            return false;
        }
        pngData.append(bytes);
    }

    fz_buffer* content = nullptr;
    fz_buffer* imgBuf = nullptr;
    fz_image* fzImage = nullptr;
    pdf_obj* resources = nullptr;
    pdf_obj* pageObj = nullptr;

    fz_try(m_ctx) {
        resources = newFontResources();
        pdf_obj* xobjects = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(XObject), 2);
        content = fz_new_buffer(m_ctx, 1024);

        for (int i = 0; i < pngData.size(); ++i) {
            imgBuf = fz_new_buffer_from_copied_data(m_ctx,
                reinterpret_cast<const unsigned char*>(pngData[i].constData()),
                static_cast<size_t>(pngData[i].size()));
            fzImage = fz_new_image_from_buffer(m_ctx, imgBuf);
            fz_drop_buffer(m_ctx, imgBuf);
            imgBuf = nullptr;  // Prevent double-drop in fz_always

            pdf_obj* imgObj = pdf_add_image(m_ctx, m_doc, fzImage);
            fz_drop_image(m_ctx, fzImage);
            fzImage = nullptr;

            char imgName[16];
            snprintf(imgName, sizeof(imgName), "Im%d", i);
            pdf_dict_puts_drop(m_ctx, xobjects, imgName, imgObj);

            // Image XObjects are 1x1 units; flip Y to the bottom-left origin
            const QRectF& rect = placement.symbolRects[i];
            const float w = static_cast<float>(rect.width());
            const float h = static_cast<float>(rect.height());
            const float x = static_cast<float>(rect.left());
            const float y = heightPt - static_cast<float>(rect.top()) - h;
            fz_append_printf(m_ctx, content, "q %g 0 0 %g %g %g cm /%s Do Q\n", w, h, x, y, imgName);
        }

        if (!placement.marks.isEmpty()) {
            fz_append_printf(m_ctx, content, "q 0 G %g w\n", MARK_LINE_WIDTH);
            for (const QLineF& mark : placement.marks) {
                fz_append_printf(m_ctx, content, "%g %g m %g %g l S\n",
                                 static_cast<float>(mark.x1()), heightPt - static_cast<float>(mark.y1()),
                                 static_cast<float>(mark.x2()), heightPt - static_cast<float>(mark.y2()));
            }
            fz_append_string(m_ctx, content, "Q\n");
        }

        if (!placement.caption.isEmpty()) {
            const float size = static_cast<float>(placement.captionFontSize);
            const float width = textWidth(m_regularFont, placement.caption, size);
            const float x = static_cast<float>(placement.captionAnchor.x()) - width;
            const float y = heightPt - static_cast<float>(placement.captionAnchor.y());
            fz_append_printf(m_ctx, content, "BT /F1 %g Tf %g %g Td ", size, x, y);
            fz_append_string(m_ctx, content, pdfLatinString(placement.caption).constData());
            fz_append_string(m_ctx, content, " Tj ET\n");
        }

        fz_rect mediabox = fz_make_rect(0, 0, widthPt, heightPt);
        pageObj = pdf_add_page(m_ctx, m_doc, mediabox, 0, resources, content);
        pdf_insert_page(m_ctx, m_doc, -1, pageObj);
    }
    fz_always(m_ctx) {
        fz_drop_buffer(m_ctx, imgBuf);
        fz_drop_image(m_ctx, fzImage);
        fz_drop_buffer(m_ctx, content);
        pdf_drop_obj(m_ctx, resources);
        pdf_drop_obj(m_ctx, pageObj);
    }
    fz_catch(m_ctx) {
        qWarning() << "[PaperPdfWriter] Failed to create page" << pageNumber
                   << ":" << fz_caught_message(m_ctx);
        return false;
    }

    return true;
}

// ============================================================================
// Metadata and Finalization
// ============================================================================

bool PaperPdfWriter::writeMetadata(int dataPages)
{
    Q_UNUSED(dataPages)

    struct Entry {
        const char* key;
        QByteArray value;
    };
    const Entry entries[] = {
        { "Producer", QByteArray(PRODUCER) },
        { "Title", QByteArray("QrPaper archive") },
        { PaperDocumentProperties::KEY_VERSION, QByteArray::number(PaperDocumentProperties::PROTOCOL_VERSION) },
        { PaperDocumentProperties::KEY_DPI, QByteArray::number(m_options.dpi) },
        { PaperDocumentProperties::KEY_LAYOUT, m_layout->name().toLatin1() },
        { PaperDocumentProperties::KEY_CHUNKS, QByteArray::number(m_options.stats.chunkCount) },
        { PaperDocumentProperties::KEY_CHUNK_SIZE, QByteArray::number(m_options.chunkSize) },
        { PaperDocumentProperties::KEY_INFO_PAGES, QByteArray::number(m_options.includeInfoPage ? 1 : 0) },
        { PaperDocumentProperties::KEY_INDEXED, QByteArray::number(m_options.indexed ? 1 : 0) },
    };

    fz_try(m_ctx) {
        pdf_obj* trailer = pdf_trailer(m_ctx, m_doc);
        pdf_obj* info = pdf_dict_get(m_ctx, trailer, PDF_NAME(Info));
        if (!info) {
            info = pdf_new_dict(m_ctx, m_doc, 12);
            pdf_dict_put_drop(m_ctx, trailer, PDF_NAME(Info), info);
        }

        for (const Entry& entry : entries) {
            if (!m_options.recordProperties && qstrncmp(entry.key, "QrPaper", 7) == 0) {
                continue;
            }
            pdf_dict_puts_drop(m_ctx, info, entry.key, pdf_new_text_string(m_ctx, entry.value.constData()));
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "[PaperPdfWriter] Failed to write metadata:" << fz_caught_message(m_ctx);
        return false;
    }

    return true;
}

bool PaperPdfWriter::saveDocument(const QString& outputPath)
{
    QByteArray pathUtf8 = outputPath.toUtf8();

    fz_try(m_ctx) {
        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;        // Compress streams
        opts.do_compress_images = 1; // Compress images
        opts.do_compress_fonts = 1;  // Compress fonts

        pdf_save_document(m_ctx, m_doc, pathUtf8.constData(), &opts);
    }
    fz_catch(m_ctx) {
        qWarning() << "[PaperPdfWriter] Failed to save document:" << fz_caught_message(m_ctx);
        return false;
    }

    qDebug() << "[PaperPdfWriter] Saved to" << outputPath;
    return true;
}
