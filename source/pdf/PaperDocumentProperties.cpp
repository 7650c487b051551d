// ============================================================================
// PaperDocumentProperties - Protocol parameters stored in the PDF
// ============================================================================

#include "PaperDocumentProperties.h"
#include "PdfProvider.h"

#include <QDebug>

static bool readInt(const PdfProvider& provider, const char* key, int* value)
{
    const QString raw = provider.infoValue(QString::fromLatin1(key));
    bool ok = false;
    const int parsed = raw.trimmed().toInt(&ok);
    if (!ok) {
        return false;
    }
    *value = parsed;
    return true;
}

PaperDocumentProperties PaperDocumentProperties::read(const PdfProvider& provider)
{
    PaperDocumentProperties props;

    int version = 0;
    if (!readInt(provider, KEY_VERSION, &version)) {
        qDebug() << "[PaperDocumentProperties] No QrPaper properties in" << provider.filePath();
        return props;
    }
    if (version != PROTOCOL_VERSION) {
        qWarning() << "[PaperDocumentProperties] Unsupported protocol version" << version;
        return props;
    }
    props.version = version;

    if (!readInt(provider, KEY_DPI, &props.dpi) || props.dpi <= 0) {
        qWarning() << "[PaperDocumentProperties] Missing or invalid" << KEY_DPI;
        return props;
    }

    const QString layoutName = provider.infoValue(QString::fromLatin1(KEY_LAYOUT));
    if (!parseLayoutKind(layoutName, &props.layout)) {
        qWarning() << "[PaperDocumentProperties] Unknown layout" << layoutName;
        return props;
    }

    if (!readInt(provider, KEY_CHUNKS, &props.chunkCount) || props.chunkCount < 0) {
        qWarning() << "[PaperDocumentProperties] Missing or invalid" << KEY_CHUNKS;
        return props;
    }

    if (!readInt(provider, KEY_INFO_PAGES, &props.infoPages) || props.infoPages < 0) {
        qWarning() << "[PaperDocumentProperties] Missing or invalid" << KEY_INFO_PAGES;
        return props;
    }

    // Optional entries
    if (!readInt(provider, KEY_CHUNK_SIZE, &props.chunkSize)) {
        props.chunkSize = 0;
    }
    int indexed = 0;
    if (readInt(provider, KEY_INDEXED, &indexed)) {
        props.indexed = (indexed != 0);
    }

    props.present = true;

    qDebug() << "[PaperDocumentProperties] dpi" << props.dpi
             << "layout" << layoutKindName(props.layout)
             << "chunks" << props.chunkCount
             << "infoPages" << props.infoPages
             << "indexed" << props.indexed;
    return props;
}
