// ============================================================================
// DocumentScanner - Recovers chunk text from a paper document
// ============================================================================

#include "DocumentScanner.h"
#include "PdfProvider.h"
#include "../core/Codec.h"
#include "../qr/QrSymbolDecoder.h"

#include <QCoreApplication>
#include <QDebug>
#include <QSet>

// ============================================================================
// Public API
// ============================================================================

ScanResult DocumentScanner::scanFile(const QString& pdfPath, const ScanOptions& options,
                                     const PaperProgressCallback& progress,
                                     std::atomic<bool>* cancelled)
{
    std::unique_ptr<PdfProvider> provider = PdfProvider::create(pdfPath);
    if (!provider) {
        ScanResult result;
        result.error = PaperError::Io;
        result.errorMessage = QCoreApplication::translate("DocumentScanner", "Cannot open PDF: %1").arg(pdfPath);
        qWarning() << "[DocumentScanner]" << result.errorMessage;
        return result;
    }
    return scan(*provider, options, progress, cancelled);
}

ScanResult DocumentScanner::scan(const PdfProvider& provider, const ScanOptions& options,
                                 const PaperProgressCallback& progress,
                                 std::atomic<bool>* cancelled)
{
    ScanResult result;
    result.pageCount = provider.pageCount();
    result.properties = PaperDocumentProperties::read(provider);

    const PaperDocumentProperties& props = result.properties;

    if (props.present) {
        // Resolution coupling: a document is only read at the DPI it was composed at
        if (options.dpi > 0 && options.dpi != props.dpi) {
            result.error = PaperError::ResolutionMismatch;
            result.errorMessage = QCoreApplication::translate("DocumentScanner",
                "Requested %1 DPI but the document was composed at %2 DPI")
                .arg(options.dpi).arg(props.dpi);
            qWarning() << "[DocumentScanner]" << result.errorMessage;
            return result;
        }
        if (options.layoutSpecified && options.layout != props.layout) {
            const QString warning = QStringLiteral("Ignoring requested layout %1, document uses %2")
                .arg(layoutKindName(options.layout), layoutKindName(props.layout));
            qWarning() << "[DocumentScanner]" << warning;
            result.warnings << warning;
        }
        result.dpi = props.dpi;
        result.layout = props.layout;
        result.infoPages = props.infoPages;
        result.expectedCount = props.chunkCount;
        result.indexed = props.indexed;
    } else {
        result.dpi = options.dpi > 0 ? options.dpi : DEFAULT_DPI;
        result.layout = options.layout;
        result.infoPages = options.infoPages >= 0 ? options.infoPages : legacyInfoPages(options.layout);

        const QString warning = QStringLiteral("Document has no QrPaper properties; scanning at %1 DPI, %2 layout, %3 information page(s)")
            .arg(result.dpi)
            .arg(layoutKindName(result.layout))
            .arg(result.infoPages);
        qWarning() << "[DocumentScanner]" << warning;
        result.warnings << warning;

        result.expectedCount = -1;
        result.indexed = false;
    }

    std::unique_ptr<LayoutPolicy> layout = LayoutPolicy::create(result.layout);

    qDebug() << "[DocumentScanner] Scanning" << provider.filePath()
             << "(" << result.pageCount << "pages," << result.dpi << "DPI,"
             << layout->name() << "layout )";

    for (int pageIndex = 0; pageIndex < result.pageCount; ++pageIndex) {
        if (cancelled && cancelled->load()) {
            result.error = PaperError::Cancelled;
            result.errorMessage = QCoreApplication::translate("DocumentScanner", "Scan cancelled");
            return result;
        }

        const int pageNumber = pageIndex + 1;
        const bool infoPage = pageIndex < result.infoPages;

        if (progress) {
            progress(pageNumber, result.pageCount,
                     infoPage ? QStringLiteral("Checking information page %1").arg(pageNumber)
                              : QStringLiteral("Scanning page %1").arg(pageNumber));
        }

        if (!infoPage) {
            const QSizeF size = provider.pageSize(pageIndex);
            const QSizeF expected = layout->pageSize();
            if (qAbs(size.width() - expected.width()) > 1.0 || qAbs(size.height() - expected.height()) > 1.0) {
                const QString warning = QStringLiteral("Page %1 is %2 x %3 pt, %4 layout pages are %5 x %6 pt")
                    .arg(pageNumber).arg(size.width(), 0, 'f', 1).arg(size.height(), 0, 'f', 1)
                    .arg(layout->name()).arg(expected.width(), 0, 'f', 1).arg(expected.height(), 0, 'f', 1);
                qWarning() << "[DocumentScanner]" << warning;
                result.warnings << warning;
            }
        }

        const QImage raster = provider.renderPageToImage(pageIndex, result.dpi);
        if (raster.isNull()) {
            const QString warning = QStringLiteral("Page %1 could not be rendered").arg(pageNumber);
            qWarning() << "[DocumentScanner]" << warning;
            result.warnings << warning;
            if (!infoPage) {
                result.failedPages.append(pageNumber);
            }
            continue;
        }

        const QVector<DecodedSymbol> decoded = QrSymbolDecoder::decode(raster);

        if (infoPage) {
            if (!decoded.isEmpty()) {
                const QString warning = QStringLiteral("Ignoring %1 symbol(s) on information page %2")
                    .arg(decoded.size()).arg(pageNumber);
                qWarning() << "[DocumentScanner]" << warning;
                result.warnings << warning;
            }
            continue;
        }

        if (decoded.isEmpty()) {
            const QString warning = QStringLiteral("No QR symbol found on page %1").arg(pageNumber);
            qWarning() << "[DocumentScanner]" << warning;
            result.warnings << warning;
            result.failedPages.append(pageNumber);
            continue;
        }

        const int dataPageIndex = pageIndex - result.infoPages;
        const QVector<RecoveredSymbol> recovered = assignPositions(
            decoded, *layout, result.dpi, dataPageIndex, pageNumber, result.indexed, &result.warnings);

        if (recovered.isEmpty()) {
            result.failedPages.append(pageNumber);
            continue;
        }
        result.symbols += recovered;
    }

    result.success = true;

    qDebug() << "[DocumentScanner] Recovered" << result.symbols.size() << "symbols,"
             << result.failedPages.size() << "pages failed";
    return result;
}

QVector<RecoveredSymbol> DocumentScanner::assignPositions(const QVector<DecodedSymbol>& decoded,
                                                          const LayoutPolicy& layout, int dpi,
                                                          int dataPageIndex, int pageNumber,
                                                          bool indexed, QStringList* warnings)
{
    QVector<RecoveredSymbol> recovered;
    QSet<int> usedSlots;
    const qreal pointsPerPixel = 72.0 / dpi;

    auto warn = [&](const QString& message) {
        qWarning() << "[DocumentScanner]" << message;
        if (warnings) {
            warnings->append(message);
        }
    };

    for (const DecodedSymbol& symbol : decoded) {
        const QPointF centerPt(symbol.center.x() * pointsPerPixel, symbol.center.y() * pointsPerPixel);
        const int slot = layout.slotAt(centerPt);

        if (slot < 0) {
            warn(QStringLiteral("Page %1: symbol at (%2, %3) pt is outside every slot, dropped")
                 .arg(pageNumber).arg(centerPt.x(), 0, 'f', 1).arg(centerPt.y(), 0, 'f', 1));
            continue;
        }
        if (usedSlots.contains(slot)) {
            warn(QStringLiteral("Page %1: second symbol in slot %2, dropped").arg(pageNumber).arg(slot));
            continue;
        }
        usedSlots.insert(slot);

        RecoveredSymbol entry;
        entry.pageNumber = pageNumber;
        entry.slot = slot;
        entry.position = dataPageIndex * layout.slotsPerPage() + slot;
        entry.text = symbol.text;

        if (indexed) {
            int frameIndex = -1;
            QByteArray data;
            if (!Codec::parseFrame(symbol.text, &frameIndex, &data)) {
                warn(QStringLiteral("Page %1 slot %2: missing index frame, using position %3")
                     .arg(pageNumber).arg(slot).arg(entry.position));
            } else {
                if (frameIndex != entry.position) {
                    warn(QStringLiteral("Page %1 slot %2: index frame says %3, layout says %4")
                         .arg(pageNumber).arg(slot).arg(frameIndex).arg(entry.position));
                }
                entry.position = frameIndex;
                entry.text = data;
            }
        }

        recovered.append(entry);
    }

    return recovered;
}

int DocumentScanner::pageForPosition(int position, const LayoutPolicy& layout, int infoPages)
{
    return infoPages + position / layout.slotsPerPage() + 1;
}

int DocumentScanner::legacyInfoPages(LayoutKind layout)
{
    return layout == LayoutKind::Stacked ? 1 : 0;
}
