// ============================================================================
// QrSymbolDecoder - Finds and decodes QR symbols in a page raster
// ============================================================================

#include "QrSymbolDecoder.h"

#include <QDebug>

#include <ZXing/BarcodeFormat.h>
#include <ZXing/ReadBarcode.h>
#include <ZXing/ReaderOptions.h>

#include <algorithm>
#include <string>

QVector<DecodedSymbol> QrSymbolDecoder::decode(const QImage& image)
{
    QVector<DecodedSymbol> symbols;
    if (image.isNull()) {
        return symbols;
    }

    const QImage gray = (image.format() == QImage::Format_Grayscale8)
                      ? image
                      : image.convertToFormat(QImage::Format_Grayscale8);

    ZXing::ImageView view(gray.constBits(), gray.width(), gray.height(),
                          ZXing::ImageFormat::Lum, static_cast<int>(gray.bytesPerLine()));

    ZXing::ReaderOptions options;
    options.setFormats(ZXing::BarcodeFormat::QRCode);
    options.setTryHarder(true);
    options.setTryRotate(true);

    const auto results = ZXing::ReadBarcodes(view, options);

    for (const auto& barcode : results) {
        if (!barcode.isValid()) {
            qDebug() << "[QrSymbolDecoder] Skipping unreadable symbol";
            continue;
        }

        const auto& position = barcode.position();
        const auto tl = position.topLeft();
        const auto tr = position.topRight();
        const auto br = position.bottomRight();
        const auto bl = position.bottomLeft();

        const qreal minX = std::min({tl.x, tr.x, br.x, bl.x});
        const qreal maxX = std::max({tl.x, tr.x, br.x, bl.x});
        const qreal minY = std::min({tl.y, tr.y, br.y, bl.y});
        const qreal maxY = std::max({tl.y, tr.y, br.y, bl.y});

        DecodedSymbol symbol;
        const std::string text = barcode.text();
        symbol.text = QByteArray(text.data(), static_cast<qsizetype>(text.size()));
        symbol.center = QPointF((tl.x + tr.x + br.x + bl.x) / 4.0,
                                (tl.y + tr.y + br.y + bl.y) / 4.0);
        symbol.bounds = QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
        symbols.append(symbol);
    }

    std::sort(symbols.begin(), symbols.end(), [](const DecodedSymbol& a, const DecodedSymbol& b) {
        if (a.center.y() != b.center.y()) {
            return a.center.y() < b.center.y();
        }
        return a.center.x() < b.center.x();
    });

    return symbols;
}
