#pragma once

// ============================================================================
// QrSymbolDecoder - Finds and decodes QR symbols in a page raster
// ============================================================================
// Wraps ZXing-cpp. Only the QR format is enabled. Each decoded symbol
// comes back with its position in image pixels so the caller can work out
// which layout slot it was printed in.
// ============================================================================

#include <QByteArray>
#include <QImage>
#include <QPointF>
#include <QRectF>
#include <QVector>

/**
 * @brief A symbol found in an image.
 */
struct DecodedSymbol {
    QByteArray text;        ///< Symbol content
    QPointF center;         ///< Center of the symbol in image pixels
    QRectF bounds;          ///< Axis-aligned bounds in image pixels
};

class QrSymbolDecoder {
public:
    /**
     * @brief Decode every QR symbol in an image.
     *
     * The image is converted to 8-bit grayscale before detection. Symbols
     * that are detected but fail error correction are dropped.
     *
     * @param image Page raster in any QImage format
     * @return Decoded symbols, sorted top-to-bottom then left-to-right by center
     */
    static QVector<DecodedSymbol> decode(const QImage& image);
};
