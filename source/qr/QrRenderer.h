#pragma once

// ============================================================================
// QrRenderer - Turns chunk text into QR symbol images
// ============================================================================
// Wraps libqrencode. Every symbol uses error-correction level H with
// automatic version selection, a 4-module quiet zone, and is upscaled
// with nearest-neighbor sampling so the output stays strictly black and
// white.
//
// renderAll() fans the work out over a bounded QThreadPool. Each task
// writes only its own pre-sized result slot, so no locking is needed and
// the output order always matches the input order.
// ============================================================================

#include "../core/PaperTypes.h"

#include <QByteArray>
#include <QImage>
#include <QString>
#include <QVector>

#include <atomic>

/**
 * @brief Renders QR symbols for the encode pipeline.
 *
 * Usage:
 * @code
 * QrRenderer::BatchResult result = QrRenderer::renderAll(texts, 1770, 4);
 * if (!result.success) {
 *     qWarning() << result.errorMessage;
 * }
 * @endcode
 */
class QrRenderer {
public:
    /// Quiet zone width in modules on every side.
    static constexpr int QUIET_ZONE_MODULES = 4;

    /**
     * @brief Result of rendering a list of symbols.
     */
    struct BatchResult {
        bool success = false;
        PaperError error = PaperError::None;
        QString errorMessage;
        int failedIndex = -1;           ///< First symbol that failed to render
        QVector<QImage> images;         ///< One image per input, in input order
    };

    /**
     * @brief Render one symbol.
     *
     * @param data Bytes to encode (8-bit mode)
     * @param pixelSize Edge of the output image in pixels
     * @param errorMessage Receives the reason on failure (may be null)
     * @return Grayscale8 image of pixelSize x pixelSize, or a null image if
     *         the data exceeds the capacity of a level H symbol or the
     *         requested size is smaller than one pixel per module
     */
    static QImage render(const QByteArray& data, int pixelSize, QString* errorMessage = nullptr);

    /**
     * @brief Render every symbol with a bounded worker pool.
     *
     * @param texts Symbol contents, index i produces images[i]
     * @param pixelSize Edge of each output image in pixels
     * @param parallelism Worker count; 1 renders sequentially on the caller thread
     * @param progress Called on the caller thread in index order (may be empty)
     * @param cancelled Checked before each symbol (may be null)
     */
    static BatchResult renderAll(const QVector<QByteArray>& texts, int pixelSize, int parallelism,
                                 const PaperProgressCallback& progress = PaperProgressCallback(),
                                 std::atomic<bool>* cancelled = nullptr);

    /**
     * @brief Number of modules per side (without quiet zone) the data needs.
     * @return 0 if the data does not fit in a level H symbol
     */
    static int moduleCount(const QByteArray& data);
};
