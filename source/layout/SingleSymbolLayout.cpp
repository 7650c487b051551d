// ============================================================================
// SingleSymbolLayout - One QR symbol per 8 x 8 inch page
// ============================================================================

#include "SingleSymbolLayout.h"
#include "../core/Codec.h"

static constexpr qreal POINTS_PER_INCH = 72.0;

QSizeF SingleSymbolLayout::pageSize() const
{
    const qreal edge = PAGE_INCHES * POINTS_PER_INCH;
    return QSizeF(edge, edge);
}

QRectF SingleSymbolLayout::slotRect(int slot) const
{
    if (slot != 0) {
        return QRectF();
    }

    const qreal padding = PADDING_INCHES * POINTS_PER_INCH;
    const qreal bottomOffset = BOTTOM_OFFSET_INCHES * POINTS_PER_INCH;
    const qreal edge = pageSize().width() - 2 * padding - bottomOffset;
    return QRectF(padding, padding, edge, edge);
}

int SingleSymbolLayout::defaultChunkSize() const
{
    return Codec::DEFAULT_CHUNK_SIZE;
}

PagePlacement SingleSymbolLayout::placeImages(int pageNumber, int imageCount) const
{
    PagePlacement placement;
    placement.pageSize = pageSize();

    if (imageCount > 0) {
        placement.symbolRects.append(slotRect(0));
    }

    // Caption baseline sits halfway into the bottom padding, right edge
    // aligned with the symbol's right edge
    const qreal padding = PADDING_INCHES * POINTS_PER_INCH;
    placement.caption = QStringLiteral("Page %1").arg(pageNumber);
    placement.captionFontSize = CAPTION_FONT_SIZE;
    placement.captionAnchor = QPointF(placement.pageSize.width() - padding,
                                      placement.pageSize.height() - padding / 2);

    return placement;
}
