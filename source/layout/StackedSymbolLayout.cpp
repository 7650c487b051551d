// ============================================================================
// StackedSymbolLayout - Two 100 mm QR symbols per US Letter page
// ============================================================================

#include "StackedSymbolLayout.h"
#include "../core/Codec.h"

static constexpr qreal POINTS_PER_INCH = 72.0;
static constexpr qreal MM_PER_INCH = 25.4;

qreal StackedSymbolLayout::symbolEdgePt()
{
    return SYMBOL_MM / MM_PER_INCH * POINTS_PER_INCH;
}

QSizeF StackedSymbolLayout::pageSize() const
{
    return QSizeF(PAGE_WIDTH_INCHES * POINTS_PER_INCH, PAGE_HEIGHT_INCHES * POINTS_PER_INCH);
}

QRectF StackedSymbolLayout::blockRect() const
{
    const QSizeF page = pageSize();
    const qreal width = symbolEdgePt();
    const qreal height = ROWS * symbolEdgePt();
    return QRectF((page.width() - width) / 2, (page.height() - height) / 2, width, height);
}

QRectF StackedSymbolLayout::slotRect(int slot) const
{
    if (slot < 0 || slot >= ROWS) {
        return QRectF();
    }

    const QRectF block = blockRect();
    const qreal edge = symbolEdgePt();
    return QRectF(block.left(), block.top() + slot * edge, edge, edge);
}

int StackedSymbolLayout::defaultChunkSize() const
{
    return Codec::STACKED_CHUNK_SIZE;
}

PagePlacement StackedSymbolLayout::placeImages(int pageNumber, int imageCount) const
{
    Q_UNUSED(pageNumber)

    PagePlacement placement;
    placement.pageSize = pageSize();

    const int count = qBound(0, imageCount, ROWS);
    for (int slot = 0; slot < count; ++slot) {
        placement.symbolRects.append(slotRect(slot));
    }

    // Crosses at the four corners of the full column, drawn even when the
    // last page holds a single symbol so every sheet is cut the same way
    const QRectF block = blockRect();
    const QPointF corners[] = {
        block.topLeft(), block.topRight(), block.bottomLeft(), block.bottomRight()
    };
    for (const QPointF& corner : corners) {
        placement.marks.append(QLineF(corner.x() - MARK_LENGTH_PT, corner.y(),
                                      corner.x() + MARK_LENGTH_PT, corner.y()));
        placement.marks.append(QLineF(corner.x(), corner.y() - MARK_LENGTH_PT,
                                      corner.x(), corner.y() + MARK_LENGTH_PT));
    }

    return placement;
}
