#pragma once

// ============================================================================
// StackedSymbolLayout - Two 100 mm QR symbols per US Letter page
// ============================================================================
// The symbols form a centered column (slot 0 on top). Cross-shaped crop
// marks at the four corners of the column show where to cut when the
// printout is archived at its final size.
// ============================================================================

#include "LayoutPolicy.h"

class StackedSymbolLayout : public LayoutPolicy {
public:
    static constexpr qreal PAGE_WIDTH_INCHES = 8.5;
    static constexpr qreal PAGE_HEIGHT_INCHES = 11.0;
    static constexpr qreal SYMBOL_MM = 100.0;
    static constexpr int ROWS = 2;
    static constexpr qreal MARK_LENGTH_PT = 10.0;    ///< Half length of each crop mark arm

    LayoutKind kind() const override { return LayoutKind::Stacked; }
    int slotsPerPage() const override { return ROWS; }
    QSizeF pageSize() const override;
    QRectF slotRect(int slot) const override;
    int defaultChunkSize() const override;
    PagePlacement placeImages(int pageNumber, int imageCount) const override;

private:
    /// Bounding box of the symbol column in points.
    QRectF blockRect() const;

    static qreal symbolEdgePt();
};
