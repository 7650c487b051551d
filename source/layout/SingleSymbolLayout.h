#pragma once

// ============================================================================
// SingleSymbolLayout - One QR symbol per 8 x 8 inch page
// ============================================================================
// The symbol sits 0.6 in from the top, left and right edges. The bottom
// margin is 0.6 in plus a 0.9 in offset, and the "Page N" caption is drawn
// right-aligned inside it. N is the page number in the whole document.
// ============================================================================

#include "LayoutPolicy.h"

class SingleSymbolLayout : public LayoutPolicy {
public:
    static constexpr qreal PAGE_INCHES = 8.0;
    static constexpr qreal PADDING_INCHES = 0.6;
    static constexpr qreal BOTTOM_OFFSET_INCHES = 0.9;
    static constexpr qreal CAPTION_FONT_SIZE = 10.0;

    LayoutKind kind() const override { return LayoutKind::Single; }
    int slotsPerPage() const override { return 1; }
    QSizeF pageSize() const override;
    QRectF slotRect(int slot) const override;
    int defaultChunkSize() const override;
    PagePlacement placeImages(int pageNumber, int imageCount) const override;
};
