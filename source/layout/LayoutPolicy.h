#pragma once

// ============================================================================
// LayoutPolicy - Abstract interface for placing QR symbols on pages
// ============================================================================
// A layout policy decides the page size, how many symbols share a page
// and where each one goes. The writer uses it to compose pages and the
// scanner uses the same geometry to tell which slot a decoded symbol came
// from, so both sides must agree on the policy (it is stored in the
// document properties).
//
// Geometry is expressed in PDF points (1/72 inch) with a top-left origin.
// The writer flips the Y axis when emitting content streams.
// ============================================================================

#include <QString>
#include <QSizeF>
#include <QRectF>
#include <QPointF>
#include <QLineF>
#include <QVector>
#include <memory>

/**
 * @brief Closed set of page layouts.
 */
enum class LayoutKind {
    Single,     ///< One large symbol per square page, with a page caption
    Stacked     ///< Two symbols stacked on US Letter, with crop marks
};

/**
 * @brief Everything the writer needs to draw one data page.
 */
struct PagePlacement {
    QSizeF pageSize;                ///< Page size in points
    QVector<QRectF> symbolRects;    ///< One rect per image, in slot order
    QString caption;                ///< Caption text (empty for none)
    QPointF captionAnchor;          ///< Right end of the caption baseline
    qreal captionFontSize = 0;      ///< Caption size in points
    QVector<QLineF> marks;          ///< Crop / registration mark segments
};

/**
 * @brief Page layout strategy shared by the writer and the scanner.
 */
class LayoutPolicy {
public:
    virtual ~LayoutPolicy() = default;

    virtual LayoutKind kind() const = 0;

    /// Symbols per data page.
    virtual int slotsPerPage() const = 0;

    /// Page size in points.
    virtual QSizeF pageSize() const = 0;

    /**
     * @brief Rectangle of a slot on a data page.
     * @param slot 0-based slot, numbered top-to-bottom then left-to-right
     * @return Rect in points (top-left origin), or an empty rect if out of range
     */
    virtual QRectF slotRect(int slot) const = 0;

    /// Chunk size matching the symbol size of this layout.
    virtual int defaultChunkSize() const = 0;

    /**
     * @brief Pixel edge of a rendered symbol at the given DPI.
     *
     * Chosen so that the symbol image maps 1:1 onto its slot when the
     * page is printed or rasterized at the same DPI.
     */
    int symbolPixelSize(int dpi) const;

    /**
     * @brief Compose one data page.
     * @param pageNumber 1-based page number in the finished document, the
     *        same number decode errors report
     * @param imageCount Symbols on this page (1..slotsPerPage)
     */
    virtual PagePlacement placeImages(int pageNumber, int imageCount) const = 0;

    /// Data pages needed for a number of symbols.
    int pageCountFor(int symbolCount) const;

    /**
     * @brief Slot whose rectangle contains a point.
     * @param pointPt Point in page points (top-left origin)
     * @return Slot index, or -1 if the point is outside every slot
     */
    int slotAt(const QPointF& pointPt) const;

    /// Name stored in the document properties ("single", "stacked").
    QString name() const;

    // ===== Factory =====

    static std::unique_ptr<LayoutPolicy> create(LayoutKind kind);
};

/// Layout name as used on the command line and in document properties.
QString layoutKindName(LayoutKind kind);

/**
 * @brief Parse a layout name.
 * @return false if name is not a known layout
 */
bool parseLayoutKind(const QString& name, LayoutKind* kind);
