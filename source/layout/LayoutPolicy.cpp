// ============================================================================
// LayoutPolicy - Shared helpers and factory
// ============================================================================

#include "LayoutPolicy.h"
#include "SingleSymbolLayout.h"
#include "StackedSymbolLayout.h"

int LayoutPolicy::symbolPixelSize(int dpi) const
{
    if (dpi <= 0) {
        return 0;
    }
    return qRound(slotRect(0).width() / 72.0 * dpi);
}

int LayoutPolicy::pageCountFor(int symbolCount) const
{
    if (symbolCount <= 0) {
        return 0;
    }
    const int slots = slotsPerPage();
    return (symbolCount + slots - 1) / slots;
}

int LayoutPolicy::slotAt(const QPointF& pointPt) const
{
    for (int slot = 0; slot < slotsPerPage(); ++slot) {
        if (slotRect(slot).contains(pointPt)) {
            return slot;
        }
    }
    return -1;
}

QString LayoutPolicy::name() const
{
    return layoutKindName(kind());
}

std::unique_ptr<LayoutPolicy> LayoutPolicy::create(LayoutKind kind)
{
    switch (kind) {
        case LayoutKind::Single:
            return std::make_unique<SingleSymbolLayout>();
        case LayoutKind::Stacked:
            return std::make_unique<StackedSymbolLayout>();
    }
    return nullptr;
}

QString layoutKindName(LayoutKind kind)
{
    switch (kind) {
        case LayoutKind::Single:  return QStringLiteral("single");
        case LayoutKind::Stacked: return QStringLiteral("stacked");
    }
    return QString();
}

bool parseLayoutKind(const QString& name, LayoutKind* kind)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("single")) {
        if (kind) *kind = LayoutKind::Single;
        return true;
    }
    if (key == QLatin1String("stacked")) {
        if (kind) *kind = LayoutKind::Stacked;
        return true;
    }
    return false;
}
