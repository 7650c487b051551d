#pragma once

// ============================================================================
// LayoutPolicyTests - Unit tests for page geometry and run settings
// ============================================================================

#include "LayoutPolicy.h"
#include "../core/PaperSettings.h"

#include <QDebug>
#include <QSettings>
#include <QTemporaryDir>

#include <cmath>

namespace LayoutPolicyTests {

inline bool fuzzyEqual(qreal a, qreal b)
{
    return std::abs(a - b) < 0.01;
}

/**
 * @brief Single layout: square page, one symbol, caption.
 */
inline bool testSingleGeometry()
{
    qDebug() << "=== Test: Single Layout Geometry ===";
    bool success = true;

    std::unique_ptr<LayoutPolicy> layout = LayoutPolicy::create(LayoutKind::Single);
    if (!layout || layout->kind() != LayoutKind::Single || layout->slotsPerPage() != 1) {
        qDebug() << "FAIL: factory returned the wrong layout";
        return false;
    }

    const QSizeF page = layout->pageSize();
    if (!fuzzyEqual(page.width(), 576.0) || !fuzzyEqual(page.height(), 576.0)) {
        qDebug() << "FAIL: page size" << page;
        success = false;
    }

    const QRectF slot = layout->slotRect(0);
    if (!fuzzyEqual(slot.left(), 43.2) || !fuzzyEqual(slot.top(), 43.2)
        || !fuzzyEqual(slot.width(), 424.8) || !fuzzyEqual(slot.height(), 424.8)) {
        qDebug() << "FAIL: slot rect" << slot;
        success = false;
    }
    if (!layout->slotRect(1).isEmpty()) {
        qDebug() << "FAIL: slot 1 should not exist";
        success = false;
    }

    if (layout->symbolPixelSize(300) != 1770) {
        qDebug() << "FAIL: symbolPixelSize(300) =" << layout->symbolPixelSize(300);
        success = false;
    }
    if (layout->symbolPixelSize(0) != 0) {
        qDebug() << "FAIL: symbolPixelSize(0) should be 0";
        success = false;
    }

    const PagePlacement placement = layout->placeImages(3, 1);
    if (placement.symbolRects.size() != 1 || placement.caption != QStringLiteral("Page 3")) {
        qDebug() << "FAIL: placement" << placement.symbolRects.size() << placement.caption;
        success = false;
    }
    if (!placement.marks.isEmpty()) {
        qDebug() << "FAIL: single layout should not draw marks";
        success = false;
    }
    // Caption sits below the symbol
    if (placement.captionAnchor.y() <= slot.bottom()) {
        qDebug() << "FAIL: caption overlaps the symbol";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Single layout geometry";
    }
    return success;
}

/**
 * @brief Stacked layout: two 100 mm symbols centered on Letter.
 */
inline bool testStackedGeometry()
{
    qDebug() << "=== Test: Stacked Layout Geometry ===";
    bool success = true;

    std::unique_ptr<LayoutPolicy> layout = LayoutPolicy::create(LayoutKind::Stacked);
    if (!layout || layout->slotsPerPage() != 2) {
        qDebug() << "FAIL: factory returned the wrong layout";
        return false;
    }

    const QSizeF page = layout->pageSize();
    if (!fuzzyEqual(page.width(), 612.0) || !fuzzyEqual(page.height(), 792.0)) {
        qDebug() << "FAIL: page size" << page;
        success = false;
    }

    const QRectF top = layout->slotRect(0);
    const QRectF bottom = layout->slotRect(1);
    const qreal edge = 100.0 / 25.4 * 72.0;
    if (!fuzzyEqual(top.width(), edge) || !fuzzyEqual(bottom.height(), edge)) {
        qDebug() << "FAIL: symbol edge" << top.width();
        success = false;
    }
    if (!fuzzyEqual(top.bottom(), bottom.top()) || !fuzzyEqual(top.left(), bottom.left())) {
        qDebug() << "FAIL: slots are not stacked";
        success = false;
    }
    // Centered horizontally and vertically
    if (!fuzzyEqual(top.left() + top.width() / 2, page.width() / 2)
        || !fuzzyEqual(top.top() + edge, page.height() / 2)) {
        qDebug() << "FAIL: block is not centered";
        success = false;
    }

    const PagePlacement full = layout->placeImages(2, 2);
    const PagePlacement last = layout->placeImages(6, 1);
    if (full.symbolRects.size() != 2 || last.symbolRects.size() != 1) {
        qDebug() << "FAIL: symbol rect counts";
        success = false;
    }
    if (full.marks.size() != 8 || last.marks.size() != 8) {
        qDebug() << "FAIL: expected 8 mark segments, got" << full.marks.size() << last.marks.size();
        success = false;
    }
    if (!full.caption.isEmpty()) {
        qDebug() << "FAIL: stacked layout should not caption";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Stacked layout geometry";
    }
    return success;
}

/**
 * @brief Page counts and point-to-slot lookups.
 */
inline bool testPagingAndSlots()
{
    qDebug() << "=== Test: Paging and Slot Lookup ===";
    bool success = true;

    std::unique_ptr<LayoutPolicy> single = LayoutPolicy::create(LayoutKind::Single);
    std::unique_ptr<LayoutPolicy> stacked = LayoutPolicy::create(LayoutKind::Stacked);

    if (single->pageCountFor(0) != 0 || single->pageCountFor(5) != 5) {
        qDebug() << "FAIL: single pageCountFor";
        success = false;
    }
    if (stacked->pageCountFor(1) != 1 || stacked->pageCountFor(2) != 1
        || stacked->pageCountFor(5) != 3) {
        qDebug() << "FAIL: stacked pageCountFor";
        success = false;
    }

    if (stacked->slotAt(stacked->slotRect(0).center()) != 0
        || stacked->slotAt(stacked->slotRect(1).center()) != 1) {
        qDebug() << "FAIL: slot centers not found";
        success = false;
    }
    if (stacked->slotAt(QPointF(5, 5)) != -1 || single->slotAt(QPointF(560, 560)) != -1) {
        qDebug() << "FAIL: margin point mapped to a slot";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Paging and slots";
    }
    return success;
}

inline bool testLayoutNames()
{
    qDebug() << "=== Test: Layout Names ===";
    bool success = true;

    LayoutKind kind = LayoutKind::Single;
    if (!parseLayoutKind(QStringLiteral("Stacked"), &kind) || kind != LayoutKind::Stacked) {
        qDebug() << "FAIL: 'Stacked' not parsed";
        success = false;
    }
    if (!parseLayoutKind(QStringLiteral(" single "), &kind) || kind != LayoutKind::Single) {
        qDebug() << "FAIL: ' single ' not parsed";
        success = false;
    }
    if (parseLayoutKind(QStringLiteral("grid"), &kind)) {
        qDebug() << "FAIL: unknown layout accepted";
        success = false;
    }
    if (LayoutPolicy::create(LayoutKind::Stacked)->name() != QStringLiteral("stacked")) {
        qDebug() << "FAIL: stacked name";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Layout names";
    }
    return success;
}

/**
 * @brief Settings survive a save/load cycle and bad values fall back.
 */
inline bool testSettingsRoundTrip()
{
    qDebug() << "=== Test: Settings Round-Trip ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: cannot create temp dir";
        return false;
    }
    const QString path = dir.filePath(QStringLiteral("qrpaper.ini"));

    {
        PaperSettings settings;
        settings.layout = LayoutKind::Stacked;
        settings.dpi = 600;
        settings.threads = 4;
        settings.infoPage = false;
        settings.indexed = true;
        settings.fetchTimeoutMs = 2500;
        QSettings store(path, QSettings::IniFormat);
        settings.save(store);
        store.sync();
    }

    {
        QSettings store(path, QSettings::IniFormat);
        const PaperSettings loaded = PaperSettings::load(store);
        if (loaded.layout != LayoutKind::Stacked || loaded.dpi != 600 || loaded.threads != 4
            || loaded.infoPage || !loaded.indexed || loaded.fetchTimeoutMs != 2500
            || loaded.imageTimeoutMs != 5000) {
            qDebug() << "FAIL: values did not survive the round trip";
            success = false;
        }
    }

    {
        QSettings store(path, QSettings::IniFormat);
        store.setValue(QStringLiteral("encode/layout"), QStringLiteral("diagonal"));
        store.setValue(QStringLiteral("encode/dpi"), -3);
        store.setValue(QStringLiteral("encode/threads"), QStringLiteral("many"));
        const PaperSettings loaded = PaperSettings::load(store);
        const PaperSettings defaults;
        if (loaded.layout != defaults.layout || loaded.dpi != defaults.dpi
            || loaded.threads != defaults.threads) {
            qDebug() << "FAIL: invalid values were not replaced by defaults";
            success = false;
        }
    }

    if (success) {
        qDebug() << "PASS: Settings round trip";
    }
    return success;
}

/**
 * @brief Run all LayoutPolicy tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running LayoutPolicy Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testSingleGeometry();
    qDebug() << "";

    allPass &= testStackedGeometry();
    qDebug() << "";

    allPass &= testPagingAndSlots();
    qDebug() << "";

    allPass &= testLayoutNames();
    qDebug() << "";

    allPass &= testSettingsRoundTrip();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace LayoutPolicyTests
