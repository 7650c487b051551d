#ifndef PAPERSETTINGS_H
#define PAPERSETTINGS_H

/**
 * @file PaperSettings.h
 * @brief Persistent run defaults for the qrpaper command.
 *
 * Defaults are read from QSettings (organization "QrPaper", application
 * "qrpaper") and can be overridden per run on the command line.
 *
 * Keys:
 * - encode/layout        "single" or "stacked"
 * - encode/dpi           composition DPI
 * - encode/threads       QR render workers
 * - encode/infoPage      prepend the information page
 * - encode/indexed       prefix chunks with an index frame
 * - fetch/timeoutMs      page download timeout
 * - fetch/imageTimeoutMs per-image download timeout
 */

#include "../layout/LayoutPolicy.h"

class QSettings;

struct PaperSettings {
    LayoutKind layout = LayoutKind::Single;
    int dpi = 300;
    int threads = 1;
    bool infoPage = true;
    bool indexed = false;
    int fetchTimeoutMs = 10000;
    int imageTimeoutMs = 5000;

    /**
     * @brief Load from the application's QSettings.
     *
     * Missing or invalid entries keep their default value; invalid ones
     * are logged.
     */
    static PaperSettings load();

    /// Load from an explicit settings object (used by tests).
    static PaperSettings load(QSettings& settings);

    /// Write every value back.
    void save(QSettings& settings) const;
};

#endif // PAPERSETTINGS_H
