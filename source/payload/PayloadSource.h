#pragma once

// ============================================================================
// PayloadSource - Where the bytes to archive come from
// ============================================================================
// A payload source turns a locator (file path or URL) into the raw bytes
// that get compressed and printed. Sources are selected once per run:
// - FilePayloadSource: reads a local file as-is
// - HttpPayloadSource: downloads a page and inlines its images
// ============================================================================

#include "../core/PaperTypes.h"

#include <QByteArray>
#include <QString>
#include <QUrl>

#include <memory>

/**
 * @brief Result of fetching a payload or one of its resources.
 */
struct FetchResult {
    bool success = false;
    PaperError error = PaperError::None;
    QString errorMessage;
    QByteArray data;            ///< Fetched bytes (valid when success)
    QString contentType;        ///< MIME type if known (HTTP only)
    QUrl finalUrl;              ///< Locator after redirects
};

/**
 * @brief Abstract payload source.
 */
class PayloadSource {
public:
    virtual ~PayloadSource() = default;

    /**
     * @brief Fetch the payload named by locator.
     * @return FetchResult; error is PaperError::Fetch on any failure
     */
    virtual FetchResult fetch(const QString& locator) = 0;

    /**
     * @brief Pick a source for a locator.
     *
     * Locators with an http or https scheme go to HttpPayloadSource
     * unless forceFile is set; everything else is read as a local file.
     *
     * @param locator File path or URL
     * @param forceFile Treat the locator as a path even if it looks like a URL
     * @param timeoutMs Page transfer timeout (HTTP only)
     * @param imageTimeoutMs Per-image transfer timeout (HTTP only)
     */
    static std::unique_ptr<PayloadSource> create(const QString& locator, bool forceFile,
                                                 int timeoutMs, int imageTimeoutMs);

    /// True if locator has an http or https scheme.
    static bool isUrl(const QString& locator);
};

/**
 * @brief Reads a local file.
 */
class FilePayloadSource : public PayloadSource {
public:
    FetchResult fetch(const QString& locator) override;
};
