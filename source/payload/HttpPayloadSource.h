#pragma once

// ============================================================================
// HttpPayloadSource - Downloads a web page as the payload
// ============================================================================
// The page is fetched with QNetworkAccessManager (redirects followed,
// bounded transfer timeout). Its <img> elements are then replaced by data
// URIs through HtmlImageInliner so the archived page is self-contained.
//
// fetch() runs a local event loop and must be called from a thread with a
// QCoreApplication instance.
// ============================================================================

#include "PayloadSource.h"

class QNetworkAccessManager;

class HttpPayloadSource : public PayloadSource {
public:
    /// Default page transfer timeout.
    static constexpr int DEFAULT_TIMEOUT_MS = 10000;

    /// Default per-image transfer timeout.
    static constexpr int DEFAULT_IMAGE_TIMEOUT_MS = 5000;

    explicit HttpPayloadSource(int timeoutMs = DEFAULT_TIMEOUT_MS,
                               int imageTimeoutMs = DEFAULT_IMAGE_TIMEOUT_MS);

    FetchResult fetch(const QString& locator) override;

    /**
     * @brief Blocking GET of a single URL.
     *
     * Fails with PaperError::Fetch on network errors, timeouts and HTTP
     * status codes of 400 and above.
     */
    static FetchResult get(QNetworkAccessManager& manager, const QUrl& url, int timeoutMs);

private:
    int m_timeoutMs;
    int m_imageTimeoutMs;
};
