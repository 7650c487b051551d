// ============================================================================
// HttpPayloadSource - Downloads a web page as the payload
// ============================================================================

#include "HttpPayloadSource.h"
#include "HtmlImageInliner.h"

#include <QDebug>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

HttpPayloadSource::HttpPayloadSource(int timeoutMs, int imageTimeoutMs)
    : m_timeoutMs(timeoutMs)
    , m_imageTimeoutMs(imageTimeoutMs)
{
}

FetchResult HttpPayloadSource::fetch(const QString& locator)
{
    QNetworkAccessManager manager;

    FetchResult page = get(manager, QUrl(locator), m_timeoutMs);
    if (!page.success) {
        return page;
    }

    qDebug() << "[HttpPayloadSource] Fetched" << page.data.size() << "bytes from"
             << page.finalUrl.toString() << "(" << page.contentType << ")";

    const int imageTimeout = m_imageTimeoutMs;
    HtmlImageInliner::Fetcher fetcher = [&manager, imageTimeout](const QUrl& url) {
        return get(manager, url, imageTimeout);
    };

    HtmlImageInliner::Stats stats;
    page.data = HtmlImageInliner::process(page.data, page.finalUrl, fetcher, &stats);

    qDebug() << "[HttpPayloadSource] Inlined" << stats.inlined << "images,"
             << stats.passedThrough << "passed through," << stats.removed << "removed";
    return page;
}

FetchResult HttpPayloadSource::get(QNetworkAccessManager& manager, const QUrl& url, int timeoutMs)
{
    FetchResult result;
    result.finalUrl = url;

    if (!url.isValid()) {
        result.error = PaperError::Fetch;
        result.errorMessage = QStringLiteral("Invalid URL: %1").arg(url.toString());
        qWarning() << "[HttpPayloadSource]" << result.errorMessage;
        return result;
    }

    QNetworkRequest request(url);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("qrpaper/1.0"));
    if (timeoutMs > 0) {
        request.setTransferTimeout(timeoutMs);
    }

    QNetworkReply* reply = manager.get(request);

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.finalUrl = reply->url();
    result.contentType = reply->header(QNetworkRequest::ContentTypeHeader).toString();

    if (reply->error() != QNetworkReply::NoError) {
        result.error = PaperError::Fetch;
        result.errorMessage = QStringLiteral("Fetching %1 failed: %2").arg(url.toString(), reply->errorString());
        qWarning() << "[HttpPayloadSource]" << result.errorMessage;
    } else if (status >= 400) {
        result.error = PaperError::Fetch;
        result.errorMessage = QStringLiteral("Fetching %1 failed: HTTP %2").arg(url.toString()).arg(status);
        qWarning() << "[HttpPayloadSource]" << result.errorMessage;
    } else {
        result.data = reply->readAll();
        result.success = true;
    }

    reply->deleteLater();
    return result;
}
