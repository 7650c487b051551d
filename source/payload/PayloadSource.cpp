// ============================================================================
// PayloadSource - Where the bytes to archive come from
// ============================================================================

#include "PayloadSource.h"
#include "HttpPayloadSource.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>

std::unique_ptr<PayloadSource> PayloadSource::create(const QString& locator, bool forceFile,
                                                     int timeoutMs, int imageTimeoutMs)
{
    if (!forceFile && isUrl(locator)) {
        return std::make_unique<HttpPayloadSource>(timeoutMs, imageTimeoutMs);
    }
    return std::make_unique<FilePayloadSource>();
}

bool PayloadSource::isUrl(const QString& locator)
{
    const QUrl url(locator);
    const QString scheme = url.scheme().toLower();
    return url.isValid() && (scheme == QLatin1String("http") || scheme == QLatin1String("https"));
}

// ============================================================================
// FilePayloadSource
// ============================================================================

FetchResult FilePayloadSource::fetch(const QString& locator)
{
    FetchResult result;
    result.finalUrl = QUrl::fromLocalFile(QFileInfo(locator).absoluteFilePath());

    QFile file(locator);
    if (!file.open(QIODevice::ReadOnly)) {
        result.error = PaperError::Fetch;
        result.errorMessage = QStringLiteral("Cannot read %1: %2").arg(locator, file.errorString());
        qWarning() << "[FilePayloadSource]" << result.errorMessage;
        return result;
    }

    result.data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        result.error = PaperError::Fetch;
        result.errorMessage = QStringLiteral("Read error on %1: %2").arg(locator, file.errorString());
        qWarning() << "[FilePayloadSource]" << result.errorMessage;
        result.data.clear();
        return result;
    }

    result.success = true;
    qDebug() << "[FilePayloadSource] Read" << result.data.size() << "bytes from" << locator;
    return result;
}
