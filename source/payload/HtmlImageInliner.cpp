#include "HtmlImageInliner.h"

#include <QBuffer>
#include <QDebug>
#include <QImage>
#include <QPainter>
#include <QRegularExpression>

namespace HtmlImageInliner {

static const QByteArray DOCTYPE = QByteArrayLiteral("<!DOCTYPE html>\n");

QByteArray downscaleImage(const QByteArray& imageData, QByteArray* mimeType)
{
    QImage image = QImage::fromData(imageData);
    if (image.isNull()) {
        *mimeType = QByteArrayLiteral("image/png");
        return imageData;
    }

    if (image.width() > MAX_IMAGE_WIDTH) {
        image = image.scaledToWidth(MAX_IMAGE_WIDTH, Qt::SmoothTransformation);
    }

    // JPEG has no alpha: flatten onto white
    QImage flat(image.size(), QImage::Format_RGB32);
    flat.fill(Qt::white);
    {
        QPainter painter(&flat);
        painter.drawImage(0, 0, image);
    }

    QByteArray jpeg;
    QBuffer buffer(&jpeg);
    buffer.open(QIODevice::WriteOnly);
    if (!flat.save(&buffer, "JPEG", JPEG_QUALITY)) {
        qWarning() << "[HtmlImageInliner] JPEG encoding failed, embedding original bytes";
        *mimeType = QByteArrayLiteral("image/png");
        return imageData;
    }

    *mimeType = QByteArrayLiteral("image/jpeg");
    return jpeg;
}

QByteArray process(const QByteArray& html, const QUrl& baseUrl, const Fetcher& fetcher, Stats* stats)
{
    static const QRegularExpression imgTag(
        QStringLiteral("<img\\b[^>]*>"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression srcAttr(
        QStringLiteral("(?<![\\w-])src\\s*=\\s*(?:\"([^\"]*)\"|'([^']*)'|([^\\s>]+))"),
        QRegularExpression::CaseInsensitiveOption);

    Stats counters;
    const QString page = QString::fromUtf8(html);
    QString out;
    out.reserve(page.size());

    qsizetype last = 0;
    QRegularExpressionMatchIterator it = imgTag.globalMatch(page);
    while (it.hasNext()) {
        const QRegularExpressionMatch tagMatch = it.next();
        out += page.mid(last, tagMatch.capturedStart() - last);
        last = tagMatch.capturedEnd();

        const QString tag = tagMatch.captured(0);
        const QRegularExpressionMatch srcMatch = srcAttr.match(tag);

        QString src;
        int group = 0;
        for (int g = 1; g <= 3; ++g) {
            if (srcMatch.hasMatch() && srcMatch.capturedStart(g) >= 0) {
                src = srcMatch.captured(g);
                group = g;
                break;
            }
        }

        if (src.trimmed().isEmpty() || src.startsWith(QLatin1String("data:"), Qt::CaseInsensitive)) {
            counters.skipped++;
            out += tag;
            continue;
        }

        QString decodedSrc = src.trimmed();
        decodedSrc.replace(QLatin1String("&amp;"), QLatin1String("&"));
        const QUrl imageUrl = baseUrl.resolved(QUrl(decodedSrc));

        const FetchResult image = fetcher ? fetcher(imageUrl) : FetchResult();
        if (!image.success) {
            qWarning() << "[HtmlImageInliner] Removing image" << imageUrl.toString() << "-" << image.errorMessage;
            counters.removed++;
            continue;
        }

        QByteArray mimeType;
        const QByteArray encoded = downscaleImage(image.data, &mimeType);
        if (mimeType == "image/jpeg") {
            counters.inlined++;
        } else {
            counters.passedThrough++;
        }

        const QString dataUri = QStringLiteral("data:%1;base64,%2")
            .arg(QString::fromLatin1(mimeType), QString::fromLatin1(encoded.toBase64()));

        // Replace only the attribute value; quote unquoted values
        const qsizetype valueStart = srcMatch.capturedStart(group);
        const qsizetype valueLength = srcMatch.capturedLength(group);
        QString rewritten = tag;
        rewritten.replace(valueStart, valueLength,
                          group == 3 ? QStringLiteral("\"%1\"").arg(dataUri) : dataUri);
        out += rewritten;
    }
    out += page.mid(last);

    if (stats) {
        *stats = counters;
    }

    return DOCTYPE + out.toUtf8();
}

} // namespace HtmlImageInliner
