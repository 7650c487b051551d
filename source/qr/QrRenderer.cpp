// ============================================================================
// QrRenderer - Turns chunk text into QR symbol images
// ============================================================================

#include "QrRenderer.h"

#include <QDebug>
#include <QFuture>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>

#include <qrencode.h>

#include <cerrno>
#include <functional>
#include <memory>

using QrCodePtr = std::unique_ptr<QRcode, std::function<void(QRcode*)>>;

static QrCodePtr encodeSymbol(const QByteArray& data)
{
    // Version 0 lets libqrencode pick the smallest version that fits
    return QrCodePtr(QRcode_encodeData(static_cast<int>(data.size()),
                                       reinterpret_cast<const unsigned char*>(data.constData()),
                                       0, QR_ECLEVEL_H),
                     QRcode_free);
}

int QrRenderer::moduleCount(const QByteArray& data)
{
    QrCodePtr code = encodeSymbol(data);
    return code ? code->width : 0;
}

QImage QrRenderer::render(const QByteArray& data, int pixelSize, QString* errorMessage)
{
    errno = 0;
    QrCodePtr code = encodeSymbol(data);
    if (!code) {
        QString reason = (errno == ERANGE)
            ? QStringLiteral("%1 bytes exceed the capacity of a level H symbol").arg(data.size())
            : QStringLiteral("libqrencode failed (errno %1)").arg(errno);
        qWarning() << "[QrRenderer]" << reason;
        if (errorMessage) *errorMessage = reason;
        return QImage();
    }

    const int width = code->width;
    const int modules = width + 2 * QUIET_ZONE_MODULES;

    if (pixelSize < modules) {
        QString reason = QStringLiteral("Symbol needs %1 modules but only %2 pixels are available")
                             .arg(modules).arg(pixelSize);
        qWarning() << "[QrRenderer]" << reason;
        if (errorMessage) *errorMessage = reason;
        return QImage();
    }

    // One pixel per module, quiet zone included
    QImage moduleImage(modules, modules, QImage::Format_Grayscale8);
    moduleImage.fill(255);

    for (int y = 0; y < width; ++y) {
        uchar* line = moduleImage.scanLine(y + QUIET_ZONE_MODULES);
        const unsigned char* row = code->data + y * width;
        for (int x = 0; x < width; ++x) {
            // Bit 0 is the module color (1 = dark)
            if (row[x] & 0x01) {
                line[x + QUIET_ZONE_MODULES] = 0;
            }
        }
    }

    return moduleImage.scaled(pixelSize, pixelSize, Qt::IgnoreAspectRatio, Qt::FastTransformation);
}

QrRenderer::BatchResult QrRenderer::renderAll(const QVector<QByteArray>& texts, int pixelSize,
                                              int parallelism, const PaperProgressCallback& progress,
                                              std::atomic<bool>* cancelled)
{
    BatchResult result;
    const int total = static_cast<int>(texts.size());

    result.images.resize(total);
    QVector<QString> errors(total);

    // Raw slot pointers: detach once up front so workers never trigger a copy
    QImage* imageSlots = result.images.data();
    QString* errorSlots = errors.data();

    if (parallelism <= 1) {
        for (int i = 0; i < total; ++i) {
            if (cancelled && cancelled->load()) {
                break;
            }
            imageSlots[i] = render(texts[i], pixelSize, &errorSlots[i]);
            if (progress) {
                progress(i + 1, total, QStringLiteral("Rendered QR %1/%2").arg(i + 1).arg(total));
            }
        }
    } else {
        QThreadPool pool;
        pool.setMaxThreadCount(parallelism);

        qDebug() << "[QrRenderer] Rendering" << total << "symbols with" << parallelism << "workers";

        QVector<QFuture<void>> futures;
        futures.reserve(total);
        for (int i = 0; i < total; ++i) {
            futures.append(QtConcurrent::run(&pool, [&texts, imageSlots, errorSlots, pixelSize, cancelled, i]() {
                if (cancelled && cancelled->load()) {
                    return;
                }
                imageSlots[i] = render(texts[i], pixelSize, &errorSlots[i]);
            }));
        }

        for (int i = 0; i < total; ++i) {
            futures[i].waitForFinished();
            if (progress) {
                progress(i + 1, total, QStringLiteral("Rendered QR %1/%2").arg(i + 1).arg(total));
            }
        }
        pool.waitForDone();
    }

    if (cancelled && cancelled->load()) {
        result.error = PaperError::Cancelled;
        result.errorMessage = QStringLiteral("Rendering cancelled");
        result.images.clear();
        return result;
    }

    for (int i = 0; i < total; ++i) {
        if (result.images[i].isNull()) {
            result.error = PaperError::Render;
            result.failedIndex = i;
            result.errorMessage = QStringLiteral("Failed to render chunk %1: %2").arg(i).arg(errors[i]);
            result.images.clear();
            return result;
        }
    }

    result.success = true;
    return result;
}
