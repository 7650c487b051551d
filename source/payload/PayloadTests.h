#pragma once

// ============================================================================
// PayloadTests - Unit tests for payload sources and image inlining
// ============================================================================
// HTTP is not exercised; the inliner is driven with an in-memory fetcher.
// ============================================================================

#include "PayloadSource.h"
#include "HtmlImageInliner.h"

#include <QBuffer>
#include <QColor>
#include <QDebug>
#include <QFile>
#include <QImage>
#include <QMap>
#include <QTemporaryDir>

namespace PayloadTests {

inline QByteArray pngBytes(int width, int height, QColor color)
{
    QImage image(width, height, QImage::Format_ARGB32);
    image.fill(color);
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    image.save(&buffer, "PNG");
    return bytes;
}

// Serves fixed responses and records every request
struct FakeFetcher {
    QMap<QString, QByteArray> responses;
    QStringList requested;

    HtmlImageInliner::Fetcher fetcher()
    {
        return [this](const QUrl& url) {
            requested.append(url.toString());
            FetchResult result;
            if (responses.contains(url.toString())) {
                result.success = true;
                result.data = responses.value(url.toString());
            } else {
                result.error = PaperError::Fetch;
                result.errorMessage = QStringLiteral("404");
            }
            return result;
        };
    }
};

inline QByteArray dataUriPayload(const QByteArray& html, const QByteArray& prefix)
{
    const int start = html.indexOf(prefix);
    if (start < 0) {
        return QByteArray();
    }
    const int from = start + prefix.size();
    const int end = html.indexOf('"', from);
    return QByteArray::fromBase64(html.mid(from, end - from));
}

inline bool testFileSource()
{
    qDebug() << "=== Test: File Source ===";
    bool success = true;

    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("payload.bin"));
    const QByteArray content("binary\0payload", 14);
    {
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly) || file.write(content) != content.size()) {
            qDebug() << "FAIL: cannot write fixture";
            return false;
        }
    }

    std::unique_ptr<PayloadSource> source = PayloadSource::create(path, false, 1000, 1000);
    FetchResult result = source->fetch(path);
    if (!result.success || result.data != content) {
        qDebug() << "FAIL: file not read:" << result.errorMessage;
        success = false;
    }

    result = source->fetch(dir.filePath(QStringLiteral("missing.bin")));
    if (result.success || result.error != PaperError::Fetch || result.errorMessage.isEmpty()) {
        qDebug() << "FAIL: missing file did not report Fetch";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: File source";
    }
    return success;
}

inline bool testUrlDetection()
{
    qDebug() << "=== Test: URL Detection ===";
    bool success = true;

    if (!PayloadSource::isUrl(QStringLiteral("https://example.com/page"))
        || !PayloadSource::isUrl(QStringLiteral("HTTP://example.com"))) {
        qDebug() << "FAIL: http(s) URL not detected";
        success = false;
    }
    if (PayloadSource::isUrl(QStringLiteral("/tmp/file.txt"))
        || PayloadSource::isUrl(QStringLiteral("ftp://example.com/a"))
        || PayloadSource::isUrl(QStringLiteral("C:\\data\\file.bin"))) {
        qDebug() << "FAIL: non-HTTP locator treated as URL";
        success = false;
    }

    // forceFile keeps a URL-looking locator on the file path
    std::unique_ptr<PayloadSource> source =
        PayloadSource::create(QStringLiteral("https://example.com"), true, 1000, 1000);
    if (!dynamic_cast<FilePayloadSource*>(source.get())) {
        qDebug() << "FAIL: forceFile ignored";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: URL detection";
    }
    return success;
}

/**
 * @brief Images are fetched, shrunk, re-encoded and embedded.
 */
inline bool testInlineImages()
{
    qDebug() << "=== Test: Inline Images ===";
    bool success = true;

    FakeFetcher fake;
    fake.responses.insert(QStringLiteral("https://example.com/img/wide.png"),
                          pngBytes(900, 300, QColor(255, 0, 0, 128)));
    fake.responses.insert(QStringLiteral("https://example.com/small.png"),
                          pngBytes(40, 20, Qt::blue));

    const QByteArray html(
        "<html><body>"
        "<img src=\"img/wide.png\" alt=\"wide\">"
        "<IMG class=x SRC=/small.png>"
        "</body></html>");

    HtmlImageInliner::Stats stats;
    const QByteArray out = HtmlImageInliner::process(
        html, QUrl(QStringLiteral("https://example.com/index.html")), fake.fetcher(), &stats);

    if (!out.startsWith("<!DOCTYPE html>\n")) {
        qDebug() << "FAIL: doctype missing";
        success = false;
    }
    if (fake.requested != QStringList{QStringLiteral("https://example.com/img/wide.png"),
                                      QStringLiteral("https://example.com/small.png")}) {
        qDebug() << "FAIL: relative sources not resolved" << fake.requested;
        success = false;
    }
    if (stats.inlined != 2 || out.count("data:image/jpeg;base64,") != 2) {
        qDebug() << "FAIL: expected 2 JPEG data URIs, stats" << stats.inlined;
        success = false;
    }
    if (out.contains("img/wide.png") || out.contains("/small.png")) {
        qDebug() << "FAIL: original source left in place";
        success = false;
    }
    if (!out.contains("alt=\"wide\"") || !out.contains("class=x")) {
        qDebug() << "FAIL: other attributes not preserved";
        success = false;
    }

    const QImage wide = QImage::fromData(dataUriPayload(out, "data:image/jpeg;base64,"));
    if (wide.width() != HtmlImageInliner::MAX_IMAGE_WIDTH || wide.height() != 100) {
        qDebug() << "FAIL: wide image not downscaled, got" << wide.size();
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Images inlined";
    }
    return success;
}

/**
 * @brief Failed fetches drop the element; unreadable bytes pass through.
 */
inline bool testInlineFallbacks()
{
    qDebug() << "=== Test: Inline Fallbacks ===";
    bool success = true;

    FakeFetcher fake;
    fake.responses.insert(QStringLiteral("https://example.com/blob"), QByteArray("not an image"));

    const QByteArray html(
        "<p>a</p><img src=\"https://example.com/gone.png\"><p>b</p>"
        "<img src='blob'>"
        "<img src=\"data:image/gif;base64,R0lGOD==\">"
        "<img alt=\"no source\">");

    HtmlImageInliner::Stats stats;
    const QByteArray out = HtmlImageInliner::process(
        html, QUrl(QStringLiteral("https://example.com/")), fake.fetcher(), &stats);

    if (out.contains("gone.png") || !out.contains("<p>a</p><p>b</p>")) {
        qDebug() << "FAIL: failed image not removed";
        success = false;
    }
    if (stats.removed != 1 || stats.passedThrough != 1 || stats.skipped != 2) {
        qDebug() << "FAIL: stats" << stats.removed << stats.passedThrough << stats.skipped;
        success = false;
    }
    QByteArray requoted = out;
    requoted.replace('\'', '"');
    if (dataUriPayload(requoted, "data:image/png;base64,") != QByteArray("not an image")) {
        qDebug() << "FAIL: undecodable bytes not passed through";
        success = false;
    }
    if (!out.contains("data:image/gif;base64,R0lGOD==") || !out.contains("<img alt=\"no source\">")) {
        qDebug() << "FAIL: existing data URI or source-less image altered";
        success = false;
    }
    if (fake.requested.size() != 2) {
        qDebug() << "FAIL: unexpected fetches" << fake.requested;
        success = false;
    }

    // Only the exact src attribute counts; data-src and friends stay as they are
    FakeFetcher lazy;
    lazy.responses.insert(QStringLiteral("https://example.com/placeholder.png"), pngBytes(10, 10, Qt::green));
    const QByteArray lazyOut = HtmlImageInliner::process(
        QByteArray("<img data-src=\"lazy/real.png\" src=\"placeholder.png\">"),
        QUrl(QStringLiteral("https://example.com/")), lazy.fetcher());
    if (lazy.requested != QStringList{QStringLiteral("https://example.com/placeholder.png")}) {
        qDebug() << "FAIL: wrong attribute fetched" << lazy.requested;
        success = false;
    }
    if (!lazyOut.contains("data-src=\"lazy/real.png\"") || !lazyOut.contains(" src=\"data:image/jpeg;base64,")
        || lazyOut.contains("placeholder.png")) {
        qDebug() << "FAIL: src not rewritten next to data-src" << lazyOut.left(120);
        success = false;
    }

    // No images: only the doctype is added
    const QByteArray plain = HtmlImageInliner::process(QByteArray("<p>text</p>"), QUrl(), fake.fetcher());
    if (plain != QByteArray("<!DOCTYPE html>\n<p>text</p>")) {
        qDebug() << "FAIL: plain document altered" << plain;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Inline fallbacks";
    }
    return success;
}

/**
 * @brief Run all payload tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Payload Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testFileSource();
    qDebug() << "";

    allPass &= testUrlDetection();
    qDebug() << "";

    allPass &= testInlineImages();
    qDebug() << "";

    allPass &= testInlineFallbacks();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace PayloadTests
