#ifndef HTMLIMAGEINLINER_H
#define HTMLIMAGEINLINER_H

/**
 * @file HtmlImageInliner.h
 * @brief Makes an HTML page self-contained by embedding its images.
 *
 * Every <img> element with a src attribute is resolved against the page
 * URL, fetched, shrunk and re-encoded, and its src is replaced by a data
 * URI. Images are cut down hard because every byte ends up printed:
 * - Width limited to MAX_IMAGE_WIDTH pixels, aspect ratio kept
 * - Re-encoded as JPEG at JPEG_QUALITY
 * - Bytes Qt cannot decode are embedded unchanged as image/png
 * - Elements whose image cannot be fetched are removed
 *
 * The result always starts with an HTML5 doctype.
 */

#include "PayloadSource.h"

#include <QByteArray>
#include <QUrl>

#include <functional>

namespace HtmlImageInliner {

/// Maximum width of an embedded image in pixels.
constexpr int MAX_IMAGE_WIDTH = 300;

/// JPEG quality of re-encoded images.
constexpr int JPEG_QUALITY = 40;

/// Fetches one image URL.
using Fetcher = std::function<FetchResult(const QUrl& url)>;

/**
 * @brief Counters for one pass over a page.
 */
struct Stats {
    int inlined = 0;        ///< Images re-encoded as JPEG
    int passedThrough = 0;  ///< Images embedded unchanged
    int removed = 0;        ///< Elements dropped because the fetch failed
    int skipped = 0;        ///< Elements left alone (no src, already a data URI)
};

/**
 * @brief Inline every image of an HTML page.
 *
 * @param html Page source (UTF-8)
 * @param baseUrl URL the page was loaded from, for relative src values
 * @param fetcher Called once per image to inline
 * @param stats Receives the counters (may be null)
 * @return Page with data URIs, prefixed with "<!DOCTYPE html>\n"
 */
QByteArray process(const QByteArray& html, const QUrl& baseUrl, const Fetcher& fetcher,
                   Stats* stats = nullptr);

/**
 * @brief Shrink and re-encode one image.
 *
 * @param imageData Encoded image bytes as fetched
 * @param mimeType Receives "image/jpeg", or "image/png" when the bytes
 *        could not be decoded and are returned unchanged
 */
QByteArray downscaleImage(const QByteArray& imageData, QByteArray* mimeType);

} // namespace HtmlImageInliner

#endif // HTMLIMAGEINLINER_H
