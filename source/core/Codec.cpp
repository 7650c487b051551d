#include "Codec.h"

#include <QDebug>

#include <miniz.h>

#include <cstring>

/**
 * @file Codec.cpp
 * @brief Implementation of the payload transforms.
 *
 * @see Codec.h for API documentation
 */

QString paperErrorName(PaperError error)
{
    switch (error) {
        case PaperError::None:               return QStringLiteral("none");
        case PaperError::InvalidArgument:    return QStringLiteral("invalid_argument");
        case PaperError::Fetch:              return QStringLiteral("fetch");
        case PaperError::Io:                 return QStringLiteral("io");
        case PaperError::CorruptStream:      return QStringLiteral("corrupt_stream");
        case PaperError::InvalidEncoding:    return QStringLiteral("invalid_encoding");
        case PaperError::Render:             return QStringLiteral("render");
        case PaperError::SymbolNotFound:     return QStringLiteral("symbol_not_found");
        case PaperError::MissingChunk:       return QStringLiteral("missing_chunk");
        case PaperError::Reconstruction:     return QStringLiteral("reconstruction");
        case PaperError::ResolutionMismatch: return QStringLiteral("resolution_mismatch");
        case PaperError::Cancelled:          return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

namespace Codec {

static CodecResult failure(PaperError error, const QString& message)
{
    CodecResult result;
    result.error = error;
    result.errorMessage = message;
    return result;
}

// =============================================================================
// Compression
// =============================================================================

CodecResult compress(const QByteArray& payload)
{
    mz_ulong bound = mz_compressBound(static_cast<mz_ulong>(payload.size()));
    QByteArray out(static_cast<qsizetype>(bound), Qt::Uninitialized);
    mz_ulong outLen = bound;

    int status = mz_compress2(reinterpret_cast<unsigned char*>(out.data()), &outLen,
                              reinterpret_cast<const unsigned char*>(payload.constData()),
                              static_cast<mz_ulong>(payload.size()),
                              MZ_DEFAULT_COMPRESSION);
    if (status != MZ_OK) {
        qWarning() << "[Codec] mz_compress2 failed:" << mz_error(status);
        return failure(PaperError::CorruptStream,
                       QStringLiteral("Compression failed: %1").arg(QString::fromLatin1(mz_error(status))));
    }

    out.truncate(static_cast<qsizetype>(outLen));

    qDebug() << "[Codec] Compressed" << payload.size() << "->" << out.size() << "bytes";

    CodecResult result;
    result.success = true;
    result.data = out;
    return result;
}

CodecResult decompress(const QByteArray& blob)
{
    if (blob.isEmpty()) {
        return failure(PaperError::CorruptStream, QStringLiteral("Compressed stream is empty"));
    }

    mz_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    if (mz_inflateInit(&stream) != MZ_OK) {
        return failure(PaperError::CorruptStream, QStringLiteral("Failed to initialize inflater"));
    }

    stream.next_in = reinterpret_cast<const unsigned char*>(blob.constData());
    stream.avail_in = static_cast<unsigned int>(blob.size());

    QByteArray out;
    unsigned char buffer[16384];
    int status = MZ_OK;

    for (;;) {
        stream.next_out = buffer;
        stream.avail_out = sizeof(buffer);

        status = mz_inflate(&stream, MZ_NO_FLUSH);
        out.append(reinterpret_cast<const char*>(buffer),
                   static_cast<qsizetype>(sizeof(buffer) - stream.avail_out));

        if (status == MZ_STREAM_END) {
            break;
        }
        if (status != MZ_OK) {
            break;
        }
        // No more input but the stream has not ended: truncated
        if (stream.avail_in == 0 && stream.avail_out != 0) {
            status = MZ_BUF_ERROR;
            break;
        }
    }

    unsigned int trailing = stream.avail_in;
    mz_inflateEnd(&stream);

    if (status != MZ_STREAM_END) {
        qWarning() << "[Codec] Inflate failed:" << mz_error(status);
        return failure(PaperError::CorruptStream,
                       QStringLiteral("Invalid compressed stream (%1)")
                           .arg(QString::fromLatin1(mz_error(status))));
    }

    if (trailing > 0) {
        qWarning() << "[Codec] Inflate left" << trailing << "trailing bytes";
        return failure(PaperError::CorruptStream,
                       QStringLiteral("Compressed stream has %1 trailing bytes").arg(trailing));
    }

    CodecResult result;
    result.success = true;
    result.data = out;
    return result;
}

// =============================================================================
// Text Encoding
// =============================================================================

QByteArray encodeText(const QByteArray& bytes)
{
    return bytes.toBase64(QByteArray::Base64Encoding);
}

CodecResult decodeText(const QByteArray& text)
{
    if (text.size() % 4 != 0) {
        return failure(PaperError::InvalidEncoding,
                       QStringLiteral("Encoded text length %1 is not a multiple of 4").arg(text.size()));
    }

    QByteArray::FromBase64Result decoded = QByteArray::fromBase64Encoding(
        text, QByteArray::Base64Encoding | QByteArray::AbortOnBase64DecodingErrors);

    if (decoded.decodingStatus != QByteArray::Base64DecodingStatus::Ok) {
        QString reason = decoded.decodingStatus == QByteArray::Base64DecodingStatus::IllegalPadding
                       ? QStringLiteral("invalid padding")
                       : QStringLiteral("character outside the base64 alphabet");
        qWarning() << "[Codec] Base64 decoding failed:" << reason;
        return failure(PaperError::InvalidEncoding,
                       QStringLiteral("Invalid encoded text: %1").arg(reason));
    }

    CodecResult result;
    result.success = true;
    result.data = decoded.decoded;
    return result;
}

// =============================================================================
// Chunking
// =============================================================================

QVector<Chunk> chunk(const QByteArray& text, int size)
{
    QVector<Chunk> chunks;

    if (size <= 0) {
        qWarning() << "[Codec] Invalid chunk size" << size;
        return chunks;
    }
    if (text.isEmpty()) {
        qWarning() << "[Codec] Encoded text is empty, no chunks produced";
        return chunks;
    }

    chunks.reserve(static_cast<int>((text.size() + size - 1) / size));
    for (qsizetype offset = 0; offset < text.size(); offset += size) {
        Chunk c;
        c.index = static_cast<int>(chunks.size());
        c.data = text.mid(offset, size);
        chunks.append(c);
    }

    return chunks;
}

QByteArray frameChunk(const Chunk& chunk)
{
    QByteArray framed = QByteArray::number(chunk.index).rightJustified(FRAME_INDEX_DIGITS, '0');
    framed.append(':');
    framed.append(chunk.data);
    return framed;
}

bool parseFrame(const QByteArray& symbolText, int* index, QByteArray* data)
{
    int colon = symbolText.indexOf(':');
    // More than 9 digits would overflow int
    if (colon <= 0 || colon > 9) {
        return false;
    }

    for (int i = 0; i < colon; ++i) {
        char c = symbolText.at(i);
        if (c < '0' || c > '9') {
            return false;
        }
    }

    bool ok = false;
    int parsed = symbolText.left(colon).toInt(&ok);
    if (!ok) {
        return false;
    }

    if (index) *index = parsed;
    if (data) *data = symbolText.mid(colon + 1);
    return true;
}

} // namespace Codec
