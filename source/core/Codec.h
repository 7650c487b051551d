#ifndef CODEC_H
#define CODEC_H

/**
 * @file Codec.h
 * @brief Byte-level transforms between a payload and its printable chunks.
 *
 * The wire format is exactly base64(zlib(payload)), cut into fixed-size
 * pieces. Each function here is a pure transform; the inverse functions
 * report failures through CodecResult instead of throwing.
 *
 * Encode direction:
 * @code
 *   CodecResult packed = Codec::compress(payload);
 *   QByteArray text = Codec::encodeText(packed.data);
 *   QVector<Chunk> chunks = Codec::chunk(text, Codec::DEFAULT_CHUNK_SIZE);
 * @endcode
 */

#include "PaperTypes.h"

#include <QByteArray>
#include <QVector>

namespace Codec {

/// Chunk size used by the single-symbol page layout.
constexpr int DEFAULT_CHUNK_SIZE = 1000;

/// Chunk size used by the stacked page layout.
constexpr int STACKED_CHUNK_SIZE = 800;

/// Byte capacity of a version 40 symbol at error-correction level H.
constexpr int MAX_SYMBOL_BYTES = 1273;

/// Width of the decimal index in an index frame.
constexpr int FRAME_INDEX_DIGITS = 6;

/**
 * @brief Result of a fallible transform.
 */
struct CodecResult {
    bool success = false;
    PaperError error = PaperError::None;
    QString errorMessage;
    QByteArray data;            ///< Transform output (valid when success)
};

/**
 * @brief Deflate a payload into a zlib-format stream (default level).
 */
CodecResult compress(const QByteArray& payload);

/**
 * @brief Inflate a zlib-format stream.
 *
 * The stream must be complete: a bad header, a bad Adler-32 checksum, a
 * truncated stream or trailing bytes after the end of the stream all fail
 * with PaperError::CorruptStream.
 */
CodecResult decompress(const QByteArray& blob);

/**
 * @brief Standard base64 with '=' padding.
 */
QByteArray encodeText(const QByteArray& bytes);

/**
 * @brief Strict base64 decoding.
 *
 * Any character outside the standard alphabet, misplaced padding or a
 * length that is not a multiple of four fails with
 * PaperError::InvalidEncoding.
 */
CodecResult decodeText(const QByteArray& text);

/**
 * @brief Cut text into consecutive pieces of at most size characters.
 *
 * Every chunk except the last has exactly size characters. Empty text or a
 * non-positive size yields no chunks.
 */
QVector<Chunk> chunk(const QByteArray& text, int size);

/**
 * @brief Prefix chunk data with its index ("000042:data").
 */
QByteArray frameChunk(const Chunk& chunk);

/**
 * @brief Split an index frame back into index and data.
 * @return false if symbolText does not start with digits followed by ':'
 */
bool parseFrame(const QByteArray& symbolText, int* index, QByteArray* data);

} // namespace Codec

#endif // CODEC_H
