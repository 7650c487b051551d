#pragma once

// ============================================================================
// PaperTypes - Shared value types for the QrPaper codec
// ============================================================================
// Plain data structs passed between the encode and decode stages.
// Nothing in here owns a library handle; every stage can include it.
// ============================================================================

#include <QString>
#include <QByteArray>
#include <QVector>

#include <functional>

/**
 * @brief Error kinds reported by the codec stages.
 *
 * Carried inside the result structs of each stage together with a
 * human-readable message. None means the operation succeeded.
 */
enum class PaperError {
    None,               ///< No error
    InvalidArgument,    ///< Bad option or parameter
    Fetch,              ///< Payload could not be obtained (network, timeout, file)
    Io,                 ///< Reading or writing a local file failed
    CorruptStream,      ///< Compressed stream is not a valid zlib stream
    InvalidEncoding,    ///< Text contains characters outside the base64 alphabet
    Render,             ///< A chunk could not be turned into a QR symbol
    SymbolNotFound,     ///< No QR symbol could be decoded on a page
    MissingChunk,       ///< Reassembly found a gap in the chunk positions
    Reconstruction,     ///< Inverse transform failed (see cause)
    ResolutionMismatch, ///< Scan DPI differs from the composition DPI
    Cancelled           ///< Interrupted by the user
};

/**
 * @brief Stable lowercase name for an error kind (used in logs and JSON output).
 */
QString paperErrorName(PaperError error);

/**
 * @brief One contiguous piece of the encoded text.
 *
 * Chunks cover the encoded text exactly once. The index is the chunk's
 * 0-based position; in the default protocol it is never written into the
 * symbol and is recovered from page order and slot instead.
 */
struct Chunk {
    int index = 0;      ///< 0-based position in the encoded text
    QByteArray data;    ///< Base64 characters (ASCII)

    bool operator==(const Chunk& other) const {
        return index == other.index && data == other.data;
    }
};

/**
 * @brief Chunk text recovered from a scanned page.
 */
struct RecoveredSymbol {
    int position = -1;      ///< Recovered chunk index
    int pageNumber = 0;     ///< 1-based page number in the scanned document
    int slot = -1;          ///< Slot on the page the symbol was found in
    QByteArray text;        ///< Decoded chunk text
};

/**
 * @brief Size bookkeeping printed on the information page.
 */
struct DocumentStats {
    qint64 originalSize = 0;    ///< Payload bytes
    qint64 compressedSize = 0;  ///< Bytes after deflate
    qint64 encodedSize = 0;     ///< Characters after base64
    int chunkCount = 0;         ///< Number of QR symbols
};

/**
 * @brief Progress callback shared by long-running stages.
 * @param current 1-based item being processed
 * @param total Total item count
 * @param status Short description of the current step
 */
using PaperProgressCallback = std::function<void(int current, int total, const QString& status)>;
