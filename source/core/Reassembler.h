#ifndef REASSEMBLER_H
#define REASSEMBLER_H

/**
 * @file Reassembler.h
 * @brief Rebuilds the payload from recovered chunk text.
 *
 * Takes the symbols recovered by the document scanner, orders them by
 * position, checks that no position in [0, expectedCount) is missing and
 * applies the inverse transforms (base64 decode, then inflate).
 *
 * Nothing is written here; the caller only persists the payload when
 * ReassemblyResult::success is true.
 */

#include "PaperTypes.h"

#include <QVector>

namespace Reassembler {

/**
 * @brief Result of a reassembly attempt.
 *
 * For PaperError::Reconstruction, cause and causeMessage describe the
 * inner failure (InvalidEncoding or CorruptStream).
 */
struct ReassemblyResult {
    bool success = false;
    PaperError error = PaperError::None;
    QString errorMessage;

    PaperError cause = PaperError::None;    ///< Inner error for Reconstruction
    QString causeMessage;

    QVector<int> missingPositions;          ///< Gaps found (MissingChunk)
    int chunkCount = 0;                     ///< Distinct positions used
    QByteArray encodedText;                 ///< Concatenated chunk text
    QByteArray payload;                     ///< Reconstructed payload (valid when success)
};

/**
 * @brief Order, validate and invert the recovered chunks.
 *
 * @param recovered Symbols in any order
 * @param expectedCount Number of chunks the document holds, or -1 when
 *        unknown (then max position + 1 is used, so trailing gaps cannot
 *        be detected)
 */
ReassemblyResult reassemble(const QVector<RecoveredSymbol>& recovered, int expectedCount);

} // namespace Reassembler

#endif // REASSEMBLER_H
