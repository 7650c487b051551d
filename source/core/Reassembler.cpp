#include "Reassembler.h"
#include "Codec.h"

#include <QDebug>
#include <QMap>
#include <QStringList>

/**
 * @file Reassembler.cpp
 * @brief Implementation of chunk reassembly.
 *
 * @see Reassembler.h for API documentation
 */

namespace Reassembler {

static QString formatPositions(const QVector<int>& positions)
{
    QStringList parts;
    const int shown = qMin(20, static_cast<int>(positions.size()));
    for (int i = 0; i < shown; ++i) {
        parts << QString::number(positions[i]);
    }
    if (positions.size() > shown) {
        parts << QStringLiteral("... (%1 more)").arg(positions.size() - shown);
    }
    return parts.join(QStringLiteral(", "));
}

ReassemblyResult reassemble(const QVector<RecoveredSymbol>& recovered, int expectedCount)
{
    ReassemblyResult result;

    // QMap keeps keys sorted, which gives the position order directly
    QMap<int, QByteArray> byPosition;
    for (const RecoveredSymbol& symbol : recovered) {
        if (symbol.position < 0) {
            qWarning() << "[Reassembler] Ignoring symbol with invalid position on page" << symbol.pageNumber;
            continue;
        }
        if (expectedCount >= 0 && symbol.position >= expectedCount) {
            qWarning() << "[Reassembler] Ignoring symbol at position" << symbol.position
                       << "on page" << symbol.pageNumber << "(document holds" << expectedCount << "chunks)";
            continue;
        }

        auto it = byPosition.constFind(symbol.position);
        if (it != byPosition.constEnd()) {
            if (it.value() != symbol.text) {
                result.error = PaperError::Reconstruction;
                result.errorMessage = QStringLiteral("Conflicting data for chunk %1 (page %2)")
                                          .arg(symbol.position).arg(symbol.pageNumber);
                qWarning() << "[Reassembler]" << result.errorMessage;
                return result;
            }
            qDebug() << "[Reassembler] Duplicate chunk" << symbol.position << "collapsed";
            continue;
        }
        byPosition.insert(symbol.position, symbol.text);
    }

    int count = expectedCount;
    if (count < 0) {
        count = byPosition.isEmpty() ? 0 : byPosition.lastKey() + 1;
    }

    for (int position = 0; position < count; ++position) {
        if (!byPosition.contains(position)) {
            result.missingPositions.append(position);
        }
    }

    if (!result.missingPositions.isEmpty()) {
        result.error = PaperError::MissingChunk;
        result.errorMessage = QStringLiteral("Missing %1 of %2 chunks at positions: %3")
                                  .arg(result.missingPositions.size())
                                  .arg(count)
                                  .arg(formatPositions(result.missingPositions));
        qWarning() << "[Reassembler]" << result.errorMessage;
        return result;
    }

    if (count == 0) {
        result.error = PaperError::MissingChunk;
        result.errorMessage = QStringLiteral("No chunks were recovered");
        qWarning() << "[Reassembler]" << result.errorMessage;
        return result;
    }

    for (auto it = byPosition.constBegin(); it != byPosition.constEnd(); ++it) {
        result.encodedText.append(it.value());
    }
    result.chunkCount = count;

    Codec::CodecResult decoded = Codec::decodeText(result.encodedText);
    if (!decoded.success) {
        result.error = PaperError::Reconstruction;
        result.cause = decoded.error;
        result.causeMessage = decoded.errorMessage;
        result.errorMessage = QStringLiteral("Reconstruction failed: %1").arg(decoded.errorMessage);
        return result;
    }

    Codec::CodecResult inflated = Codec::decompress(decoded.data);
    if (!inflated.success) {
        result.error = PaperError::Reconstruction;
        result.cause = inflated.error;
        result.causeMessage = inflated.errorMessage;
        result.errorMessage = QStringLiteral("Reconstruction failed: %1").arg(inflated.errorMessage);
        return result;
    }

    result.payload = inflated.data;
    result.success = true;

    qDebug() << "[Reassembler] Rebuilt" << result.payload.size() << "bytes from" << count << "chunks";
    return result;
}

} // namespace Reassembler
