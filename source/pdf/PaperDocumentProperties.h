#pragma once

// ============================================================================
// PaperDocumentProperties - Protocol parameters stored in the PDF
// ============================================================================
// The writer records how a document was composed in its Info dictionary
// and the scanner reads the same entries back, so decoding never has to
// guess the DPI, the layout or how many leading pages are not data.
// ============================================================================

#include "../layout/LayoutPolicy.h"

#include <QString>

class PdfProvider;

/**
 * @brief Composition parameters of a paper document.
 */
struct PaperDocumentProperties {
    static constexpr int PROTOCOL_VERSION = 1;

    // Info dictionary keys
    static constexpr const char* KEY_VERSION = "QrPaperVersion";
    static constexpr const char* KEY_DPI = "QrPaperDpi";
    static constexpr const char* KEY_LAYOUT = "QrPaperLayout";
    static constexpr const char* KEY_CHUNKS = "QrPaperChunks";
    static constexpr const char* KEY_CHUNK_SIZE = "QrPaperChunkSize";
    static constexpr const char* KEY_INFO_PAGES = "QrPaperInfoPages";
    static constexpr const char* KEY_INDEXED = "QrPaperIndexed";

    bool present = false;               ///< True if the document carries the entries
    int version = PROTOCOL_VERSION;
    int dpi = 300;                      ///< Composition DPI
    LayoutKind layout = LayoutKind::Single;
    int chunkCount = 0;                 ///< Total chunks (symbols) in the document
    int chunkSize = 0;                  ///< Chunk size used when encoding
    int infoPages = 0;                  ///< Leading pages without data
    bool indexed = false;               ///< Symbols carry an index frame

    /**
     * @brief Read the properties of an opened document.
     *
     * Returns present == false when the version or DPI entry is missing.
     * Malformed values are logged and leave present == false.
     */
    static PaperDocumentProperties read(const PdfProvider& provider);
};
