// ============================================================================
// PdfProviderFactory - PDF provider creation
// ============================================================================
// MuPDF is the only backend: the same library writes the documents, so
// rasterization reproduces the composed geometry exactly.
// ============================================================================

#include "PdfProvider.h"
#include "MuPdfProvider.h"

#include <QDebug>

#include <memory>

std::unique_ptr<PdfProvider> PdfProvider::create(const QString& pdfPath)
{
    auto provider = std::make_unique<MuPdfProvider>(pdfPath);
    if (!provider->isValid()) {
        return nullptr;
    }
    if (provider->isLocked()) {
        qWarning() << "[PdfProvider]" << pdfPath << "is password protected";
        return nullptr;
    }
    return provider;
}
