#include <igm/pdf/backend.hpp>

#include <igm/pdf/png_backend.hpp>
#include <igm/pdf/podofo_backend.hpp>

std::unique_ptr<PdfDocument> CreatePdfDocument(PdfBackend backend, const GridSettings& settings)
{
    switch (backend)
    {
    case PdfBackend::PoDoFo:
        return std::make_unique<PoDoFoDocument>(settings);
    case PdfBackend::Png:
        return std::make_unique<PngDocument>(settings);
    default:
        return nullptr;
    }
}
