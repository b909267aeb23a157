#pragma once

#include <memory>
#include <vector>

#include <podofo/main/PdfImage.h>
#include <podofo/main/PdfMemDocument.h>
#include <podofo/main/PdfPainter.h>

#include <igm/pdf/backend.hpp>

class PoDoFoDocument;

class PoDoFoPage final : public PdfPage
{
    friend class PoDoFoDocument;

  public:
    virtual ~PoDoFoPage() override = default;

    virtual void DrawSolidLine(LineData data, LineStyle style) override;

    virtual void DrawImage(ImageData data) override;

    virtual void Finish() override;

  private:
    PoDoFoPage(PoDoFo::PdfPage* page,
               PoDoFo::PdfPainter* painter,
               PoDoFoDocument* document,
               Length page_height);

    PoDoFo::PdfPage* m_Page{ nullptr };
    PoDoFo::PdfPainter* m_Painter{ nullptr };
    PoDoFoDocument* m_Document{ nullptr };
    Length m_PageHeight{};
};

class PoDoFoDocument final : public PdfDocument
{
  public:
    PoDoFoDocument(const GridSettings& settings);
    virtual ~PoDoFoDocument() override = default;

    virtual void ReservePages(size_t pages) override;
    virtual PoDoFoPage* NextPage() override;

    virtual fs::path Write(fs::path path) override;

    PoDoFo::PdfImage* MakeImage(EncodedImageView encoded_image);

  private:
    Size m_PageSize;

    PoDoFo::PdfMemDocument m_Document;
    std::vector<PoDoFoPage> m_Pages;
    std::vector<std::unique_ptr<PoDoFo::PdfPainter>> m_Painters;

    // Kept alive until the document is written
    std::vector<std::unique_ptr<PoDoFo::PdfImage>> m_Images;
};
