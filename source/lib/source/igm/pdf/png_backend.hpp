#pragma once

#include <vector>

#include <opencv2/core/mat.hpp>

#include <igm/pdf/backend.hpp>

class PngDocument;

class PngPage final : public PdfPage
{
    friend class PngDocument;

  public:
    virtual ~PngPage() override = default;

    virtual void DrawSolidLine(LineData data, LineStyle style) override;

    virtual void DrawImage(ImageData data) override;

    virtual void Finish() override{};

  private:
    cv::Mat m_Page{};
    PixelDensity m_Density{};
};

// Renders every page into its own png, written into a folder named after the document
class PngDocument final : public PdfDocument
{
  public:
    PngDocument(const GridSettings& settings);
    virtual ~PngDocument() override = default;

    virtual void ReservePages(size_t pages) override;
    virtual PngPage* NextPage() override;

    virtual fs::path Write(fs::path path) override;

  private:
    Size m_PageSize;
    PixelDensity m_Density;
    PixelSize m_PrecomputedPageSize;

    std::vector<PngPage> m_Pages;
};
