#pragma once

#include <memory>

#include <igm/color.hpp>
#include <igm/image.hpp>
#include <igm/typedefs.hpp>
#include <igm/util.hpp>

struct GridSettings;
class PdfDocument;

std::unique_ptr<PdfDocument> CreatePdfDocument(PdfBackend backend, const GridSettings& settings);

// Coordinates have their origin at the top-left corner of the page
class PdfPage
{
  public:
    virtual ~PdfPage() = default;

    struct LineData
    {
        Position m_From;
        Position m_To;
    };

    struct LineStyle
    {
        Length m_Thickness{ 1_pts };
        ColorRGB32f m_Color;
    };

    struct ImageData
    {
        // Normalized and downsampled, always valid
        const Image& m_Image;
        // Original file content to embed instead of m_Image where the backend can
        EncodedImageView m_PassThrough;
        Position m_Pos;
        Size m_Size;
    };

    virtual void DrawSolidLine(LineData data, LineStyle style) = 0;

    virtual void DrawImage(ImageData data) = 0;

    virtual void Finish() = 0;
};

class PdfDocument
{
  public:
    virtual ~PdfDocument() = default;

    virtual void ReservePages(size_t pages) = 0;
    virtual PdfPage* NextPage() = 0;

    // Returns the path that was actually written
    virtual fs::path Write(fs::path path) = 0;
};
