#include <igm/pdf/podofo_backend.hpp>

#include <podofo/podofo.h>

#include <igm/config.hpp>
#include <igm/errors.hpp>
#include <igm/grid_settings.hpp>
#include <igm/util/at_scope_exit.hpp>
#include <igm/util/log.hpp>

inline double ToPoDoFoPoints(Length l)
{
    return static_cast<double>(l / 1_pts);
}

auto Save(PoDoFo::PdfPainter& painter)
{
    painter.Save();
    return AtScopeExit{
        [&painter]
        {
            painter.Restore();
        }
    };
}

PoDoFoPage::PoDoFoPage(PoDoFo::PdfPage* page,
                       PoDoFo::PdfPainter* painter,
                       PoDoFoDocument* document,
                       Length page_height)
    : m_Page{ page }
    , m_Painter{ painter }
    , m_Document{ document }
    , m_PageHeight{ page_height }
{
    m_Painter->SetCanvas(*m_Page, PoDoFo::PdfPainterFlags::NoSaveRestorePrior);
}

void PoDoFoPage::DrawSolidLine(LineData data, LineStyle style)
{
    const auto& fx{ data.m_From.x };
    const auto& fy{ data.m_From.y };
    const auto& tx{ data.m_To.x };
    const auto& ty{ data.m_To.y };

    const auto real_fx{ ToPoDoFoPoints(fx) };
    const auto real_fy{ ToPoDoFoPoints(m_PageHeight - fy) };
    const auto real_tx{ ToPoDoFoPoints(tx) };
    const auto real_ty{ ToPoDoFoPoints(m_PageHeight - ty) };
    const auto line_width{ ToPoDoFoPoints(style.m_Thickness) };
    const PoDoFo::PdfColor col{ style.m_Color.r, style.m_Color.g, style.m_Color.b };

    auto save{ Save(*m_Painter) };
    m_Painter->GraphicsState.SetLineWidth(line_width);
    m_Painter->GraphicsState.SetStrokingColor(col);
    m_Painter->SetStrokeStyle(PoDoFo::PdfStrokeStyle::Solid);
    m_Painter->DrawLine(real_fx, real_fy, real_tx, real_ty);
}

void PoDoFoPage::DrawImage(ImageData data)
{
    const auto& x{ data.m_Pos.x };
    const auto& y{ data.m_Pos.y };
    const auto& w{ data.m_Size.x };
    const auto& h{ data.m_Size.y };

    // PDF space grows upwards from the bottom-left corner
    const auto real_x{ ToPoDoFoPoints(x) };
    const auto real_y{ ToPoDoFoPoints(m_PageHeight - y - h) };
    const auto real_w{ ToPoDoFoPoints(w) };
    const auto real_h{ ToPoDoFoPoints(h) };

    PoDoFo::PdfImage* image{ nullptr };
    if (!data.m_PassThrough.empty())
    {
        try
        {
            image = m_Document->MakeImage(data.m_PassThrough);
        }
        catch (const IoError& e)
        {
            LogError("Failed embedding original image data, embedding converted image instead: {}", e.what());
        }
    }
    if (image == nullptr)
    {
        image = m_Document->MakeImage(data.m_Image.EncodePng(std::optional{ 0 }));
    }
    const auto w_scale{ real_w / image->GetWidth() };
    const auto h_scale{ real_h / image->GetHeight() };

    auto save{ Save(*m_Painter) };
    m_Painter->DrawImage(*image, real_x, real_y, w_scale, h_scale);
}

void PoDoFoPage::Finish()
{
    m_Painter->FinishDrawing();
}

PoDoFoDocument::PoDoFoDocument(const GridSettings& settings)
    : m_PageSize{ settings.PageDimensions() }
{
}

void PoDoFoDocument::ReservePages(size_t pages)
{
    m_Pages.reserve(pages);
    m_Painters.reserve(pages);
}

PoDoFoPage* PoDoFoDocument::NextPage()
{
    const unsigned new_page_idx{ static_cast<unsigned>(m_Pages.size()) };
    PoDoFo::PdfPage* page{
        &m_Document.GetPages().CreatePageAt(
            new_page_idx,
            PoDoFo::Rect(
                0.0,
                0.0,
                ToPoDoFoPoints(m_PageSize.x),
                ToPoDoFoPoints(m_PageSize.y)))
    };

    auto* painter{ m_Painters.emplace_back(new PoDoFo::PdfPainter).get() };

    m_Pages.push_back(PoDoFoPage{ page, painter, this, m_PageSize.y });
    return &m_Pages.back();
}

fs::path PoDoFoDocument::Write(fs::path path)
{
    try
    {
        const auto pdf_path_string{ path.string() };
        LogInfo("Saving to {}...", pdf_path_string);

        if (g_Cfg.m_DeterministicPdfOutput)
        {
            auto& trailer{ m_Document.GetTrailer() };
            if (const auto* info{ trailer.GetDictionary().GetKey("Info") })
            {
                auto* obj{ m_Document.GetObjects().GetObject(info->GetReference()) };
                obj->GetDictionary().RemoveKey("CreationDate");
            }

            m_Document.Save(pdf_path_string, PoDoFo::PdfSaveOptions::NoMetadataUpdate);
        }
        else
        {
            m_Document.Save(pdf_path_string);
        }

        return path;
    }
    catch (const PoDoFo::PdfError& e)
    {
        // Rethrow as a std::exception so the agnostic code can catch it
        throw IoError{ e.what() };
    }
}

PoDoFo::PdfImage* PoDoFoDocument::MakeImage(EncodedImageView encoded_image)
{
    try
    {
        std::unique_ptr podofo_image{ m_Document.CreateImage() };
        podofo_image->LoadFromBuffer(
            PoDoFo::bufferview{
                reinterpret_cast<const char*>(encoded_image.data()),
                encoded_image.size(),
            });
        return m_Images.emplace_back(std::move(podofo_image)).get();
    }
    catch (const PoDoFo::PdfError& e)
    {
        throw IoError{ e.what() };
    }
}
