#include <igm/pdf/png_backend.hpp>

#include <cmath>

#include <dla/scalar_math.h>

#include <opencv2/imgproc.hpp>

#include <igm/config.hpp>
#include <igm/errors.hpp>
#include <igm/grid_settings.hpp>
#include <igm/util/log.hpp>

inline int32_t ToPixels(Length l, PixelDensity density)
{
    return static_cast<int32_t>(std::round(l * density / 1_pix));
}

void PngPage::DrawSolidLine(LineData data, LineStyle style)
{
    const auto& fx{ data.m_From.x };
    const auto& fy{ data.m_From.y };
    const auto& tx{ data.m_To.x };
    const auto& ty{ data.m_To.y };

    const auto real_fx{ ToPixels(fx, m_Density) };
    const auto real_fy{ ToPixels(fy, m_Density) };
    const auto real_tx{ ToPixels(tx, m_Density) };
    const auto real_ty{ ToPixels(ty, m_Density) };
    const auto real_w{ std::max(ToPixels(style.m_Thickness, m_Density), 1) };

    const cv::Point line_from{ real_fx, real_fy };
    const cv::Point line_to{ real_tx, real_ty };
    const cv::Point delta{ line_to - line_from };

    const cv::Point perp{ delta.x == 0 ? cv::Point{ real_w / 2, 0 } : cv::Point{ 0, real_w / 2 } };
    const cv::Point from{ line_from - perp };
    const cv::Point to{ line_to + perp };

    const cv::Scalar color_cv{ style.m_Color.b * 255, style.m_Color.g * 255, style.m_Color.r * 255 };

    cv::rectangle(m_Page, from, to, color_cv, cv::FILLED);
}

void PngPage::DrawImage(ImageData data)
{
    const auto real_x{ ToPixels(data.m_Pos.x, m_Density) };
    const auto real_y{ ToPixels(data.m_Pos.y, m_Density) };
    const auto real_w{ std::max(ToPixels(data.m_Size.x, m_Density), 1) };
    const auto real_h{ std::max(ToPixels(data.m_Size.y, m_Density), 1) };

    const cv::Rect target_rect{ real_x, real_y, real_w, real_h };
    const cv::Rect clipped_rect{ target_rect & cv::Rect{ 0, 0, m_Page.cols, m_Page.rows } };
    if (clipped_rect.empty())
    {
        return;
    }

    const Image resized{ data.m_Image.Resize({ real_w * 1_pix, real_h * 1_pix }) };
    const cv::Rect source_rect{ clipped_rect - target_rect.tl() };
    resized.GetUnderlying()(source_rect).copyTo(m_Page(clipped_rect));
}

PngDocument::PngDocument(const GridSettings& settings)
    : m_PageSize{ settings.PageDimensions() }
    , m_Density{ settings.m_OutputDpi }
{
    m_PrecomputedPageSize = PixelSize{
        dla::math::round(m_PageSize.x * m_Density),
        dla::math::round(m_PageSize.y * m_Density),
    };
}

void PngDocument::ReservePages(size_t pages)
{
    m_Pages.reserve(pages);
}

PngPage* PngDocument::NextPage()
{
    auto& new_page{ m_Pages.emplace_back() };
    new_page.m_Density = m_Density;
    new_page.m_Page = cv::Mat{
        cv::Size{
            static_cast<int32_t>(m_PrecomputedPageSize.x / 1_pix),
            static_cast<int32_t>(m_PrecomputedPageSize.y / 1_pix),
        },
        CV_8UC3,
        cv::Scalar{ 255, 255, 255 },
    };
    return &new_page;
}

fs::path PngDocument::Write(fs::path path)
{
    const fs::path png_folder{ fs::path{ path }.replace_extension("") };

    std::error_code error;
    if (fs::exists(png_folder) && !fs::is_directory(png_folder))
    {
        fs::remove(png_folder, error);
    }
    fs::create_directories(png_folder, error);
    if (error)
    {
        throw IoError{ fmt::format("Failed creating folder {}: {}", png_folder.string(), error.message()) };
    }

    for (size_t i = 0; i < m_Pages.size(); i++)
    {
        const fs::path png_path{ png_folder / fs::path{ std::to_string(i) }.replace_extension(".png") };
        {
            const auto png_path_str{ png_path.string() };
            LogInfo("Saving to {}...", png_path_str);
        }

        if (!Image{ m_Pages[i].m_Page }.Write(png_path, g_Cfg.m_PngCompression.value_or(5), m_PageSize))
        {
            throw IoError{ fmt::format("Failed writing page {}", png_path.string()) };
        }
    }

    return png_folder;
}
