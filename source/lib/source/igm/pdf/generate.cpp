#include <igm/pdf/generate.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>

#include <fmt/format.h>

#include <igm/config.hpp>
#include <igm/errors.hpp>
#include <igm/grid_settings.hpp>
#include <igm/image.hpp>
#include <igm/layout/grid_layout.hpp>
#include <igm/util/at_scope_exit.hpp>
#include <igm/util/log.hpp>

#include <igm/pdf/backend.hpp>
#include <igm/pdf/draw_cell.hpp>

namespace
{
void DrawGridLines(PdfPage& page, const LayoutGeometry& geometry, const GridSettings& settings)
{
    const PdfPage::LineStyle line_style{
        .m_Thickness{ settings.m_GridLineWidth },
        .m_Color{ ColorToFloat(settings.m_GridColor) },
    };

    for (const GridLine& line : ComputeGridLines(geometry))
    {
        page.DrawSolidLine(PdfPage::LineData{ line.m_From, line.m_To }, line_style);
    }
}

// Never reuses an existing folder, whatever is at the returned path was created here
fs::path CreatePartialOutputDir(const fs::path& output)
{
    for (uint32_t attempt = 0; attempt < 1000; attempt++)
    {
        const fs::path file_name{
            attempt == 0
                ? fmt::format(".{}.partial", output.stem().string())
                : fmt::format(".{}.partial.{}", output.stem().string(), attempt)
        };
        const fs::path partial_dir{ output.parent_path() / file_name };

        std::error_code error;
        if (fs::create_directory(partial_dir, error))
        {
            return partial_dir;
        }
        if (error)
        {
            throw IoError{ fmt::format("Failed creating {}: {}", partial_dir.string(), error.message()) };
        }
    }

    throw IoError{ fmt::format("Failed finding a free temporary folder next to {}", output.string()) };
}

// A folder written by the png backend holds nothing but <n>.png pages
bool IsPageFolder(const fs::path& folder)
{
    std::error_code error;
    for (const auto& entry : fs::directory_iterator{ folder, error })
    {
        const fs::path& path{ entry.path() };
        const std::string stem{ path.stem().string() };
        const bool is_page{
            entry.is_regular_file(error) &&
            path.extension() == ".png" &&
            !stem.empty() &&
            std::ranges::all_of(stem,
                                [](unsigned char c)
                                {
                                    return std::isdigit(c) != 0;
                                })
        };
        if (!is_page)
        {
            return false;
        }
    }
    return !error;
}

// Only ever replaces output of an earlier render, anything else is left alone
void MoveIntoPlace(const fs::path& written_path, const fs::path& final_path)
{
    std::error_code error;
    if (fs::exists(final_path, error))
    {
        if (fs::is_directory(written_path))
        {
            if (!fs::is_directory(final_path) || !IsPageFolder(final_path))
            {
                throw IoError{ fmt::format("{} already exists and does not hold pages of an earlier render", final_path.string()) };
            }
            fs::remove_all(final_path, error);
        }
        else
        {
            if (!fs::is_regular_file(final_path))
            {
                throw IoError{ fmt::format("{} already exists and is not a file", final_path.string()) };
            }
            fs::remove(final_path, error);
        }

        if (error)
        {
            throw IoError{ fmt::format("Failed replacing {}: {}", final_path.string(), error.message()) };
        }
    }

    fs::rename(written_path, final_path, error);
    if (error)
    {
        throw IoError{ fmt::format("Failed moving {} to {}: {}", written_path.string(), final_path.string(), error.message()) };
    }
}
} // namespace

std::optional<fs::path> GeneratePdf(std::span<const fs::path> images,
                                    const GridSettings& settings,
                                    const fs::path& output,
                                    const ProgressFn& progress,
                                    std::stop_token stop_token)
{
    const LayoutGeometry geometry{ ComputeGeometry(settings, images.size()) };

    const auto report_progress{
        [&](int percent)
        {
            if (progress)
            {
                progress(percent);
            }
        }
    };
    report_progress(0);

    if (output.has_parent_path() && !fs::is_directory(output.parent_path()))
    {
        throw IoError{ fmt::format("Output folder {} does not exist", output.parent_path().string()) };
    }

    // Written here first and moved into place once the document is complete
    const fs::path partial_dir{ CreatePartialOutputDir(output) };
    AtScopeExit remove_partial_dir{
        [&partial_dir]()
        {
            std::error_code error;
            fs::remove_all(partial_dir, error);
        }
    };

    auto document{ CreatePdfDocument(g_Cfg.m_Backend, settings) };
    if (document == nullptr)
    {
        throw ConfigError{ "Selected pdf backend is not available" };
    }

    // An empty image list still yields one page holding just the grid
    const uint32_t page_count{ std::max(geometry.m_PageCount, 1u) };
    document->ReservePages(page_count);

    PdfPage* page{ nullptr };
    uint32_t pages_started{ 0 };
    const auto start_page{
        [&]()
        {
            if (page != nullptr)
            {
                page->Finish();
            }

            page = document->NextPage();
            ++pages_started;
            LogInfo("Rendering page {}/{}...", pages_started, page_count);

            if (settings.m_GridLineVisible)
            {
                DrawGridLines(*page, geometry, settings);
            }
        }
    };

    if (images.empty())
    {
        start_page();
    }

    size_t skipped_images{ 0 };
    for (size_t i = 0; i < images.size(); i++)
    {
        if (stop_token.stop_requested())
        {
            LogInfo("Rendering cancelled after {} of {} images...", i, images.size());
            return std::nullopt;
        }

        const CellPlacement placement{ PlaceImage(geometry, i) };
        while (pages_started <= placement.m_Page)
        {
            start_page();
        }

        const fs::path& image_path{ images[i] };
        try
        {
            const Rect cell{ ComputeCellRect(geometry, placement.m_Row, placement.m_Column) };
            DrawCellImage(*page, image_path, cell, settings.m_OutputDpi);
        }
        catch (const ImageDecodeError& e)
        {
            LogError("Skipping image: {}", e.what());
            ++skipped_images;
        }

        report_progress(static_cast<int>((i + 1) * 100 / images.size()));
    }

    if (page != nullptr)
    {
        page->Finish();
    }

    if (stop_token.stop_requested())
    {
        LogInfo("Rendering cancelled before writing {}...", output.string());
        return std::nullopt;
    }

    const fs::path written_path{ document->Write(partial_dir / output.filename()) };
    const fs::path final_path{ output.parent_path() / written_path.filename() };

    MoveIntoPlace(written_path, final_path);

    if (skipped_images > 0)
    {
        LogWarning("Wrote {} with {} of {} images skipped...", final_path.string(), skipped_images, images.size());
    }
    else
    {
        LogInfo("Wrote {} with {} images on {} pages...", final_path.string(), images.size(), pages_started);
    }

    report_progress(100);
    return final_path;
}
