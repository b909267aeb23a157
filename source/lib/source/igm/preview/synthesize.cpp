#include <igm/preview/synthesize.hpp>

#include <algorithm>

#include <fmt/format.h>

#include <igm/constants.hpp>
#include <igm/grid_settings.hpp>

bool PreviewDrawCommands::Empty() const
{
    return m_Page.m_Size.x <= 0.0f || m_Page.m_Size.y <= 0.0f;
}

PreviewDrawCommands SynthesizePreview(std::span<const PixelSize> thumbnail_sizes,
                                      const LayoutGeometry& geometry,
                                      const GridSettings& settings,
                                      dla::vec2 surface_size)
{
    const dla::vec2 available{
        surface_size.x - 2.0f * c_PreviewPadding,
        surface_size.y - 2.0f * c_PreviewPadding,
    };
    const auto [page_width, page_height]{ geometry.m_PageSize.pod() };
    if (available.x < 1.0f || available.y < 1.0f || page_width <= 0_mm || page_height <= 0_mm)
    {
        return PreviewDrawCommands{};
    }

    // Screen pixels per millimeter
    const float scale{ std::min(available.x / (page_width / 1_mm), available.y / (page_height / 1_mm)) };
    const auto to_screen{
        [scale](Length l)
        {
            return l / 1_mm * scale;
        }
    };

    const dla::vec2 page_size{ to_screen(page_width), to_screen(page_height) };
    const dla::vec2 page_pos{ (surface_size - page_size) / 2.0f };
    const auto to_screen_pos{
        [&](const Position& pos)
        {
            return dla::vec2{ page_pos.x + to_screen(pos.x), page_pos.y + to_screen(pos.y) };
        }
    };

    PreviewDrawCommands commands{
        .m_Page{ page_pos, page_size },
        .m_Printable{
            to_screen_pos(Position{ geometry.m_Margins.m_Left, geometry.m_Margins.m_Top }),
            dla::vec2{ to_screen(geometry.PrintableArea().x), to_screen(geometry.PrintableArea().y) },
        },
        .m_GridColor{ settings.m_GridColor },
        .m_GridPenWidth{ std::max(to_screen(settings.m_GridLineWidth), 1.0f) },
    };

    const size_t images_on_page{
        std::min({ thumbnail_sizes.size(), geometry.m_ImageCount, static_cast<size_t>(geometry.m_CellsPerPage) })
    };
    commands.m_Images.reserve(images_on_page);
    for (size_t i = 0; i < images_on_page; i++)
    {
        const CellPlacement placement{ PlaceImage(geometry, i) };
        const Rect cell{ ComputeCellRect(geometry, placement.m_Row, placement.m_Column) };
        const dla::vec2 cell_pos{ to_screen_pos(cell.m_Position) };
        const dla::vec2 cell_size{ to_screen(cell.m_Size.x), to_screen(cell.m_Size.y) };

        const auto [thumb_width, thumb_height]{ thumbnail_sizes[i].pod() };
        const FitRect fit{ ComputeAspectFit(cell_size, dla::vec2{ thumb_width / 1_pix, thumb_height / 1_pix }) };
        commands.m_Images.push_back(PreviewImage{
            .m_Index = i,
            .m_Rect{ cell_pos + fit.m_Offset, fit.m_Size },
        });
    }

    if (settings.m_GridLineVisible)
    {
        const auto grid_lines{ ComputeGridLines(geometry) };
        commands.m_GridLines.reserve(grid_lines.size());
        for (const GridLine& line : grid_lines)
        {
            commands.m_GridLines.push_back(PreviewLine{
                .m_From{ to_screen_pos(line.m_From) },
                .m_To{ to_screen_pos(line.m_To) },
            });
        }
    }

    return commands;
}

std::string PreviewInfoText(const LayoutGeometry& geometry)
{
    return fmt::format("{} images | {} x {} | {} pages",
                       geometry.m_ImageCount,
                       geometry.m_Rows,
                       geometry.m_Columns,
                       geometry.m_PageCount);
}
