#include <igm/layout/grid_layout.hpp>

#include <cmath>
#include <stdexcept>

#include <dla/scalar_math.h>
#include <dla/vector_math.h>

#include <fmt/format.h>

#include <igm/errors.hpp>
#include <igm/grid_settings.hpp>

namespace
{
// Keeps exact multiples like 190 mm / 10 mm from losing a cell to float rounding
inline constexpr float c_FloorTolerance{ 1e-4f };
inline constexpr Pixel c_PixelTolerance{ 1e-3f };

uint32_t CellsAlong(Length printable, Length cell)
{
    const float cells{ std::floor(printable / cell + c_FloorTolerance) };
    return std::max(static_cast<uint32_t>(cells), 1u);
}
} // namespace

Size LayoutGeometry::PrintableArea() const
{
    return Size{
        m_PageSize.x - m_Margins.m_Left - m_Margins.m_Right,
        m_PageSize.y - m_Margins.m_Top - m_Margins.m_Bottom,
    };
}

Position LayoutGeometry::CellBlockOrigin() const
{
    return Position{ m_Margins.m_Left, m_Margins.m_Top };
}

Size LayoutGeometry::CellBlockSize() const
{
    return Size{
        m_CellSize.x * static_cast<float>(m_Columns),
        m_CellSize.y * static_cast<float>(m_Rows),
    };
}

LayoutGeometry ComputeGeometry(Size page_size,
                               const Margins& margins,
                               Length col_width,
                               Length row_height,
                               size_t image_count)
{
    LayoutGeometry geometry{
        .m_PageSize{ page_size },
        .m_Margins{ margins },
        .m_CellSize{ col_width, row_height },
        .m_ImageCount{ image_count },
    };

    const auto [printable_width, printable_height]{ geometry.PrintableArea().pod() };
    if (printable_width <= 0_mm || printable_height <= 0_mm)
    {
        throw ConfigError{
            fmt::format("Printable area non-positive: {:.2f}mm x {:.2f}mm",
                        printable_width / 1_mm,
                        printable_height / 1_mm)
        };
    }

    if (col_width <= 0_mm || row_height <= 0_mm)
    {
        throw ConfigError{
            fmt::format("Cell size non-positive: {:.2f}mm x {:.2f}mm",
                        col_width / 1_mm,
                        row_height / 1_mm)
        };
    }

    geometry.m_Columns = CellsAlong(printable_width, col_width);
    geometry.m_Rows = CellsAlong(printable_height, row_height);
    geometry.m_CellsPerPage = geometry.m_Columns * geometry.m_Rows;
    if (geometry.m_CellsPerPage == 0)
    {
        throw ConfigError{ "No cell fits onto the page" };
    }

    geometry.m_PageCount = static_cast<uint32_t>((image_count + geometry.m_CellsPerPage - 1) / geometry.m_CellsPerPage);
    return geometry;
}

LayoutGeometry ComputeGeometry(const GridSettings& settings, size_t image_count)
{
    return ComputeGeometry(settings.PageDimensions(),
                           settings.m_Margins,
                           settings.m_ColWidth,
                           settings.m_RowHeight,
                           image_count);
}

CellPlacement PlaceImage(const LayoutGeometry& geometry, size_t image_index)
{
    if (image_index >= geometry.m_ImageCount)
    {
        throw std::out_of_range{
            fmt::format("Image index {} out of range for {} images", image_index, geometry.m_ImageCount)
        };
    }

    const size_t index_on_page{ image_index % geometry.m_CellsPerPage };
    return CellPlacement{
        .m_Page = static_cast<uint32_t>(image_index / geometry.m_CellsPerPage),
        .m_Row = static_cast<uint32_t>(index_on_page / geometry.m_Columns),
        .m_Column = static_cast<uint32_t>(index_on_page % geometry.m_Columns),
    };
}

Rect ComputeCellRect(const LayoutGeometry& geometry, uint32_t row, uint32_t column)
{
    const Position origin{ geometry.CellBlockOrigin() };
    return Rect{
        .m_Position{
            origin.x + geometry.m_CellSize.x * static_cast<float>(column),
            origin.y + geometry.m_CellSize.y * static_cast<float>(row),
        },
        .m_Size{ geometry.m_CellSize },
    };
}

FitRect ComputeAspectFit(dla::vec2 cell_size, dla::vec2 content_size)
{
    if (content_size.x <= 0.0f || content_size.y <= 0.0f || cell_size.x <= 0.0f || cell_size.y <= 0.0f)
    {
        return FitRect{
            .m_Offset{ cell_size / 2.0f },
            .m_Size{ 0.0f, 0.0f },
        };
    }

    const float content_aspect{ content_size.x / content_size.y };
    const float cell_aspect{ cell_size.x / cell_size.y };

    dla::vec2 draw_size;
    if (content_aspect > cell_aspect)
    {
        draw_size.x = cell_size.x;
        draw_size.y = std::min(cell_size.x / content_aspect, cell_size.y);
    }
    else
    {
        draw_size.x = std::min(cell_size.y * content_aspect, cell_size.x);
        draw_size.y = cell_size.y;
    }

    return FitRect{
        .m_Offset{ (cell_size - draw_size) / 2.0f },
        .m_Size{ draw_size },
    };
}

std::vector<GridLine> ComputeGridLines(const LayoutGeometry& geometry)
{
    const auto [left, top]{ geometry.CellBlockOrigin().pod() };
    const auto [printable_width, printable_height]{ geometry.PrintableArea().pod() };
    const auto [cell_width, cell_height]{ geometry.m_CellSize.pod() };

    // Lines sit on cell boundaries but run across the whole printable area

    std::vector<GridLine> lines;
    lines.reserve(geometry.m_Columns + geometry.m_Rows + 2);

    for (uint32_t c = 0; c <= geometry.m_Columns; c++)
    {
        const Length x{ left + cell_width * static_cast<float>(c) };
        lines.push_back(GridLine{
            .m_From{ x, top },
            .m_To{ x, top + printable_height },
        });
    }

    for (uint32_t r = 0; r <= geometry.m_Rows; r++)
    {
        const Length y{ top + cell_height * static_cast<float>(r) };
        lines.push_back(GridLine{
            .m_From{ left, y },
            .m_To{ left + printable_width, y },
        });
    }

    return lines;
}

PixelSize ComputeTargetPixelSize(Size cell_size, PixelDensity density)
{
    const auto pixels_along{
        [density](Length length)
        {
            const auto pixels{ length * density };
            return dla::math::max(dla::math::ceil(pixels - c_PixelTolerance), 1_pix);
        }
    };
    return PixelSize{
        pixels_along(cell_size.x),
        pixels_along(cell_size.y),
    };
}
