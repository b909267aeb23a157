#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <dla/vector.h>

#include <igm/util.hpp>

struct GridSettings;

struct Margins
{
    Length m_Top{ 0_mm };
    Length m_Bottom{ 0_mm };
    Length m_Left{ 0_mm };
    Length m_Right{ 0_mm };
};

// Derived from settings and the image count, replaced wholesale whenever either changes
struct LayoutGeometry
{
    Size m_PageSize{};
    Margins m_Margins{};
    Size m_CellSize{};

    uint32_t m_Columns{};
    uint32_t m_Rows{};
    uint32_t m_CellsPerPage{};
    uint32_t m_PageCount{};
    size_t m_ImageCount{};

    Size PrintableArea() const;
    // Top-left corner of the first cell
    Position CellBlockOrigin() const;
    Size CellBlockSize() const;
};

struct CellPlacement
{
    uint32_t m_Page;
    uint32_t m_Row;
    uint32_t m_Column;
};

// Page coordinates, origin at the top-left corner of the page
struct Rect
{
    Position m_Position;
    Size m_Size;
};

struct FitRect
{
    dla::vec2 m_Offset;
    dla::vec2 m_Size;
};

struct GridLine
{
    Position m_From;
    Position m_To;
};

// Throws ConfigError when the printable area or the cell size is non-positive
LayoutGeometry ComputeGeometry(Size page_size,
                               const Margins& margins,
                               Length col_width,
                               Length row_height,
                               size_t image_count);
LayoutGeometry ComputeGeometry(const GridSettings& settings, size_t image_count);

// Row-major, left to right then top to bottom, page by page
CellPlacement PlaceImage(const LayoutGeometry& geometry, size_t image_index);

Rect ComputeCellRect(const LayoutGeometry& geometry, uint32_t row, uint32_t column);

/*
        Uniform scale of content_size so that it fits into cell_size, centered on both axes
        Unit agnostic, the document passes millimeters and the preview passes screen pixels
*/
FitRect ComputeAspectFit(dla::vec2 cell_size, dla::vec2 content_size);

// columns + 1 vertical lines followed by rows + 1 horizontal lines
std::vector<GridLine> ComputeGridLines(const LayoutGeometry& geometry);

// Pixel dimensions of a cell printed at the given density
PixelSize ComputeTargetPixelSize(Size cell_size, PixelDensity density);
