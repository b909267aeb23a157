#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include <dla/vector.h>

#include <igm/color.hpp>
#include <igm/layout/grid_layout.hpp>
#include <igm/util.hpp>

struct GridSettings;

// Screen pixels, origin at the top-left corner of the surface
struct PreviewRect
{
    dla::vec2 m_Position;
    dla::vec2 m_Size;
};

struct PreviewLine
{
    dla::vec2 m_From;
    dla::vec2 m_To;
};

struct PreviewImage
{
    size_t m_Index;
    PreviewRect m_Rect;
};

struct PreviewDrawCommands
{
    PreviewRect m_Page{};
    PreviewRect m_Printable{};

    std::vector<PreviewImage> m_Images;

    std::vector<PreviewLine> m_GridLines;
    ColorRGB8 m_GridColor{};
    float m_GridPenWidth{ 1.0f };

    bool Empty() const;
};

/*
        Draw instructions for the first page of the layout scaled into surface_size
        Only the first cells_per_page thumbnails are placed, the same aspect-fit as the
        document is used so both always agree
*/
PreviewDrawCommands SynthesizePreview(std::span<const PixelSize> thumbnail_sizes,
                                      const LayoutGeometry& geometry,
                                      const GridSettings& settings,
                                      dla::vec2 surface_size);

// "<n> images | <rows> x <cols> | <pages> pages"
std::string PreviewInfoText(const LayoutGeometry& geometry);
