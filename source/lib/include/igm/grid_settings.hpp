#pragma once

#include <cstdint>

#include <nlohmann/json_fwd.hpp>

#include <igm/color.hpp>
#include <igm/layout/grid_layout.hpp>
#include <igm/util.hpp>

class JsonProvider;

enum class PageSize
{
    A4,
    A3,
};

Size PageDimensions(PageSize page_size);

struct GridSettings
{
    Length m_RowHeight{ 10_mm };
    Length m_ColWidth{ 10_mm };

    bool m_GridLineVisible{ true };
    ColorRGB8 m_GridColor{ 0, 0, 0 };
    Length m_GridLineWidth{ 1_pts };

    PageSize m_PageSize{ PageSize::A4 };
    Margins m_Margins{ 10_mm, 10_mm, 10_mm, 10_mm };

    PixelDensity m_OutputDpi{ 300_dpi };

    Size PageDimensions() const;

    // Best effort, returns false if anything had to fall back to its default
    bool Load(const fs::path& json_path, const JsonProvider* overrides = nullptr);
    bool LoadFromJson(const nlohmann::json& json, const JsonProvider* overrides = nullptr);

    // Throws IoError if the file can't be written
    void Dump(const fs::path& json_path) const;
    nlohmann::json DumpToJson() const;
};
