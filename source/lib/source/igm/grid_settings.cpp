#include <igm/grid_settings.hpp>

#include <array>
#include <cmath>
#include <fstream>
#include <optional>
#include <string>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <nlohmann/json.hpp>

#include <igm/errors.hpp>
#include <igm/json_util.hpp>
#include <igm/util/log.hpp>

namespace
{
inline constexpr std::array c_SettingsKeys{
    "row_height_mm",
    "col_width_mm",
    "grid_line_visible",
    "grid_color",
    "grid_width",
    "page_size",
    "margin_top_mm",
    "margin_bottom_mm",
    "margin_left_mm",
    "margin_right_mm",
    "output_dpi",
};

template<class T>
std::optional<T> ReadField(const nlohmann::json& json, const char* key, bool& clean)
{
    if (!json.contains(key))
    {
        return std::nullopt;
    }

    try
    {
        return json[key].get<T>();
    }
    catch (const nlohmann::json::exception& e)
    {
        LogError("Setting {} has an invalid value, keeping default: {}", key, e.what());
        clean = false;
        return std::nullopt;
    }
}
} // namespace

Size PageDimensions(PageSize page_size)
{
    switch (page_size)
    {
    case PageSize::A3:
        return Size{ 297_mm, 420_mm };
    case PageSize::A4:
    default:
        return Size{ 210_mm, 297_mm };
    }
}

Size GridSettings::PageDimensions() const
{
    return ::PageDimensions(m_PageSize);
}

bool GridSettings::Load(const fs::path& json_path, const JsonProvider* overrides)
{
    *this = GridSettings{};

    try
    {
        const auto json{ nlohmann::json::parse(std::ifstream{ json_path }) };
        return LoadFromJson(json, overrides);
    }
    catch (const std::exception& e)
    {
        LogError("Failed loading settings from {}, continuing with defaults: {}", json_path.string(), e.what());
    }

    // Overrides still apply on top of the defaults
    if (overrides != nullptr)
    {
        LoadFromJson(DumpToJson(), overrides);
    }
    return false;
}

bool GridSettings::LoadFromJson(const nlohmann::json& raw_json, const JsonProvider* overrides)
{
    if (!raw_json.is_object())
    {
        LogError("Settings json is not an object, continuing with defaults...");
        *this = GridSettings{};
        return false;
    }

    nlohmann::json json(raw_json);
    if (overrides != nullptr)
    {
        for (const char* key : c_SettingsKeys)
        {
            nlohmann::json value(overrides->GetJsonValue(key));
            if (!value.is_null())
            {
                SetJsonValue(json, key, std::move(value));
            }
        }
    }

    *this = GridSettings{};
    bool clean{ true };

    if (const auto row_height{ ReadField<float>(json, "row_height_mm", clean) })
    {
        m_RowHeight = row_height.value() * 1_mm;
    }
    if (const auto col_width{ ReadField<float>(json, "col_width_mm", clean) })
    {
        m_ColWidth = col_width.value() * 1_mm;
    }

    if (const auto visible{ ReadField<bool>(json, "grid_line_visible", clean) })
    {
        m_GridLineVisible = visible.value();
    }
    if (const auto color_str{ ReadField<std::string>(json, "grid_color", clean) })
    {
        if (const auto color{ ColorFromHex(color_str.value()) })
        {
            m_GridColor = color.value();
        }
        else
        {
            LogError("Setting grid_color has an invalid value {}, keeping default...", color_str.value());
            clean = false;
        }
    }
    if (const auto grid_width{ ReadField<float>(json, "grid_width", clean) })
    {
        m_GridLineWidth = grid_width.value() * 1_pts;
    }

    if (const auto page_size_str{ ReadField<std::string>(json, "page_size", clean) })
    {
        if (const auto page_size{ magic_enum::enum_cast<PageSize>(page_size_str.value()) })
        {
            m_PageSize = page_size.value();
        }
        else
        {
            LogError("Setting page_size has an unknown value {}, keeping default...", page_size_str.value());
            clean = false;
        }
    }

    if (const auto margin{ ReadField<float>(json, "margin_top_mm", clean) })
    {
        m_Margins.m_Top = margin.value() * 1_mm;
    }
    if (const auto margin{ ReadField<float>(json, "margin_bottom_mm", clean) })
    {
        m_Margins.m_Bottom = margin.value() * 1_mm;
    }
    if (const auto margin{ ReadField<float>(json, "margin_left_mm", clean) })
    {
        m_Margins.m_Left = margin.value() * 1_mm;
    }
    if (const auto margin{ ReadField<float>(json, "margin_right_mm", clean) })
    {
        m_Margins.m_Right = margin.value() * 1_mm;
    }

    if (const auto dpi{ ReadField<int>(json, "output_dpi", clean) })
    {
        if (dpi.value() > 0)
        {
            m_OutputDpi = static_cast<float>(dpi.value()) * 1_dpi;
        }
        else
        {
            LogError("Setting output_dpi must be positive, got {}, keeping default...", dpi.value());
            clean = false;
        }
    }

    return clean;
}

void GridSettings::Dump(const fs::path& json_path) const
{
    if (std::ofstream file{ json_path })
    {
        file << DumpToJson().dump(4);
        if (!file)
        {
            throw IoError{ fmt::format("Failed writing settings to {}", json_path.string()) };
        }
    }
    else
    {
        throw IoError{ fmt::format("Failed opening settings file {} for writing", json_path.string()) };
    }
}

nlohmann::json GridSettings::DumpToJson() const
{
    nlohmann::json json{};
    json["row_height_mm"] = m_RowHeight / 1_mm;
    json["col_width_mm"] = m_ColWidth / 1_mm;
    json["grid_line_visible"] = m_GridLineVisible;
    json["grid_color"] = ColorToHex(m_GridColor);
    json["grid_width"] = m_GridLineWidth / 1_pts;
    json["page_size"] = magic_enum::enum_name(m_PageSize);
    json["margin_top_mm"] = m_Margins.m_Top / 1_mm;
    json["margin_bottom_mm"] = m_Margins.m_Bottom / 1_mm;
    json["margin_left_mm"] = m_Margins.m_Left / 1_mm;
    json["margin_right_mm"] = m_Margins.m_Right / 1_mm;
    json["output_dpi"] = static_cast<int>(std::round(m_OutputDpi / 1_dpi));
    return json;
}
