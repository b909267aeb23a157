#pragma once

#include <array>
#include <string_view>

#include <igm/util.hpp>

fs::path cwd();

inline const std::array g_ValidImageExtensions{
    ".bmp"_p,
    ".jpg"_p,
    ".jpeg"_p,
    ".png"_p,
    ".tif"_p,
    ".tiff"_p,
};

inline constexpr std::string_view c_DefaultSettingsFile{ "grid_settings.json" };
inline constexpr std::string_view c_DefaultOutputFile{ "output.pdf" };

// Applied on every side of the preview surface
inline constexpr float c_PreviewPadding{ 10.0f };

inline constexpr int c_ProgressBarResolution{ 100 };
