#include <igm/color.hpp>

#include <charconv>

#include <fmt/format.h>

uint32_t ColorToInt(const ColorRGB8& color)
{
    return static_cast<uint32_t>((color.r << 16) | (color.g << 8) | color.b);
}

std::string ColorToHex(const ColorRGB8& color)
{
    return fmt::format("#{:0>6x}", ColorToInt(color));
}

std::optional<ColorRGB8> ColorFromHex(std::string_view hex)
{
    if (hex.starts_with('#'))
    {
        hex.remove_prefix(1);
    }

    if (hex.size() != 6)
    {
        return std::nullopt;
    }

    uint32_t color_uint{};
    const auto [ptr, ec]{ std::from_chars(hex.data(), hex.data() + hex.size(), color_uint, 16) };
    if (ec != std::errc{} || ptr != hex.data() + hex.size())
    {
        return std::nullopt;
    }

    return ColorRGB8{
        static_cast<uint8_t>((color_uint >> 16) & 0xff),
        static_cast<uint8_t>((color_uint >> 8) & 0xff),
        static_cast<uint8_t>(color_uint & 0xff),
    };
}

ColorRGB32f ColorToFloat(const ColorRGB8& color)
{
    return ColorRGB32f{
        static_cast<float>(color.r) / 255.0f,
        static_cast<float>(color.g) / 255.0f,
        static_cast<float>(color.b) / 255.0f,
    };
}
