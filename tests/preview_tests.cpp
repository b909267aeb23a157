#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <vector>

#include <igm/constants.hpp>
#include <igm/grid_settings.hpp>
#include <igm/preview/synthesize.hpp>

using Catch::Matchers::WithinAbs;

namespace
{
std::vector<PixelSize> SquareThumbnails(size_t count)
{
    return std::vector<PixelSize>(count, PixelSize{ 100_pix, 100_pix });
}
} // namespace

TEST_CASE("Page is centered and keeps its aspect ratio", "[preview_page]")
{
    const GridSettings settings{};
    const LayoutGeometry geometry{ ComputeGeometry(settings, 0) };
    const PreviewDrawCommands commands{ SynthesizePreview({}, geometry, settings, dla::vec2{ 400.0f, 600.0f }) };
    REQUIRE_FALSE(commands.Empty());

    // Width is the limiting side
    REQUIRE_THAT(commands.m_Page.m_Size.x, WithinAbs(400.0f - 2.0f * c_PreviewPadding, 0.01));
    REQUIRE_THAT(commands.m_Page.m_Size.y / commands.m_Page.m_Size.x, WithinAbs(297.0 / 210.0, 0.001));
    REQUIRE_THAT(commands.m_Page.m_Position.x, WithinAbs(c_PreviewPadding, 0.01));
    REQUIRE_THAT(commands.m_Page.m_Position.y + commands.m_Page.m_Size.y / 2.0f, WithinAbs(300.0, 0.01));

    const float scale{ commands.m_Page.m_Size.x / 210.0f };
    REQUIRE_THAT(commands.m_Printable.m_Position.x, WithinAbs(commands.m_Page.m_Position.x + 10.0f * scale, 0.01));
    REQUIRE_THAT(commands.m_Printable.m_Size.x, WithinAbs(190.0f * scale, 0.01));
    REQUIRE_THAT(commands.m_Printable.m_Size.y, WithinAbs(277.0f * scale, 0.01));
}

TEST_CASE("Tiny surfaces draw nothing", "[preview_too_small]")
{
    const GridSettings settings{};
    const LayoutGeometry geometry{ ComputeGeometry(settings, 4) };
    const auto thumbnails{ SquareThumbnails(4) };

    REQUIRE(SynthesizePreview(thumbnails, geometry, settings, dla::vec2{ 0.0f, 0.0f }).Empty());
    REQUIRE(SynthesizePreview(thumbnails, geometry, settings, dla::vec2{ 20.0f, 300.0f }).Empty());
}

TEST_CASE("Only the first page is previewed", "[preview_first_page]")
{
    GridSettings settings{};
    settings.m_ColWidth = 50_mm;
    settings.m_RowHeight = 50_mm;

    const LayoutGeometry geometry{ ComputeGeometry(settings, 30) };
    REQUIRE(geometry.m_CellsPerPage == 15);

    const auto thumbnails{ SquareThumbnails(30) };
    const PreviewDrawCommands commands{ SynthesizePreview(thumbnails, geometry, settings, dla::vec2{ 800.0f, 800.0f }) };
    REQUIRE(commands.m_Images.size() == 15);
    for (size_t i = 0; i < commands.m_Images.size(); i++)
    {
        REQUIRE(commands.m_Images[i].m_Index == i);
    }

    // Square thumbnails fill the square cells completely
    const float scale{ commands.m_Page.m_Size.x / 210.0f };
    REQUIRE_THAT(commands.m_Images[0].m_Rect.m_Size.x, WithinAbs(50.0f * scale, 0.01));
    REQUIRE_THAT(commands.m_Images[0].m_Rect.m_Size.y, WithinAbs(50.0f * scale, 0.01));
}

TEST_CASE("Fewer thumbnails than images", "[preview_pending_thumbnails]")
{
    const GridSettings settings{};
    const LayoutGeometry geometry{ ComputeGeometry(settings, 100) };
    const auto thumbnails{ SquareThumbnails(3) };
    const PreviewDrawCommands commands{ SynthesizePreview(thumbnails, geometry, settings, dla::vec2{ 800.0f, 800.0f }) };
    REQUIRE(commands.m_Images.size() == 3);
}

TEST_CASE("Wide thumbnails are letterboxed", "[preview_aspect_fit]")
{
    GridSettings settings{};
    settings.m_ColWidth = 40_mm;
    settings.m_RowHeight = 40_mm;

    const LayoutGeometry geometry{ ComputeGeometry(settings, 1) };
    const std::vector<PixelSize> thumbnails{ PixelSize{ 200_pix, 100_pix } };
    const PreviewDrawCommands commands{ SynthesizePreview(thumbnails, geometry, settings, dla::vec2{ 800.0f, 800.0f }) };
    REQUIRE(commands.m_Images.size() == 1);

    const PreviewRect& rect{ commands.m_Images[0].m_Rect };
    REQUIRE_THAT(rect.m_Size.x / rect.m_Size.y, WithinAbs(2.0, 0.001));

    const float scale{ commands.m_Page.m_Size.x / 210.0f };
    const float cell_top{ commands.m_Printable.m_Position.y };
    REQUIRE_THAT(rect.m_Position.y - cell_top, WithinAbs(10.0f * scale, 0.01));
}

TEST_CASE("Grid lines follow visibility", "[preview_grid_lines]")
{
    GridSettings settings{};
    const LayoutGeometry geometry{ ComputeGeometry(settings, 10) };

    SECTION("Visible")
    {
        const PreviewDrawCommands commands{ SynthesizePreview({}, geometry, settings, dla::vec2{ 400.0f, 600.0f }) };
        REQUIRE(commands.m_GridLines.size() == (geometry.m_Columns + 1) + (geometry.m_Rows + 1));
        REQUIRE(commands.m_GridPenWidth >= 1.0f);
    }

    SECTION("Hidden")
    {
        settings.m_GridLineVisible = false;
        const PreviewDrawCommands commands{ SynthesizePreview({}, geometry, settings, dla::vec2{ 400.0f, 600.0f }) };
        REQUIRE(commands.m_GridLines.empty());
    }
}

TEST_CASE("Grid pen scales with the page", "[preview_pen_width]")
{
    GridSettings settings{};
    settings.m_GridLineWidth = 5_mm;
    const LayoutGeometry geometry{ ComputeGeometry(settings, 0) };
    const PreviewDrawCommands commands{ SynthesizePreview({}, geometry, settings, dla::vec2{ 440.0f, 1000.0f }) };
    REQUIRE_THAT(commands.m_GridPenWidth, WithinAbs(5.0f * 420.0f / 210.0f, 0.01));
}

TEST_CASE("Info text summarizes the layout", "[preview_info_text]")
{
    const LayoutGeometry geometry{ ComputeGeometry(GridSettings{}, 1000) };
    REQUIRE(PreviewInfoText(geometry) == "1000 images | 27 x 19 | 2 pages");
}
