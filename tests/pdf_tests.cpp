#include <catch2/catch_test_macros.hpp>

#include <stop_token>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <podofo/podofo.h>

#include <igm/config.hpp>
#include <igm/errors.hpp>
#include <igm/grid_settings.hpp>
#include <igm/pdf/generate.hpp>
#include <igm/util/at_scope_exit.hpp>

#include <igm/pdf/backend.hpp>
#include <igm/pdf/draw_cell.hpp>

#include <test_fixtures.hpp>

namespace
{
unsigned PdfPageCount(const fs::path& pdf_path)
{
    PoDoFo::PdfMemDocument document;
    document.Load(pdf_path.string());
    return document.GetPages().GetCount();
}

GridSettings LowResolutionSettings()
{
    GridSettings settings{};
    settings.m_OutputDpi = 72_dpi;
    return settings;
}

auto UsePngBackend()
{
    const PdfBackend previous_backend{ g_Cfg.m_Backend };
    g_Cfg.m_Backend = PdfBackend::Png;
    return AtScopeExit{
        [previous_backend]()
        {
            g_Cfg.m_Backend = previous_backend;
        }
    };
}

// Records drawn images, or fails the way a backend or OpenCV would
class TestPage : public PdfPage
{
  public:
    enum class Failure
    {
        None,
        OutOfMemory,
        EmbedFailed,
    };

    TestPage(Failure failure)
        : m_Failure{ failure }
    {
    }

    virtual void DrawSolidLine(LineData /*data*/, LineStyle /*style*/) override
    {
    }

    virtual void DrawImage(ImageData data) override
    {
        switch (m_Failure)
        {
        case Failure::OutOfMemory:
            throw cv::Exception{ cv::Error::StsNoMem, "Failed to allocate", "DrawImage", __FILE__, __LINE__ };
        case Failure::EmbedFailed:
            throw IoError{ "Failed embedding image" };
        case Failure::None:
            break;
        }

        m_Sizes.push_back(data.m_Size);
    }

    virtual void Finish() override
    {
    }

    std::vector<Size> m_Sizes;

  private:
    Failure m_Failure;
};

const Rect c_TestCell{
    .m_Position{ 10_mm, 10_mm },
    .m_Size{ 20_mm, 10_mm },
};
} // namespace

TEST_CASE("Generate pdf with a single page", "[pdf_single_page]")
{
    const fs::path dir{ MakeTestDir("pdf_single_page") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    const auto images{ WriteTestImages(dir, 12) };
    const fs::path output{ dir / "grid.pdf" };

    std::vector<int> reported;
    const auto result{
        GeneratePdf(images,
                    LowResolutionSettings(),
                    output,
                    [&reported](int percent)
                    {
                        reported.push_back(percent);
                    })
    };
    REQUIRE(result.has_value());
    REQUIRE(result.value() == output);
    REQUIRE(fs::exists(output));
    REQUIRE_FALSE(fs::exists(dir / ".grid.partial"));
    REQUIRE(PdfPageCount(output) == 1);

    REQUIRE(reported.front() == 0);
    REQUIRE(reported.back() == 100);
}

TEST_CASE("Overflowing images start a new page", "[pdf_multiple_pages]")
{
    const fs::path dir{ MakeTestDir("pdf_multiple_pages") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    GridSettings settings{ LowResolutionSettings() };
    settings.m_ColWidth = 50_mm;
    settings.m_RowHeight = 50_mm;

    // 15 cells per page
    const auto images{ WriteTestImages(dir, 16) };
    const fs::path output{ dir / "grid.pdf" };
    REQUIRE(GeneratePdf(images, settings, output, nullptr).has_value());
    REQUIRE(PdfPageCount(output) == 2);
}

TEST_CASE("Generate empty pdf", "[pdf_empty]")
{
    const fs::path dir{ MakeTestDir("pdf_empty") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    const fs::path output{ dir / "empty.pdf" };
    REQUIRE(GeneratePdf({}, LowResolutionSettings(), output, nullptr).has_value());
    REQUIRE(PdfPageCount(output) == 1);
}

TEST_CASE("Broken images are skipped", "[pdf_skip_broken]")
{
    const fs::path dir{ MakeTestDir("pdf_skip_broken") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    const std::vector<fs::path> images{
        WriteTestImage(dir, "first.png", 32, 32),
        WriteCorruptImage(dir, "broken.png"),
        dir / "missing.jpg",
        WriteTestImage(dir, "last.png", 32, 32),
    };
    const fs::path output{ dir / "grid.pdf" };
    REQUIRE(GeneratePdf(images, LowResolutionSettings(), output, nullptr).has_value());
    REQUIRE(fs::exists(output));
}

TEST_CASE("Stopped renders leave nothing behind", "[pdf_cancel]")
{
    const fs::path dir{ MakeTestDir("pdf_cancel") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    const auto images{ WriteTestImages(dir, 4) };
    const fs::path output{ dir / "grid.pdf" };

    SECTION("Stopped up front")
    {
        std::stop_source stop_source;
        stop_source.request_stop();
        REQUIRE_FALSE(GeneratePdf(images, LowResolutionSettings(), output, nullptr, stop_source.get_token()).has_value());
    }

    SECTION("Stopped halfway")
    {
        std::stop_source stop_source;
        const auto progress{
            [&stop_source](int percent)
            {
                if (percent >= 50)
                {
                    stop_source.request_stop();
                }
            }
        };
        REQUIRE_FALSE(GeneratePdf(images, LowResolutionSettings(), output, progress, stop_source.get_token()).has_value());
    }

    REQUIRE_FALSE(fs::exists(output));
    REQUIRE_FALSE(fs::exists(dir / ".grid.partial"));
}

TEST_CASE("Invalid inputs throw", "[pdf_errors]")
{
    const fs::path dir{ MakeTestDir("pdf_errors") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    SECTION("Invalid settings")
    {
        GridSettings settings{ LowResolutionSettings() };
        settings.m_ColWidth = 0_mm;
        REQUIRE_THROWS_AS(GeneratePdf({}, settings, dir / "grid.pdf", nullptr), ConfigError);
        REQUIRE_FALSE(fs::exists(dir / "grid.pdf"));
    }

    SECTION("Missing output folder")
    {
        REQUIRE_THROWS_AS(GeneratePdf({}, LowResolutionSettings(), dir / "nowhere" / "grid.pdf", nullptr), IoError);
    }
}

TEST_CASE("Png backend writes one file per page", "[pdf_png_backend]")
{
    const fs::path dir{ MakeTestDir("pdf_png_backend") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };
    const auto restore_backend{ UsePngBackend() };

    GridSettings settings{ LowResolutionSettings() };
    settings.m_ColWidth = 50_mm;
    settings.m_RowHeight = 50_mm;

    const auto images{ WriteTestImages(dir, 16) };
    const auto result{ GeneratePdf(images, settings, dir / "grid.pdf", nullptr) };
    REQUIRE(result.has_value());
    REQUIRE(result.value() == dir / "grid");
    REQUIRE(fs::is_directory(dir / "grid"));
    REQUIRE(fs::exists(dir / "grid" / "0.png"));
    REQUIRE(fs::exists(dir / "grid" / "1.png"));
    REQUIRE_FALSE(fs::exists(dir / "grid" / "2.png"));

    SECTION("Rendering again replaces the pages")
    {
        const std::vector<fs::path> single_page{ images.begin(), images.begin() + 3 };
        REQUIRE(GeneratePdf(single_page, settings, dir / "grid.pdf", nullptr).has_value());
        REQUIRE(fs::exists(dir / "grid" / "0.png"));
        REQUIRE_FALSE(fs::exists(dir / "grid" / "1.png"));
    }
}

TEST_CASE("Unrelated files are never replaced", "[pdf_keep_unrelated]")
{
    const fs::path dir{ MakeTestDir("pdf_keep_unrelated") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    const auto images{ WriteTestImages(dir, 2) };

    SECTION("Folder named like the png output")
    {
        const auto restore_backend{ UsePngBackend() };

        const fs::path user_folder{ dir / "grid" };
        fs::create_directories(user_folder);
        const fs::path user_file{ WriteTestImage(user_folder, "holiday.jpg", 8, 8) };
        const fs::path user_page{ WriteTestImage(user_folder, "0.png", 8, 8) };

        REQUIRE_THROWS_AS(GeneratePdf(images, LowResolutionSettings(), dir / "grid.pdf", nullptr), IoError);
        REQUIRE(fs::exists(user_file));
        REQUIRE(fs::exists(user_page));
    }

    SECTION("Folder named like the pdf output")
    {
        const fs::path user_folder{ dir / "grid.pdf" };
        fs::create_directories(user_folder);
        const fs::path user_file{ WriteTestImage(user_folder, "holiday.jpg", 8, 8) };

        REQUIRE_THROWS_AS(GeneratePdf(images, LowResolutionSettings(), user_folder, nullptr), IoError);
        REQUIRE(fs::exists(user_file));
    }

    SECTION("Folder named like the temporary output")
    {
        const fs::path user_folder{ dir / ".grid.partial" };
        fs::create_directories(user_folder);
        const fs::path user_file{ WriteTestImage(user_folder, "holiday.jpg", 8, 8) };

        REQUIRE(GeneratePdf(images, LowResolutionSettings(), dir / "grid.pdf", nullptr).has_value());
        REQUIRE(fs::exists(dir / "grid.pdf"));
        REQUIRE(fs::exists(user_file));
    }
}

TEST_CASE("Transparent images end up on white", "[pdf_alpha_on_white]")
{
    const fs::path dir{ MakeTestDir("pdf_alpha_on_white") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };
    const auto restore_backend{ UsePngBackend() };

    GridSettings settings{ LowResolutionSettings() };
    settings.m_ColWidth = 50_mm;
    settings.m_RowHeight = 50_mm;
    settings.m_GridLineVisible = false;

    const std::vector<fs::path> images{
        WriteTestImage(dir, "transparent.png", 32, 32, cv::Scalar{ 0, 0, 255, 0 }, CV_8UC4),
        WriteTestImage(dir, "opaque.png", 32, 32, cv::Scalar{ 0, 0, 255, 255 }, CV_8UC4),
    };
    const auto result{ GeneratePdf(images, settings, dir / "grid.pdf", nullptr) };
    REQUIRE(result.has_value());

    const cv::Mat page{ cv::imread((result.value() / "0.png").string(), cv::IMREAD_UNCHANGED) };
    REQUIRE(page.type() == CV_8UC3);

    // Cell centers at 35mm and 85mm from the left, 35mm from the top, at 72dpi
    const auto to_pixels{
        [](float millimeters)
        {
            return static_cast<int>(millimeters / 25.4f * 72.0f);
        }
    };
    REQUIRE(page.at<cv::Vec3b>(to_pixels(35.0f), to_pixels(35.0f)) == cv::Vec3b{ 255, 255, 255 });
    REQUIRE(page.at<cv::Vec3b>(to_pixels(35.0f), to_pixels(85.0f)) == cv::Vec3b{ 0, 0, 255 });
}

TEST_CASE("Failures while drawing a cell belong to its image", "[pdf_cell_failures]")
{
    const fs::path dir{ MakeTestDir("pdf_cell_failures") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    const fs::path image{ WriteTestImage(dir, "image.png", 40, 20) };

    SECTION("Drawn aspect-fit")
    {
        TestPage page{ TestPage::Failure::None };
        DrawCellImage(page, image, c_TestCell, 72_dpi);
        REQUIRE(page.m_Sizes.size() == 1);
        REQUIRE(page.m_Sizes[0].x / 1_mm > 19.99f);
        REQUIRE(page.m_Sizes[0].y / 1_mm > 9.99f);
    }

    SECTION("Out of memory")
    {
        TestPage page{ TestPage::Failure::OutOfMemory };
        try
        {
            DrawCellImage(page, image, c_TestCell, 72_dpi);
            FAIL("Drawing must throw");
        }
        catch (const ImageDecodeError& e)
        {
            REQUIRE(e.Source() == image);
        }
    }

    SECTION("Backend fails to embed")
    {
        TestPage page{ TestPage::Failure::EmbedFailed };
        REQUIRE_THROWS_AS(DrawCellImage(page, image, c_TestCell, 72_dpi), ImageDecodeError);
    }
}

TEST_CASE("Cmyk jpegs are only embedded when small enough", "[pdf_cmyk_pass_through]")
{
    const EncodedImage cmyk{ MakeJpegFrameHeader(4) };
    const EncodedImage rgb{ MakeJpegFrameHeader(3) };

    const PixelSize small{ 16_pix, 16_pix };
    const PixelSize large{ 4000_pix, 3000_pix };
    const PixelSize target{ 118_pix, 118_pix };

    REQUIRE(EmbedsOriginalData(cmyk, small, target));
    REQUIRE(EmbedsOriginalData(cmyk, target, target));
    REQUIRE_FALSE(EmbedsOriginalData(cmyk, large, target));
    REQUIRE_FALSE(EmbedsOriginalData(rgb, small, target));
}
