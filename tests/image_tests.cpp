#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <igm/errors.hpp>
#include <igm/image.hpp>

#include <test_fixtures.hpp>

namespace
{
cv::Vec3b PixelAt(const Image& image, int x, int y)
{
    return image.GetUnderlying().at<cv::Vec3b>(y, x);
}
} // namespace

TEST_CASE("Empty image is empty", "[image_empty]")
{
    const Image image{};
    REQUIRE_FALSE(image.Valid());
    REQUIRE(image.Width() == 0_pix);
    REQUIRE(image.Height() == 0_pix);
    REQUIRE_FALSE(Image::Decode(EncodedImageView{}).Valid());
}

TEST_CASE("Read image from disk", "[image_read]")
{
    const fs::path dir{ MakeTestDir("image_read") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    const fs::path path{ WriteTestImage(dir, "source.png", 248, 322) };
    const Image image{ Image::Read(path) };
    REQUIRE(image.Width() == 248_pix);
    REQUIRE(image.Height() == 322_pix);
    REQUIRE(image.GetUnderlying().channels() == 3);
}

TEST_CASE("Unreadable images raise decode errors", "[image_decode_error]")
{
    const fs::path dir{ MakeTestDir("image_decode_error") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    SECTION("Missing file")
    {
        const fs::path missing{ dir / "missing.png" };
        try
        {
            (void)Image::Read(missing);
            FAIL("Reading a missing file must throw");
        }
        catch (const ImageDecodeError& e)
        {
            REQUIRE(e.Source() == missing);
        }
    }

    SECTION("Corrupt file")
    {
        const fs::path corrupt{ WriteCorruptImage(dir, "corrupt.jpg") };
        REQUIRE_THROWS_AS(Image::Read(corrupt), ImageDecodeError);
    }
}

TEST_CASE("Alpha is composited onto white", "[image_flatten_alpha]")
{
    cv::Mat bgra{ 4, 4, CV_8UC4, cv::Scalar{ 0, 0, 255, 255 } };
    for (int y = 0; y < 4; y++)
    {
        bgra.at<cv::Vec4b>(y, 0) = cv::Vec4b{ 0, 0, 255, 0 };
        bgra.at<cv::Vec4b>(y, 1) = cv::Vec4b{ 0, 0, 0, 128 };
    }

    const Image normalized{ Image{ bgra }.NormalizeColor() };
    REQUIRE(normalized.GetUnderlying().type() == CV_8UC3);
    REQUIRE_FALSE(normalized.HasAlpha());

    // Fully transparent
    REQUIRE(PixelAt(normalized, 0, 0) == cv::Vec3b{ 255, 255, 255 });

    // Half transparent black turns gray
    const cv::Vec3b half{ PixelAt(normalized, 1, 0) };
    REQUIRE(half[0] > 100);
    REQUIRE(half[0] < 155);

    // Opaque keeps its color
    REQUIRE(PixelAt(normalized, 3, 3) == cv::Vec3b{ 0, 0, 255 });
}

TEST_CASE("Gray with alpha counts as alpha-bearing", "[image_gray_alpha]")
{
    cv::Mat gray_alpha{ 2, 2, CV_8UC2, cv::Scalar{ 0, 0 } };
    const Image normalized{ Image{ gray_alpha }.NormalizeColor() };
    REQUIRE(normalized.GetUnderlying().type() == CV_8UC3);
    REQUIRE(PixelAt(normalized, 1, 1) == cv::Vec3b{ 255, 255, 255 });
}

TEST_CASE("Other layouts become 8-bit bgr", "[image_normalize]")
{
    SECTION("Grayscale")
    {
        const Image gray{ cv::Mat{ 3, 5, CV_8UC1, cv::Scalar{ 77 } } };
        const Image normalized{ gray.NormalizeColor() };
        REQUIRE(normalized.GetUnderlying().type() == CV_8UC3);
        REQUIRE(PixelAt(normalized, 2, 1) == cv::Vec3b{ 77, 77, 77 });
    }

    SECTION("16-bit")
    {
        const Image deep{ cv::Mat{ 3, 5, CV_16UC3, cv::Scalar{ 65535, 0, 257 * 10 } } };
        const Image normalized{ deep.NormalizeColor() };
        REQUIRE(normalized.GetUnderlying().type() == CV_8UC3);
        REQUIRE(PixelAt(normalized, 0, 0) == cv::Vec3b{ 255, 0, 10 });
    }
}

TEST_CASE("Fitting only ever shrinks", "[image_fit_within]")
{
    const Image wide{ cv::Mat{ 200, 400, CV_8UC3, cv::Scalar::all(0) } };
    const Image fitted{ wide.FitWithin(PixelSize{ 100_pix, 100_pix }) };
    REQUIRE(fitted.Width() == 100_pix);
    REQUIRE(fitted.Height() == 50_pix);

    const Image small{ cv::Mat{ 20, 50, CV_8UC3, cv::Scalar::all(0) } };
    const Image not_enlarged{ small.FitWithin(PixelSize{ 100_pix, 100_pix }) };
    REQUIRE(not_enlarged.Width() == 50_pix);
    REQUIRE(not_enlarged.Height() == 20_pix);
}

TEST_CASE("Placeholder matches the requested size", "[image_placeholder]")
{
    const Image placeholder{ Image::MakePlaceholder(PixelSize{ 200_pix, 120_pix }, ColorRGB8{ 200, 150, 100 }) };
    REQUIRE(placeholder.Width() == 200_pix);
    REQUIRE(placeholder.Height() == 120_pix);
    REQUIRE(PixelAt(placeholder, 10, 10) == cv::Vec3b{ 100, 150, 200 });
}

TEST_CASE("Detect cmyk jpegs from their frame header", "[image_cmyk_detection]")
{
    REQUIRE(IsCmykJpeg(MakeJpegFrameHeader(4)));
    REQUIRE_FALSE(IsCmykJpeg(MakeJpegFrameHeader(3)));
    REQUIRE_FALSE(IsCmykJpeg(MakeJpegFrameHeader(1)));

    const Image rgb{ cv::Mat{ 8, 8, CV_8UC3, cv::Scalar{ 10, 20, 30 } } };
    REQUIRE_FALSE(IsCmykJpeg(rgb.EncodeJpg()));
    REQUIRE_FALSE(IsCmykJpeg(rgb.EncodePng()));

    const EncodedImage truncated{ std::byte{ 0xff }, std::byte{ 0xd8 }, std::byte{ 0xff } };
    REQUIRE_FALSE(IsCmykJpeg(truncated));
    REQUIRE_FALSE(IsCmykJpeg(EncodedImageView{}));
}

TEST_CASE("Encoded images decode again", "[image_encode]")
{
    const Image source{ cv::Mat{ 16, 32, CV_8UC3, cv::Scalar{ 10, 20, 30 } } };
    const Image decoded{ Image::Decode(source.EncodePng()) };
    REQUIRE(decoded.Valid());
    REQUIRE(decoded.Width() == 32_pix);
    REQUIRE(decoded.Height() == 16_pix);
}
