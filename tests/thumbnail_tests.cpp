#include <catch2/catch_test_macros.hpp>

#include <stop_token>
#include <vector>

#include <igm/thumbnails/load_thumbnails.hpp>

#include <test_fixtures.hpp>

namespace
{
const PixelSize c_BoundingBox{ 32_pix, 32_pix };
} // namespace

TEST_CASE("Thumbnails fit the bounding box", "[thumbnails_load]")
{
    const fs::path dir{ MakeTestDir("thumbnails_load") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    const auto images{ WriteTestImages(dir, 3, 128, 64) };

    std::vector<int> reported;
    const auto progress{
        [&reported](int percent)
        {
            reported.push_back(percent);
        }
    };

    const auto thumbnails{ LoadThumbnails(images, c_BoundingBox, progress) };
    REQUIRE(thumbnails.has_value());
    REQUIRE(thumbnails->size() == 3);
    for (const Image& thumbnail : thumbnails.value())
    {
        REQUIRE(thumbnail.Width() == 32_pix);
        REQUIRE(thumbnail.Height() == 16_pix);
    }

    REQUIRE(reported.size() == 3);
    REQUIRE(reported.back() == 100);
}

TEST_CASE("Broken images get a placeholder", "[thumbnails_placeholder]")
{
    const fs::path dir{ MakeTestDir("thumbnails_placeholder") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    const std::vector<fs::path> images{
        WriteTestImage(dir, "good.png", 16, 16),
        WriteCorruptImage(dir, "bad.png"),
        dir / "missing.png",
    };

    const auto thumbnails{ LoadThumbnails(images, c_BoundingBox, nullptr) };
    REQUIRE(thumbnails.has_value());
    REQUIRE(thumbnails->size() == 3);

    REQUIRE(thumbnails->at(0).Width() == 16_pix);
    for (size_t i = 1; i < 3; i++)
    {
        REQUIRE(thumbnails->at(i).Width() == c_BoundingBox.x);
        REQUIRE(thumbnails->at(i).Height() == c_BoundingBox.y);
    }
}

TEST_CASE("No paths, no thumbnails", "[thumbnails_empty]")
{
    const auto thumbnails{ LoadThumbnails({}, c_BoundingBox, nullptr) };
    REQUIRE(thumbnails.has_value());
    REQUIRE(thumbnails->empty());
}

TEST_CASE("Stopping discards the batch", "[thumbnails_cancel]")
{
    const fs::path dir{ MakeTestDir("thumbnails_cancel") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    const auto images{ WriteTestImages(dir, 5) };

    SECTION("Stop while loading")
    {
        std::stop_source stop_source;
        int last_percent{ 0 };
        const auto progress{
            [&](int percent)
            {
                last_percent = percent;
                if (percent >= 40)
                {
                    stop_source.request_stop();
                }
            }
        };

        REQUIRE_FALSE(LoadThumbnails(images, c_BoundingBox, progress, stop_source.get_token()).has_value());
        REQUIRE(last_percent == 40);
    }

    SECTION("Stop on the last image")
    {
        std::stop_source stop_source;
        const auto progress{
            [&](int percent)
            {
                if (percent == 100)
                {
                    stop_source.request_stop();
                }
            }
        };

        REQUIRE_FALSE(LoadThumbnails(images, c_BoundingBox, progress, stop_source.get_token()).has_value());
    }
}
