#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <igm/image.hpp>
#include <igm/util.hpp>
#include <igm/util/at_scope_exit.hpp>

// Fresh, empty folder in the working directory of the tests
inline fs::path MakeTestDir(std::string_view name)
{
    const fs::path dir{ fs::path{ "test_data" } / name };
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline auto RemoveTestDirAtExit(fs::path dir)
{
    return AtScopeExit{
        [dir = std::move(dir)]()
        {
            fs::remove_all(dir);
        }
    };
}

// Solid color image, bgr is given in OpenCV channel order
inline fs::path WriteTestImage(const fs::path& dir,
                               std::string_view file_name,
                               int width,
                               int height,
                               cv::Scalar bgr = cv::Scalar{ 40, 120, 200 },
                               int type = CV_8UC3)
{
    const fs::path path{ dir / file_name };
    const cv::Mat image{ height, width, type, bgr };
    cv::imwrite(path.string(), image);
    return path;
}

inline std::vector<fs::path> WriteTestImages(const fs::path& dir, size_t count, int width = 64, int height = 48)
{
    std::vector<fs::path> images;
    images.reserve(count);
    for (size_t i = 0; i < count; i++)
    {
        images.push_back(WriteTestImage(dir, "image_" + std::to_string(i) + ".png", width, height));
    }
    return images;
}

// Has an image extension, but the content is not an image
inline fs::path WriteCorruptImage(const fs::path& dir, std::string_view file_name)
{
    const fs::path path{ dir / file_name };
    std::ofstream file{ path, std::ios::binary };
    file << "this is not an image at all";
    return path;
}

// SOI, a short APP0 and a baseline 16x16 frame header, scan data omitted
inline EncodedImage MakeJpegFrameHeader(uint8_t components)
{
    const std::vector<uint8_t> bytes{
        0xff, 0xd8,
        0xff, 0xe0, 0x00, 0x06, 'J', 'F', 'I', 'F',
        0xff, 0xc0, 0x00, static_cast<uint8_t>(8 + 3 * components), 0x08, 0x00, 0x10, 0x00, 0x10, components,
        0x01, 0x11, 0x00,
        0x02, 0x11, 0x00,
        0x03, 0x11, 0x00,
        0x04, 0x11, 0x00,
        0xff, 0xd9,
    };

    EncodedImage encoded;
    encoded.reserve(bytes.size());
    for (const uint8_t b : bytes)
    {
        encoded.push_back(std::byte{ b });
    }
    return encoded;
}
