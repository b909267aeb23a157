#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <opencv2/core/mat.hpp>

#include <igm/color.hpp>
#include <igm/util.hpp>

class QPixmap;

using EncodedImage = std::vector<std::byte>;
using EncodedImageView = std::span<const std::byte>;

// Raw file content, throws ImageDecodeError if the file can't be read
EncodedImage ReadEncodedImage(const fs::path& path);

// Looks at the frame header of a jpeg stream, false for anything that is not a jpeg
bool IsCmykJpeg(EncodedImageView buffer);

class [[nodiscard]] Image
{
  public:
    Image() = default;
    Image(cv::Mat impl);
    ~Image();

    Image(Image&& rhs);
    Image(const Image& rhs);

    Image& operator=(Image&& rhs);
    Image& operator=(const Image& rhs);

    // Throws ImageDecodeError on unreadable or corrupt files
    static Image Read(const fs::path& path);
    bool Write(const fs::path& path, std::optional<int32_t> png_compression = std::nullopt) const;
    // Png only, embeds the density that maps this image onto dimensions
    bool Write(const fs::path& path, std::optional<int32_t> png_compression, ::Size dimensions) const;

    // Returns an invalid image if the buffer can't be decoded
    static Image Decode(EncodedImageView buffer);

    EncodedImage EncodePng(std::optional<int32_t> compression = std::nullopt) const;
    EncodedImage EncodeJpg(std::optional<int32_t> quality = std::nullopt) const;

    QPixmap StoreIntoQtPixmap() const;

    static Image MakePlaceholder(PixelSize size, const ColorRGB8& color);

    explicit operator bool() const;
    bool Valid() const;

    bool HasAlpha() const;

    /*
            Converts any decoded layout into 8-bit, three channel BGR
            Alpha is composited onto white, grayscale is expanded
    */
    Image NormalizeColor() const;
    Image FlattenAlpha(const ColorRGB8& background) const;

    Image Resize(PixelSize size) const;
    // Shrinks to fit into bounding_box keeping the aspect ratio, never enlarges
    Image FitWithin(PixelSize bounding_box) const;

    Pixel Width() const;
    Pixel Height() const;
    PixelSize Size() const;
    float AspectRatio() const;
    PixelDensity Density(::Size real_size) const;

    const cv::Mat& GetUnderlying() const;

  private:
    void Release();

    cv::Mat m_Impl{};
};
