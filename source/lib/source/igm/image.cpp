#include <igm/image.hpp>

#include <array>
#include <cstring>
#include <fstream>

#include <dla/scalar_math.h>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <QPixmap>

#include <igm/errors.hpp>

namespace pngcrc
{
static uint32_t CRC(std::span<const uchar> buf)
{
    static constexpr auto c_CrcTable{
        []()
        {
            std::array<uint32_t, 256> crc_table_bld{};
            for (uint32_t n = 0; n < 256; n++)
            {
                uint32_t c{ n };
                for (int32_t k = 0; k < 8; k++)
                {
                    c = (c & 1) ? 0xedb88320u ^ (c >> 1) : c >> 1;
                }
                crc_table_bld[n] = c;
            }
            return crc_table_bld;
        }()
    };

    uint32_t c{ 0xffffffffu };
    for (const uchar b : buf)
    {
        c = c_CrcTable[(c ^ b) & 0xff] ^ (c >> 8);
    }
    return c ^ 0xffffffffu;
}
} // namespace pngcrc

namespace
{
void PutBigEndian(std::span<uchar> out, uint32_t value)
{
    out[0] = static_cast<uchar>(value >> 24);
    out[1] = static_cast<uchar>(value >> 16);
    out[2] = static_cast<uchar>(value >> 8);
    out[3] = static_cast<uchar>(value);
}

uint16_t ReadBigEndian16(EncodedImageView buffer, size_t offset)
{
    return static_cast<uint16_t>((std::to_integer<uint16_t>(buffer[offset]) << 8) |
                                 std::to_integer<uint16_t>(buffer[offset + 1]));
}

std::vector<int> PngParams(std::optional<int32_t> compression)
{
    if (!compression.has_value())
    {
        return {};
    }

    return {
        cv::IMWRITE_PNG_COMPRESSION,
        compression.value(),
        cv::IMWRITE_PNG_STRATEGY,
        cv::IMWRITE_PNG_STRATEGY_DEFAULT,
    };
}

EncodedImage ToEncodedImage(const std::vector<uchar>& cv_buffer)
{
    EncodedImage out_buffer(cv_buffer.size(), std::byte{});
    std::memcpy(out_buffer.data(), cv_buffer.data(), cv_buffer.size());
    return out_buffer;
}
} // namespace

EncodedImage ReadEncodedImage(const fs::path& path)
{
    std::ifstream file{ path, std::ios::binary | std::ios::ate };
    if (!file)
    {
        throw ImageDecodeError{ path, "could not open file" };
    }

    const auto file_size{ static_cast<size_t>(file.tellg()) };
    file.seekg(0);

    EncodedImage buffer(file_size, std::byte{});
    if (!file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(file_size)))
    {
        throw ImageDecodeError{ path, "could not read file" };
    }
    return buffer;
}

bool IsCmykJpeg(EncodedImageView buffer)
{
    static constexpr auto c_IsMarker{
        [](EncodedImageView buffer, size_t offset, uint8_t marker)
        {
            return buffer[offset] == std::byte{ 0xff } && buffer[offset + 1] == std::byte{ marker };
        }
    };

    if (buffer.size() < 4 || !c_IsMarker(buffer, 0, 0xd8))
    {
        return false;
    }

    size_t offset{ 2 };
    while (offset + 4 <= buffer.size())
    {
        if (buffer[offset] != std::byte{ 0xff })
        {
            return false;
        }

        const auto marker{ std::to_integer<uint8_t>(buffer[offset + 1]) };
        if (marker == 0xff)
        {
            // Fill byte
            ++offset;
            continue;
        }

        // Markers without payload
        if (marker == 0x01 || (marker >= 0xd0 && marker <= 0xd7))
        {
            offset += 2;
            continue;
        }

        if (marker == 0xd9 || marker == 0xda)
        {
            // Reached scan data or end of image without a frame header
            return false;
        }

        const uint16_t segment_length{ ReadBigEndian16(buffer, offset + 2) };

        // SOF0 through SOF15, except DHT, JPG and DAC
        const bool is_frame_header{ marker >= 0xc0 && marker <= 0xcf && marker != 0xc4 && marker != 0xc8 && marker != 0xcc };
        if (is_frame_header)
        {
            // length(2) precision(1) height(2) width(2) components(1)
            const size_t components_offset{ offset + 2 + 7 };
            if (components_offset >= buffer.size())
            {
                return false;
            }
            return std::to_integer<uint8_t>(buffer[components_offset]) == 4;
        }

        offset += 2 + segment_length;
    }

    return false;
}

Image::Image(cv::Mat impl)
    : m_Impl{ std::move(impl) }
{
}

Image::~Image()
{
    Release();
}

Image::Image(Image&& rhs)
{
    *this = std::move(rhs);
}
Image::Image(const Image& rhs)
{
    *this = rhs;
}

Image& Image::operator=(Image&& rhs)
{
    m_Impl = std::move(rhs.m_Impl);
    return *this;
}
Image& Image::operator=(const Image& rhs)
{
    m_Impl = rhs.m_Impl.clone();
    return *this;
}

Image Image::Read(const fs::path& path)
{
    const EncodedImage buffer{ ReadEncodedImage(path) };
    Image img{ Decode(buffer) };
    if (!img.Valid())
    {
        throw ImageDecodeError{ path, "unsupported or corrupt image data" };
    }
    return img;
}

bool Image::Write(const fs::path& path, std::optional<int32_t> png_compression) const
{
    if (path.extension() == ".png")
    {
        return cv::imwrite(path.string(), m_Impl, PngParams(png_compression));
    }
    return cv::imwrite(path.string(), m_Impl);
}

bool Image::Write(const fs::path& path, std::optional<int32_t> png_compression, ::Size dimensions) const
{
    if (path.extension() != ".png")
    {
        return Write(path, png_compression);
    }

    std::vector<uchar> buf;
    if (!cv::imencode(".png", m_Impl, buf, PngParams(png_compression)))
    {
        return false;
    }

    // Squeeze in a pHYs chunk in front of the first IDAT chunk
    {
        size_t idat_idx{};
        for (size_t j = 4; j + 4 < buf.size(); j++)
        {
            if (std::memcmp(&buf[j], "IDAT", 4) == 0)
            {
                idat_idx = j - 4;
                break;
            }
        }

        if (idat_idx != 0)
        {
            const auto dots_per_meter{ static_cast<uint32_t>(Density(dimensions).value) };

            // size(4) name(4) data(9) crc(4)
            std::array<uchar, 21> phys_buf{};
            PutBigEndian(phys_buf, 9u);
            std::memcpy(phys_buf.data() + 4, "pHYs", 4);
            PutBigEndian(std::span{ phys_buf }.subspan(8), dots_per_meter);
            PutBigEndian(std::span{ phys_buf }.subspan(12), dots_per_meter);
            phys_buf[16] = 1; // unit is meter
            PutBigEndian(std::span{ phys_buf }.subspan(17), pngcrc::CRC(std::span{ phys_buf }.subspan(4, 13)));
            buf.insert(buf.begin() + idat_idx, phys_buf.begin(), phys_buf.end());
        }
    }

    if (std::ofstream file{ path, std::ios::binary })
    {
        file.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        return static_cast<bool>(file);
    }
    return false;
}

Image Image::Decode(EncodedImageView buffer)
{
    Image img{};
    if (buffer.empty())
    {
        return img;
    }

    const cv::Mat cv_buffer{ 1,
                             static_cast<int>(buffer.size()),
                             CV_8UC1,
                             const_cast<std::byte*>(buffer.data()) };
    try
    {
        img.m_Impl = cv::imdecode(cv_buffer, cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception&)
    {
        img.m_Impl = cv::Mat{};
    }
    return img;
}

EncodedImage Image::EncodePng(std::optional<int32_t> compression) const
{
    if (m_Impl.empty())
    {
        return {};
    }

    std::vector<uchar> cv_buffer;
    if (cv::imencode(".png", m_Impl, cv_buffer, PngParams(compression)))
    {
        return ToEncodedImage(cv_buffer);
    }
    return {};
}

EncodedImage Image::EncodeJpg(std::optional<int32_t> quality) const
{
    if (m_Impl.empty())
    {
        return {};
    }

    std::vector<int> jpg_params;
    if (quality.has_value())
    {
        jpg_params = {
            cv::IMWRITE_JPEG_QUALITY,
            quality.value(),
        };
    }

    std::vector<uchar> cv_buffer;
    if (cv::imencode(".jpg", m_Impl, cv_buffer, jpg_params))
    {
        return ToEncodedImage(cv_buffer);
    }
    return {};
}

QPixmap Image::StoreIntoQtPixmap() const
{
    const Image normalized{ NormalizeColor() };
    const cv::Mat& impl{ normalized.m_Impl };
    if (impl.empty())
    {
        return QPixmap{};
    }
    return QPixmap::fromImage(QImage(impl.ptr(), impl.cols, impl.rows, impl.step, QImage::Format_BGR888));
}

Image Image::MakePlaceholder(PixelSize size, const ColorRGB8& color)
{
    const int width{ std::max(static_cast<int>(size.x.value), 1) };
    const int height{ std::max(static_cast<int>(size.y.value), 1) };
    return Image{ cv::Mat{ height, width, CV_8UC3, cv::Scalar{ double(color.b), double(color.g), double(color.r) } } };
}

Image::operator bool() const
{
    return !m_Impl.empty();
}

bool Image::Valid() const
{
    return static_cast<bool>(*this);
}

bool Image::HasAlpha() const
{
    return m_Impl.channels() == 2 || m_Impl.channels() == 4;
}

Image Image::NormalizeColor() const
{
    if (m_Impl.empty())
    {
        return Image{};
    }

    cv::Mat eight_bit;
    switch (m_Impl.depth())
    {
    case CV_8U:
        eight_bit = m_Impl;
        break;
    case CV_16U:
        m_Impl.convertTo(eight_bit, CV_8U, 1.0 / 257.0);
        break;
    case CV_32F:
    case CV_64F:
        m_Impl.convertTo(eight_bit, CV_8U, 255.0);
        break;
    default:
        m_Impl.convertTo(eight_bit, CV_8U);
        break;
    }

    Image img{};
    switch (eight_bit.channels())
    {
    case 1:
        cv::cvtColor(eight_bit, img.m_Impl, cv::COLOR_GRAY2BGR);
        break;
    case 2:
    {
        std::vector<cv::Mat> gray_alpha;
        cv::split(eight_bit, gray_alpha);
        cv::Mat bgra;
        cv::merge(std::vector{ gray_alpha[0], gray_alpha[0], gray_alpha[0], gray_alpha[1] }, bgra);
        return Image{ std::move(bgra) }.FlattenAlpha(ColorRGB8{ 255, 255, 255 });
    }
    case 3:
        img.m_Impl = eight_bit.clone();
        break;
    case 4:
        return Image{ eight_bit }.FlattenAlpha(ColorRGB8{ 255, 255, 255 });
    default:
        break;
    }
    return img;
}

Image Image::FlattenAlpha(const ColorRGB8& background) const
{
    if (m_Impl.channels() != 4)
    {
        return *this;
    }

    std::vector<cv::Mat> channels;
    cv::split(m_Impl, channels);

    cv::Mat alpha;
    channels[3].convertTo(alpha, CV_32F, 1.0 / 255.0);
    cv::Mat alpha3;
    cv::merge(std::vector{ alpha, alpha, alpha }, alpha3);
    cv::Mat inv_alpha3;
    cv::subtract(cv::Scalar::all(1.0), alpha3, inv_alpha3);

    cv::Mat bgr;
    cv::merge(std::vector{ channels[0], channels[1], channels[2] }, bgr);
    cv::Mat bgr_f;
    bgr.convertTo(bgr_f, CV_32FC3);

    const cv::Mat backdrop{
        bgr.size(),
        CV_32FC3,
        cv::Scalar{ double(background.b), double(background.g), double(background.r) },
    };

    const cv::Mat blended{ bgr_f.mul(alpha3) + backdrop.mul(inv_alpha3) };

    Image img{};
    blended.convertTo(img.m_Impl, CV_8UC3);
    return img;
}

Image Image::Resize(PixelSize size) const
{
    Image img{};
    cv::resize(m_Impl, img.m_Impl, cv::Size(static_cast<int>(size.x.value), static_cast<int>(size.y.value)), cv::INTER_AREA);
    return img;
}

Image Image::FitWithin(PixelSize bounding_box) const
{
    const auto [w, h]{ Size().pod() };
    const auto [bw, bh]{ bounding_box.pod() };
    if (w <= bw && h <= bh)
    {
        return *this;
    }

    const float scale{ dla::math::min(bw / w, bh / h) };
    const PixelSize new_size{
        dla::math::max(dla::math::round(w * scale), 1_pix),
        dla::math::max(dla::math::round(h * scale), 1_pix),
    };
    return Resize(new_size);
}

Pixel Image::Width() const
{
    return Size().x;
}

Pixel Image::Height() const
{
    return Size().y;
}

PixelSize Image::Size() const
{
    return ::PixelSize{
        Pixel(static_cast<float>(m_Impl.cols)),
        Pixel(static_cast<float>(m_Impl.rows)),
    };
}

float Image::AspectRatio() const
{
    if (m_Impl.rows == 0)
    {
        return 1.0f;
    }
    return Width() / Height();
}

PixelDensity Image::Density(::Size real_size) const
{
    const auto [w, h]{ Size().pod() };
    const auto [bw, bh]{ real_size.pod() };
    return dla::math::min(w / bw, h / bh);
}

const cv::Mat& Image::GetUnderlying() const
{
    return m_Impl;
}

void Image::Release()
{
    m_Impl = cv::Mat{};
}
