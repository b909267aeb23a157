#include <igm/pdf/draw_cell.hpp>

#include <opencv2/core.hpp>

#include <igm/errors.hpp>
#include <igm/util/log.hpp>

#include <igm/pdf/backend.hpp>

namespace
{
dla::vec2 ToMillimeters(Size size)
{
    return dla::vec2{ size.x / 1_mm, size.y / 1_mm };
}

Size FromMillimeters(dla::vec2 size)
{
    return Size{ size.x * 1_mm, size.y * 1_mm };
}
} // namespace

bool EmbedsOriginalData(EncodedImageView encoded, PixelSize source_size, PixelSize target_size)
{
    return IsCmykJpeg(encoded) &&
           source_size.x <= target_size.x &&
           source_size.y <= target_size.y;
}

void DrawCellImage(PdfPage& page,
                   const fs::path& image_path,
                   const Rect& cell,
                   PixelDensity output_dpi)
{
    const EncodedImage encoded{ ReadEncodedImage(image_path) };

    try
    {
        const Image decoded{ Image::Decode(encoded) };
        if (!decoded.Valid())
        {
            throw ImageDecodeError{ image_path, "unsupported or corrupt image data" };
        }

        const PixelSize target_size{ ComputeTargetPixelSize(cell.m_Size, output_dpi) };
        const bool pass_through{ EmbedsOriginalData(encoded, decoded.Size(), target_size) };
        if (!pass_through && IsCmykJpeg(encoded))
        {
            LogInfo("Converting {} to rgb, it is larger than its cell at the output resolution...", image_path.string());
        }

        const Image prepared{
            pass_through
                ? decoded.NormalizeColor()
                : decoded.NormalizeColor().FitWithin(target_size)
        };

        const auto [image_width, image_height]{ decoded.Size().pod() };
        const FitRect fit{
            ComputeAspectFit(ToMillimeters(cell.m_Size),
                             dla::vec2{ image_width / 1_pix, image_height / 1_pix })
        };

        page.DrawImage(PdfPage::ImageData{
            .m_Image{ prepared },
            .m_PassThrough{ pass_through ? EncodedImageView{ encoded } : EncodedImageView{} },
            .m_Pos{ cell.m_Position + FromMillimeters(fit.m_Offset) },
            .m_Size{ FromMillimeters(fit.m_Size) },
        });
    }
    catch (const cv::Exception& e)
    {
        throw ImageDecodeError{ image_path, e.what() };
    }
    catch (const IoError& e)
    {
        throw ImageDecodeError{ image_path, e.what() };
    }
}
