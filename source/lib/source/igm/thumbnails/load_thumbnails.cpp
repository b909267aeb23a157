#include <igm/thumbnails/load_thumbnails.hpp>

#include <igm/errors.hpp>
#include <igm/util/log.hpp>

Image LoadThumbnail(const fs::path& path, PixelSize bounding_box)
{
    try
    {
        return Image::Read(path)
            .NormalizeColor()
            .FitWithin(bounding_box);
    }
    catch (const ImageDecodeError& e)
    {
        LogError("Using placeholder thumbnail: {}", e.what());
        return Image::MakePlaceholder(bounding_box, c_PlaceholderColor);
    }
}

std::optional<std::vector<Image>> LoadThumbnails(std::span<const fs::path> paths,
                                                 PixelSize bounding_box,
                                                 const ProgressFn& progress,
                                                 std::stop_token stop_token)
{
    std::vector<Image> thumbnails;
    if (paths.empty())
    {
        return thumbnails;
    }

    thumbnails.reserve(paths.size());
    for (size_t i = 0; i < paths.size(); i++)
    {
        if (stop_token.stop_requested())
        {
            LogInfo("Thumbnail loading cancelled after {} of {} images...", i, paths.size());
            return std::nullopt;
        }

        thumbnails.push_back(LoadThumbnail(paths[i], bounding_box));

        if (progress)
        {
            progress(static_cast<int>((i + 1) * 100 / paths.size()));
        }
    }

    // A stop requested during the last image still discards the batch
    if (stop_token.stop_requested())
    {
        LogInfo("Thumbnail loading cancelled after {} of {} images...", paths.size(), paths.size());
        return std::nullopt;
    }

    return thumbnails;
}
