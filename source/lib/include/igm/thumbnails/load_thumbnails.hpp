#pragma once

#include <optional>
#include <span>
#include <stop_token>
#include <vector>

#include <igm/color.hpp>
#include <igm/image.hpp>
#include <igm/util.hpp>

inline const ColorRGB8 c_PlaceholderColor{ 200, 200, 200 };

// Decodes, normalizes and downsamples a single image, placeholder of bounding_box size if that fails
Image LoadThumbnail(const fs::path& path, PixelSize bounding_box);

/*
        One thumbnail per path, in order, reporting progress after every image
        Returns std::nullopt if stop was requested before the last image was done
*/
std::optional<std::vector<Image>> LoadThumbnails(std::span<const fs::path> paths,
                                                 PixelSize bounding_box,
                                                 const ProgressFn& progress,
                                                 std::stop_token stop_token = {});
