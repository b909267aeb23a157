#pragma once

#include <optional>
#include <span>
#include <stop_token>

#include <igm/util.hpp>

struct GridSettings;

/*
        Lays out all images in order and writes the document through the configured backend

        Returns the path that was written or std::nullopt if stop was requested, in which
        case nothing is left behind. Images that fail to decode are logged and leave their
        cell empty. Throws ConfigError for invalid settings and IoError if the output can't
        be written.
*/
std::optional<fs::path> GeneratePdf(std::span<const fs::path> images,
                                    const GridSettings& settings,
                                    const fs::path& output,
                                    const ProgressFn& progress,
                                    std::stop_token stop_token = {});
