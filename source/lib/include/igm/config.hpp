#pragma once

#include <cstdint>
#include <optional>

#include <igm/typedefs.hpp>
#include <igm/util.hpp>

struct Config
{
    PdfBackend m_Backend{ PdfBackend::PoDoFo };
    std::optional<int> m_PngCompression{ std::nullopt };
    bool m_DeterministicPdfOutput{ false };
    Pixel m_ThumbnailSize{ 200_pix };
    uint32_t m_MaxWorkerThreads{ 16 };

    PixelSize ThumbnailBoundingBox() const;
};

Config LoadConfig();
void SaveConfig(Config config);

extern Config g_Cfg;
