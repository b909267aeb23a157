#include <igm/config.hpp>

#include <algorithm>

#include <QFile>
#include <QSettings>

#include <magic_enum/magic_enum.hpp>

#include <igm/qt_util.hpp>

Config g_Cfg{ LoadConfig() };

PixelSize Config::ThumbnailBoundingBox() const
{
    return PixelSize{ m_ThumbnailSize, m_ThumbnailSize };
}

Config LoadConfig()
{
    Config config{};
    if (!QFile::exists("config.ini"))
    {
        SaveConfig(config);
        return config;
    }

    QSettings settings("config.ini", QSettings::IniFormat);
    if (settings.status() == QSettings::Status::NoError)
    {
        settings.beginGroup("DEFAULT");

        {
            const auto pdf_backend{ settings.value("PDF.Backend", "PoDoFo").toString().toStdString() };
            config.m_Backend = magic_enum::enum_cast<PdfBackend>(pdf_backend)
                                   .value_or(PdfBackend::PoDoFo);
        }

        {
            auto png_compression{ settings.value("PDF.Backend.Png.Compression") };
            if (png_compression.isValid())
            {
                config.m_PngCompression = std::clamp(png_compression.toInt(), 0, 9);
            }
        }

        config.m_DeterministicPdfOutput = settings.value("PDF.Deterministic", false).toBool();
        config.m_ThumbnailSize = std::clamp(settings.value("Thumbnail.Size", 200).toInt(), 16, 1024) * 1_pix;
        config.m_MaxWorkerThreads = std::max(settings.value("Max.Worker.Threads", 16).toUInt(), 1u);

        settings.endGroup();
    }

    return config;
}

void SaveConfig(Config config)
{
    QSettings settings("config.ini", QSettings::IniFormat);
    if (settings.status() == QSettings::Status::NoError)
    {
        settings.beginGroup("DEFAULT");

        settings.setValue("PDF.Backend", ToQString(magic_enum::enum_name(config.m_Backend)));
        if (config.m_PngCompression.has_value())
        {
            settings.setValue("PDF.Backend.Png.Compression", config.m_PngCompression.value());
        }
        else
        {
            settings.remove("PDF.Backend.Png.Compression");
        }
        settings.setValue("PDF.Deterministic", config.m_DeterministicPdfOutput);
        settings.setValue("Thumbnail.Size", static_cast<int>(config.m_ThumbnailSize / 1_pix));
        settings.setValue("Max.Worker.Threads", config.m_MaxWorkerThreads);

        settings.endGroup();
    }
    settings.sync();
}
