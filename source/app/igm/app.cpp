#include <igm/app.hpp>

#include <QMainWindow>
#include <QSettings>

#include <igm/qt_util.hpp>
#include <igm/version.hpp>

ImageGridApplication::ImageGridApplication(int& argc, char** argv)
    : QApplication(argc, argv)
{
    Load();
}

ImageGridApplication::~ImageGridApplication()
{
    Save();
}

void ImageGridApplication::SetMainWindow(QMainWindow* main_window)
{
    m_MainWindow = main_window;

    if (m_WindowGeometry.has_value())
    {
        m_MainWindow->restoreGeometry(m_WindowGeometry.value());
        m_WindowGeometry.reset();
    }

    if (m_WindowState.has_value())
    {
        m_MainWindow->restoreState(m_WindowState.value());
        m_WindowState.reset();
    }
}
QMainWindow* ImageGridApplication::GetMainWindow() const
{
    return m_MainWindow;
}

void ImageGridApplication::SetSettingsPath(fs::path settings_path)
{
    m_SettingsPath = std::move(settings_path);
}
const fs::path& ImageGridApplication::GetSettingsPath() const
{
    return m_SettingsPath;
}

void ImageGridApplication::SetOutputPath(fs::path output_path)
{
    m_OutputPath = std::move(output_path);
}
const fs::path& ImageGridApplication::GetOutputPath() const
{
    return m_OutputPath;
}

void ImageGridApplication::Load()
{
    QSettings settings{ "Image Grid", "Image Grid Maker" };
    if (settings.contains("version"))
    {
        m_WindowGeometry.emplace() = settings.value("geometry").toByteArray();
        m_WindowState.emplace() = settings.value("state").toByteArray();

        if (settings.contains("settings_json"))
        {
            m_SettingsPath = ToFsPath(settings.value("settings_json").toString());
        }
        if (settings.contains("output"))
        {
            m_OutputPath = ToFsPath(settings.value("output").toString());
        }
    }
}
void ImageGridApplication::Save() const
{
    QSettings settings{ "Image Grid", "Image Grid Maker" };
    settings.setValue("version", ToQString(ImageGridVersion()));
    if (m_MainWindow != nullptr)
    {
        settings.setValue("geometry", m_MainWindow->saveGeometry());
        settings.setValue("state", m_MainWindow->saveState());
    }
    settings.setValue("settings_json", ToQString(m_SettingsPath));
    settings.setValue("output", ToQString(m_OutputPath));
}
