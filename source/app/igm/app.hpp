#pragma once

#include <optional>

#include <QApplication>
#include <QByteArray>

#include <igm/constants.hpp>
#include <igm/util.hpp>

class QMainWindow;

class ImageGridApplication : public QApplication
{
  public:
    ImageGridApplication(int& argc, char** argv);
    ~ImageGridApplication();

    void SetMainWindow(QMainWindow* main_window);
    QMainWindow* GetMainWindow() const;

    void SetSettingsPath(fs::path settings_path);
    const fs::path& GetSettingsPath() const;

    void SetOutputPath(fs::path output_path);
    const fs::path& GetOutputPath() const;

  private:
    void Load();
    void Save() const;

    QMainWindow* m_MainWindow{ nullptr };

    fs::path m_SettingsPath{ cwd() / c_DefaultSettingsFile };
    fs::path m_OutputPath{ cwd() / c_DefaultOutputFile };

    std::optional<QByteArray> m_WindowGeometry{};
    std::optional<QByteArray> m_WindowState{};
};
