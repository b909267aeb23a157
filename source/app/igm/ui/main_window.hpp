#pragma once

#include <cstdint>
#include <optional>

#include <QMainWindow>

#include <igm/util.hpp>

class ImageGridMainWindow : public QMainWindow
{
    Q_OBJECT

  public:
    ImageGridMainWindow(QWidget* image_list, QWidget* preview, QWidget* options);
    ~ImageGridMainWindow();

    void OpenAboutPopup();

    virtual void closeEvent(QCloseEvent* event) override;

    virtual void dragEnterEvent(QDragEnterEvent* event) override;
    virtual void dropEvent(QDropEvent* event) override;

  signals:
    void ImageDropped(const fs::path& absolute_image_path) const;

    void LoadSettingsRequested(const fs::path& settings_path) const;
    void SaveSettingsRequested(const fs::path& settings_path) const;
    void ResetSettingsRequested() const;

  private:
    void ShowStatus(const QString& message);

    std::optional<uint32_t> m_LogHook{};
};
