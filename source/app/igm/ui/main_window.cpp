#include <igm/ui/main_window.hpp>

#include <vector>

#include <QAction>
#include <QCloseEvent>
#include <QDragEnterEvent>
#include <QHBoxLayout>
#include <QMenuBar>
#include <QMessageBox>
#include <QMimeData>
#include <QSplitter>
#include <QStatusBar>
#include <QUrl>

#include <igm/app.hpp>
#include <igm/qt_util.hpp>
#include <igm/util/log.hpp>
#include <igm/version.hpp>

#include <igm/ui/popups.hpp>

namespace
{
std::vector<fs::path> DroppedImages(const QMimeData* mime_data)
{
    std::vector<fs::path> images{};
    if (mime_data->hasUrls())
    {
        for (const QUrl& url : mime_data->urls())
        {
            if (url.isLocalFile())
            {
                const auto path{ ToFsPath(url.toLocalFile()) };
                if (HasImageExtension(path))
                {
                    images.push_back(path);
                }
            }
        }
    }
    return images;
}
} // namespace

ImageGridMainWindow::ImageGridMainWindow(QWidget* image_list, QWidget* preview, QWidget* options)
{
    setWindowTitle("Image Grid Maker");
    setAcceptDrops(true);

    auto* splitter{ new QSplitter };
    splitter->addWidget(image_list);
    splitter->addWidget(preview);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 2);

    auto* window_layout{ new QHBoxLayout };
    window_layout->addWidget(splitter, 1);
    window_layout->addWidget(options);

    auto* window_area{ new QWidget };
    window_area->setLayout(window_layout);

    setCentralWidget(window_area);

    {
        auto* file_menu{ menuBar()->addMenu("&File") };

        auto* load_action{ file_menu->addAction("&Load Settings...") };
        auto* save_action{ file_menu->addAction("&Save Settings As...") };
        auto* reset_action{ file_menu->addAction("&Reset Settings") };
        file_menu->addSeparator();
        auto* exit_action{ file_menu->addAction("E&xit") };

        auto* help_menu{ menuBar()->addMenu("&Help") };
        auto* about_action{ help_menu->addAction("&About") };

        const auto load_settings{
            [this]()
            {
                auto& application{ *static_cast<ImageGridApplication*>(qApp) };
                if (const auto settings_path{ OpenSettingsDialog(application.GetSettingsPath(), FileDialogType::Open) })
                {
                    LoadSettingsRequested(settings_path.value());
                }
            }
        };

        const auto save_settings{
            [this]()
            {
                auto& application{ *static_cast<ImageGridApplication*>(qApp) };
                if (const auto settings_path{ OpenSettingsDialog(application.GetSettingsPath(), FileDialogType::Save) })
                {
                    SaveSettingsRequested(settings_path.value());
                }
            }
        };

        const auto reset_settings{
            [this]()
            {
                const auto choice{
                    QMessageBox::question(this,
                                          "Reset Settings",
                                          "Reset all grid settings to their defaults?")
                };
                if (choice == QMessageBox::StandardButton::Yes)
                {
                    ResetSettingsRequested();
                }
            }
        };

        QObject::connect(load_action, &QAction::triggered, this, load_settings);
        QObject::connect(save_action, &QAction::triggered, this, save_settings);
        QObject::connect(reset_action, &QAction::triggered, this, reset_settings);
        QObject::connect(exit_action, &QAction::triggered, this, &QMainWindow::close);
        QObject::connect(about_action, &QAction::triggered, this, &ImageGridMainWindow::OpenAboutPopup);
    }

    // Mirrors warnings and errors into the status bar, hooks run on whichever thread logged
    if (Log* main_log{ Log::GetInstance(Log::c_MainLogName) })
    {
        m_LogHook = main_log->InstallHook(
            [this](const Log::DetailInformation&, Log::LogLevel level, std::string_view message)
            {
                if (level == Log::LogLevel::Warning || level == Log::LogLevel::Error)
                {
                    QMetaObject::invokeMethod(
                        this,
                        [this, text = ToQString(message)]()
                        {
                            ShowStatus(text);
                        },
                        Qt::ConnectionType::QueuedConnection);
                }
            });
    }
}

ImageGridMainWindow::~ImageGridMainWindow()
{
    if (m_LogHook.has_value())
    {
        if (Log* main_log{ Log::GetInstance(Log::c_MainLogName) })
        {
            main_log->UninstallHook(m_LogHook.value());
        }
    }
}

void ImageGridMainWindow::OpenAboutPopup()
{
    QMessageBox::about(this,
                       "About Image Grid Maker",
                       QString{ "Image Grid Maker %1\nBuilt %2" }
                           .arg(ToQString(ImageGridVersion()))
                           .arg(ToQString(ImageGridBuildTime())));
}

void ImageGridMainWindow::closeEvent(QCloseEvent* event)
{
    if (isEnabled())
    {
        event->accept();
    }
    else
    {
        event->ignore();
    }
}

void ImageGridMainWindow::dragEnterEvent(QDragEnterEvent* event)
{
    // At least one valid image file in this
    if (!DroppedImages(event->mimeData()).empty())
    {
        event->acceptProposedAction();
    }

    QMainWindow::dragEnterEvent(event);
}

void ImageGridMainWindow::dropEvent(QDropEvent* event)
{
    for (const auto& image : DroppedImages(event->mimeData()))
    {
        ImageDropped(image);
    }

    QMainWindow::dropEvent(event);
}

void ImageGridMainWindow::ShowStatus(const QString& message)
{
    statusBar()->showMessage(message, 8000);
}
