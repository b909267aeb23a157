#include <QApplication>
#include <QThreadPool>
#include <QVBoxLayout>

#include <igm/config.hpp>
#include <igm/errors.hpp>
#include <igm/grid_settings.hpp>

#include <igm/app.hpp>

#include <igm/util/log.hpp>

#include <igm/work/grid_worker.hpp>

#include <igm/ui/main_window.hpp>
#include <igm/ui/widget_actions.hpp>
#include <igm/ui/widget_grid_options.hpp>
#include <igm/ui/widget_image_list.hpp>
#include <igm/ui/widget_preview.hpp>

int main(int argc, char** argv)
{
    Log::RegisterThreadName("MainThread");

    LogFlags log_flags{
        LogFlags::Console |
        LogFlags::File |
        LogFlags::FatalQuit |
        LogFlags::DetailFile |
        LogFlags::DetailLine |
        LogFlags::DetailColumn |
        LogFlags::DetailThread |
        LogFlags::DetailStacktrace
    };
    Log main_log{ log_flags, Log::c_MainLogName };

    ImageGridApplication app{ argc, argv };

    QThreadPool::globalInstance()->setMaxThreadCount(static_cast<int>(g_Cfg.m_MaxWorkerThreads));

    GridSettings settings{};
    if (!settings.Load(app.GetSettingsPath()))
    {
        LogInfo("Using default grid settings...");
    }

    GridWorker worker{};

    auto* image_list{ new ImageListWidget };
    auto* preview{ new PreviewWidget{ settings, worker } };
    auto* grid_options{ new GridOptionsWidget{ settings } };
    auto* actions{ new ActionsWidget{ worker } };

    auto* options_area{ new QWidget };
    {
        auto* options_layout{ new QVBoxLayout };
        options_layout->addWidget(actions);
        options_layout->addWidget(grid_options, 1);
        options_layout->setContentsMargins(0, 0, 0, 0);
        options_area->setLayout(options_layout);
    }

    auto* main_window{
        new ImageGridMainWindow{
            image_list,
            preview,
            options_area,
        },
    };

    {
        QObject::connect(main_window, &ImageGridMainWindow::ImageDropped, image_list, &ImageListWidget::AddImage);
    }

    {
        // Every list change invalidates the thumbnails, the worker drops results of older batches
        QObject::connect(image_list,
                         &ImageListWidget::ImagesChanged,
                         preview,
                         [=, &worker]()
                         {
                             preview->ImagesChanged(image_list->ImageCount());
                             worker.StartThumbnails(image_list->Images(), g_Cfg.ThumbnailBoundingBox());
                         });
        QObject::connect(&worker, &GridWorker::ThumbnailsReady, preview, &PreviewWidget::ThumbnailsReady);
        QObject::connect(&worker,
                         &GridWorker::ThumbnailsFailed,
                         main_window,
                         [](const QString& message)
                         {
                             LogError("Failed loading thumbnails: {}", message.toStdString());
                         });

        QObject::connect(grid_options, &GridOptionsWidget::SettingsChanged, preview, &PreviewWidget::SettingsChanged);
    }

    {
        QObject::connect(actions,
                         &ActionsWidget::RenderRequested,
                         &worker,
                         [=, &worker, &settings](const fs::path& output)
                         {
                             worker.StartRender(image_list->Images(), settings, output);
                         });
    }

    {
        QObject::connect(main_window,
                         &ImageGridMainWindow::LoadSettingsRequested,
                         grid_options,
                         [=, &app, &settings](const fs::path& settings_path)
                         {
                             app.SetSettingsPath(settings_path);
                             if (!settings.Load(settings_path))
                             {
                                 LogWarning("Settings in {} were incomplete, see above...", settings_path.string());
                             }
                             grid_options->Refresh();
                         });
        QObject::connect(main_window,
                         &ImageGridMainWindow::SaveSettingsRequested,
                         grid_options,
                         [&app, &settings](const fs::path& settings_path)
                         {
                             try
                             {
                                 settings.Dump(settings_path);
                                 app.SetSettingsPath(settings_path);
                             }
                             catch (const IoError& e)
                             {
                                 LogError("{}", e.what());
                             }
                         });
        QObject::connect(main_window,
                         &ImageGridMainWindow::ResetSettingsRequested,
                         grid_options,
                         [=, &settings]()
                         {
                             settings = GridSettings{};
                             grid_options->Refresh();
                         });
    }

    app.SetMainWindow(main_window);
    main_window->show();

    const int return_code{ QApplication::exec() };

    worker.CancelThumbnails();
    worker.CancelRender();

    try
    {
        settings.Dump(app.GetSettingsPath());
    }
    catch (const IoError& e)
    {
        LogError("Failed saving grid settings on exit: {}", e.what());
    }

    return return_code;
}
