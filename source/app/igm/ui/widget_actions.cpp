#include <igm/ui/widget_actions.hpp>

#include <ranges>

#include <QGridLayout>
#include <QMessageBox>
#include <QProgressBar>
#include <QPushButton>

#include <igm/app.hpp>
#include <igm/constants.hpp>
#include <igm/qt_util.hpp>
#include <igm/util.hpp>
#include <igm/util/log.hpp>

#include <igm/work/grid_worker.hpp>

#include <igm/ui/popups.hpp>

ActionsWidget::ActionsWidget(GridWorker& worker)
{
    setObjectName("Actions");

    m_ProgressBar = new QProgressBar;
    m_ProgressBar->setToolTip("Render Progress");
    m_ProgressBar->setTextVisible(false);
    m_ProgressBar->setVisible(false);
    m_ProgressBar->setRange(0, c_ProgressBarResolution);
    m_RenderButton = new QPushButton{ "Render PDF" };
    m_CancelButton = new QPushButton{ "Cancel" };
    m_CancelButton->setEnabled(false);

    const QWidget* buttons[]{
        m_RenderButton,
        m_CancelButton,
    };

    auto widths{ buttons | std::views::transform([](const QWidget* widget)
                                                 { return widget->sizeHint().width(); }) };
    const int32_t minimum_width{ *std::ranges::max_element(widths) };

    auto* layout{ new QGridLayout };
    layout->setColumnMinimumWidth(0, minimum_width + 10);
    layout->setColumnMinimumWidth(1, minimum_width + 10);
    layout->addWidget(m_ProgressBar, 0, 0, 1, 2);
    layout->addWidget(m_RenderButton, 1, 0);
    layout->addWidget(m_CancelButton, 1, 1);
    setLayout(layout);

    const auto render{
        [this]()
        {
            auto& application{ *static_cast<ImageGridApplication*>(qApp) };
            if (const auto output{ OpenOutputDialog(application.GetOutputPath()) })
            {
                application.SetOutputPath(output.value());
                RenderRequested(output.value());
            }
        }
    };

    const auto render_started{
        [this, &worker]()
        {
            SetRendering(worker.IsRendering());
        }
    };

    const auto render_finished{
        [this](const fs::path& output)
        {
            SetRendering(false);
            LogInfo("Rendered {}", output.string());
            // The png backend writes a folder of pages
            const bool opened{ fs::is_directory(output) ? OpenFolder(output) : OpenFile(output) };
            if (!opened)
            {
                LogWarning("Could not open {} with the default viewer...", output.string());
            }
        }
    };

    const auto render_failed{
        [this](const QString& message)
        {
            SetRendering(false);
            QMessageBox::critical(window(),
                                  "PDF Rendering Error",
                                  QString{ "Failure while creating pdf:\n%1\n\nPlease make sure the file is not opened in another program." }
                                      .arg(message));
        }
    };

    const auto render_cancelled{
        [this]()
        {
            SetRendering(false);
            LogInfo("Rendering cancelled, no output was written");
        }
    };

    QObject::connect(m_RenderButton,
                     &QPushButton::clicked,
                     this,
                     render);
    QObject::connect(m_CancelButton,
                     &QPushButton::clicked,
                     &worker,
                     &GridWorker::CancelRender);

    // Queued so that the worker has already started when the buttons are updated
    QObject::connect(this,
                     &ActionsWidget::RenderRequested,
                     this,
                     render_started,
                     Qt::ConnectionType::QueuedConnection);

    QObject::connect(&worker,
                     &GridWorker::RenderProgress,
                     m_ProgressBar,
                     &QProgressBar::setValue);
    QObject::connect(&worker,
                     &GridWorker::RenderFinished,
                     this,
                     render_finished);
    QObject::connect(&worker,
                     &GridWorker::RenderFailed,
                     this,
                     render_failed);
    QObject::connect(&worker,
                     &GridWorker::RenderCancelled,
                     this,
                     render_cancelled);
}

void ActionsWidget::SetRendering(bool rendering)
{
    m_ProgressBar->setVisible(rendering);
    m_ProgressBar->setValue(0);
    m_RenderButton->setEnabled(!rendering);
    m_CancelButton->setEnabled(rendering);
}
