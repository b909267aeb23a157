#include <igm/ui/widget_preview.hpp>

#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QPen>
#include <QProgressBar>
#include <QPushButton>
#include <QVBoxLayout>

#include <igm/constants.hpp>
#include <igm/errors.hpp>
#include <igm/grid_settings.hpp>
#include <igm/qt_util.hpp>

#include <igm/preview/synthesize.hpp>
#include <igm/work/grid_worker.hpp>

namespace
{
class PreviewCanvas : public QWidget
{
  public:
    PreviewCanvas(const PreviewWidget& preview)
        : m_Preview{ preview }
    {
        setMinimumSize(200, 250);
        setSizePolicy(QSizePolicy::Policy::Expanding, QSizePolicy::Policy::Expanding);
    }

    virtual void paintEvent(QPaintEvent* event) override
    {
        QWidget::paintEvent(event);

        QPainter painter{ this };
        painter.setRenderHint(QPainter::RenderHint::Antialiasing, true);
        painter.setRenderHint(QPainter::RenderHint::SmoothPixmapTransform, true);
        m_Preview.Paint(painter, size());
        painter.end();
    }

  private:
    const PreviewWidget& m_Preview;
};

QRectF ToQRectF(const PreviewRect& rect)
{
    return QRectF{
        rect.m_Position.x,
        rect.m_Position.y,
        rect.m_Size.x,
        rect.m_Size.y,
    };
}
} // namespace

PreviewWidget::PreviewWidget(const GridSettings& settings, GridWorker& worker)
    : m_Settings{ settings }
{
    setObjectName("Preview");

    m_Canvas = new PreviewCanvas{ *this };

    m_InfoLabel = new QLabel;
    m_InfoLabel->setAlignment(Qt::AlignmentFlag::AlignCenter);
    m_InfoLabel->setWordWrap(true);

    m_ThumbnailProgress = new QProgressBar;
    m_ThumbnailProgress->setToolTip("Thumbnail Progress");
    m_ThumbnailProgress->setTextVisible(false);
    m_ThumbnailProgress->setRange(0, c_ProgressBarResolution);
    m_CancelThumbnailsButton = new QPushButton{ "Cancel" };
    m_CancelThumbnailsButton->setToolTip("Stop loading thumbnails, the preview shows the empty grid");

    auto* thumbnail_row{ new QWidget };
    {
        auto* thumbnail_layout{ new QHBoxLayout };
        thumbnail_layout->addWidget(m_ThumbnailProgress, 1);
        thumbnail_layout->addWidget(m_CancelThumbnailsButton);
        thumbnail_layout->setContentsMargins(0, 0, 0, 0);
        thumbnail_row->setLayout(thumbnail_layout);
    }

    auto* layout{ new QVBoxLayout };
    layout->addWidget(m_Canvas, 1);
    layout->addWidget(m_InfoLabel);
    layout->addWidget(thumbnail_row);
    setLayout(layout);

    const auto thumbnails_stopped{
        [this]()
        {
            SetLoadingThumbnails(false);
        }
    };

    QObject::connect(m_CancelThumbnailsButton,
                     &QPushButton::clicked,
                     &worker,
                     &GridWorker::CancelThumbnails);
    QObject::connect(&worker,
                     &GridWorker::ThumbnailsProgress,
                     m_ThumbnailProgress,
                     &QProgressBar::setValue);
    QObject::connect(&worker,
                     &GridWorker::ThumbnailsFailed,
                     this,
                     thumbnails_stopped);
    QObject::connect(&worker,
                     &GridWorker::ThumbnailsCancelled,
                     this,
                     thumbnails_stopped);

    SetLoadingThumbnails(false);
    Recompute();
}

void PreviewWidget::Paint(QPainter& painter, QSize surface_size) const
{
    if (!m_Geometry.has_value())
    {
        return;
    }

    const dla::vec2 surface{
        static_cast<float>(surface_size.width()),
        static_cast<float>(surface_size.height()),
    };
    const auto commands{
        SynthesizePreview(m_ThumbnailSizes, m_Geometry.value(), m_Settings, surface)
    };
    if (commands.Empty())
    {
        return;
    }

    painter.fillRect(ToQRectF(commands.m_Page), Qt::GlobalColor::white);
    painter.setPen(QPen{ Qt::GlobalColor::darkGray, 1.0 });
    painter.drawRect(ToQRectF(commands.m_Page));

    {
        QPen margin_pen{ Qt::GlobalColor::lightGray, 1.0 };
        margin_pen.setStyle(Qt::PenStyle::DashLine);
        painter.setPen(margin_pen);
        painter.drawRect(ToQRectF(commands.m_Printable));
    }

    for (const auto& [index, rect] : commands.m_Images)
    {
        painter.drawPixmap(ToQRectF(rect), m_Thumbnails[index], QRectF{ m_Thumbnails[index].rect() });
    }

    if (!commands.m_GridLines.empty())
    {
        QPen grid_pen{ ToQColor(commands.m_GridColor), commands.m_GridPenWidth };
        grid_pen.setCapStyle(Qt::PenCapStyle::FlatCap);
        painter.setPen(grid_pen);
        for (const auto& [from, to] : commands.m_GridLines)
        {
            painter.drawLine(QPointF{ from.x, from.y }, QPointF{ to.x, to.y });
        }
    }
}

void PreviewWidget::ImagesChanged(size_t image_count)
{
    m_ImageCount = image_count;
    m_Thumbnails.clear();
    m_ThumbnailSizes.clear();
    SetLoadingThumbnails(image_count > 0);
    Recompute();
}

void PreviewWidget::ThumbnailsReady(const ThumbnailList& thumbnails)
{
    m_Thumbnails.clear();
    m_ThumbnailSizes.clear();
    m_Thumbnails.reserve(thumbnails.size());
    m_ThumbnailSizes.reserve(thumbnails.size());

    // Pixmaps may only be created on the gui thread
    for (const auto& thumbnail : thumbnails)
    {
        m_Thumbnails.push_back(thumbnail.StoreIntoQtPixmap());
        m_ThumbnailSizes.push_back(thumbnail.Size());
    }

    SetLoadingThumbnails(false);
    m_Canvas->update();
}

void PreviewWidget::SettingsChanged()
{
    Recompute();
}

void PreviewWidget::Recompute()
{
    try
    {
        m_Geometry = ComputeGeometry(m_Settings, m_ImageCount);
        if (m_ImageCount == 0)
        {
            m_InfoLabel->setText("Add images to fill the grid");
        }
        else
        {
            m_InfoLabel->setText(ToQString(PreviewInfoText(m_Geometry.value())));
        }
    }
    catch (const ConfigError& e)
    {
        m_Geometry.reset();
        m_InfoLabel->setText(ToQString(e.what()));
    }

    m_Canvas->update();
}

void PreviewWidget::SetLoadingThumbnails(bool loading)
{
    m_ThumbnailProgress->setValue(0);
    m_ThumbnailProgress->setVisible(loading);
    m_CancelThumbnailsButton->setVisible(loading);
}
