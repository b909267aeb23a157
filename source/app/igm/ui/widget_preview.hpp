#pragma once

#include <optional>
#include <vector>

#include <QPixmap>
#include <QWidget>

#include <igm/layout/grid_layout.hpp>
#include <igm/util.hpp>

#include <igm/work/grid_work.hpp>

class QLabel;
class QPainter;
class QProgressBar;
class QPushButton;

class GridWorker;
struct GridSettings;

// First page of the current layout plus an info line and thumbnail progress below it
class PreviewWidget : public QWidget
{
    Q_OBJECT

  public:
    PreviewWidget(const GridSettings& settings, GridWorker& worker);

    void Paint(QPainter& painter, QSize surface_size) const;

  public slots:
    // Thumbnails of the previous list no longer apply and are dropped
    void ImagesChanged(size_t image_count);
    void ThumbnailsReady(const ThumbnailList& thumbnails);
    void SettingsChanged();

  private:
    void Recompute();
    void SetLoadingThumbnails(bool loading);

    const GridSettings& m_Settings;

    size_t m_ImageCount{ 0 };
    std::optional<LayoutGeometry> m_Geometry{};

    std::vector<QPixmap> m_Thumbnails;
    std::vector<PixelSize> m_ThumbnailSizes;

    QWidget* m_Canvas;
    QLabel* m_InfoLabel;
    QProgressBar* m_ThumbnailProgress;
    QPushButton* m_CancelThumbnailsButton;
};
