#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include <QObject>
#include <QString>

#include <igm/grid_settings.hpp>
#include <igm/image.hpp>
#include <igm/util.hpp>

#include <igm/work/grid_work.hpp>

// Owns at most one thumbnail batch and one render at a time
class GridWorker : public QObject
{
    Q_OBJECT

  public:
    GridWorker();
    ~GridWorker();

    // Cancels and waits for a previous batch before starting
    void StartThumbnails(std::vector<fs::path> images, PixelSize bounding_box);
    void CancelThumbnails();

    // Returns false if a render is already in progress
    bool StartRender(std::vector<fs::path> images, GridSettings settings, fs::path output);
    void CancelRender();
    bool IsRendering() const;

    uint64_t CurrentGeneration() const;

  signals:
    void ThumbnailsProgress(int percent);
    void ThumbnailsReady(const ThumbnailList& thumbnails);
    void ThumbnailsFailed(const QString& message);
    // Only for the current batch, a batch replaced by a newer one ends silently
    void ThumbnailsCancelled();

    void RenderProgress(int percent);
    void RenderFinished(const fs::path& output);
    void RenderFailed(const QString& message);
    void RenderCancelled();

  private:
    void WaitForThumbnails();
    void WaitForRender();

    uint64_t m_Generation{ 0 };

    std::atomic_uint32_t m_RunningThumbnailWork{ 0 };
    std::unique_ptr<ThumbnailWork> m_ThumbnailWork;

    std::atomic_uint32_t m_RunningRenderWork{ 0 };
    std::unique_ptr<RenderWork> m_RenderWork;
    bool m_Rendering{ false };
};
