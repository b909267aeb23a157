#pragma once

#include <atomic>
#include <cstdint>
#include <stop_token>
#include <vector>

#include <QObject>
#include <QRunnable>
#include <QString>

#include <igm/grid_settings.hpp>
#include <igm/image.hpp>
#include <igm/util.hpp>

using ThumbnailList = std::vector<Image>;

/*
        Base for long running work on the global thread pool

        Every run ends in exactly one of Finished, Failed or Cancelled. Cancellation is
        cooperative and observed once per image. Work items only ever see snapshots of
        the settings and the image list, copied when they are created.
*/
class GridWork : public QObject, public QRunnable
{
    Q_OBJECT

  public:
    GridWork(std::atomic_uint32_t& running_work);
    ~GridWork();

    void Start();
    void Cancel();

    bool CancelRequested() const;

  signals:
    void Progress(int percent) const;
    void Failed(const QString& message) const;
    void Cancelled() const;

  protected:
    std::stop_token StopToken() const;

    // Signals the end of run to whoever waits on the running counter
    void LeaveRun();

  private:
    std::atomic_uint32_t& m_RunningWork;
    std::atomic_bool m_Running{ false };
    std::stop_source m_StopSource;
};

class ThumbnailWork : public GridWork
{
    Q_OBJECT

  public:
    ThumbnailWork(std::atomic_uint32_t& running_work,
                  uint64_t generation,
                  std::vector<fs::path> images,
                  PixelSize bounding_box);

    virtual void run() override;

    uint64_t Generation() const;

  signals:
    void Finished(uint64_t generation, const ThumbnailList& thumbnails) const;

  private:
    uint64_t m_Generation;
    std::vector<fs::path> m_Images;
    PixelSize m_BoundingBox;
};

class RenderWork : public GridWork
{
    Q_OBJECT

  public:
    RenderWork(std::atomic_uint32_t& running_work,
               std::vector<fs::path> images,
               GridSettings settings,
               fs::path output);

    virtual void run() override;

  signals:
    void Finished(const fs::path& output) const;

  private:
    std::vector<fs::path> m_Images;
    GridSettings m_Settings;
    fs::path m_Output;
};
