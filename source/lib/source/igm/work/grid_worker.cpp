#include <igm/work/grid_worker.hpp>

#include <QThread>

#include <igm/util/log.hpp>

GridWorker::GridWorker() = default;

GridWorker::~GridWorker()
{
    CancelThumbnails();
    CancelRender();
    WaitForThumbnails();
    WaitForRender();
}

void GridWorker::StartThumbnails(std::vector<fs::path> images, PixelSize bounding_box)
{
    // Bumped first so that the batch being replaced reports nothing
    const uint64_t generation{ ++m_Generation };

    CancelThumbnails();
    WaitForThumbnails();

    m_ThumbnailWork = std::make_unique<ThumbnailWork>(m_RunningThumbnailWork,
                                                      generation,
                                                      std::move(images),
                                                      bounding_box);

    QObject::connect(m_ThumbnailWork.get(),
                     &ThumbnailWork::Progress,
                     this,
                     [this, generation](int percent)
                     {
                         if (generation == m_Generation)
                         {
                             ThumbnailsProgress(percent);
                         }
                     });
    QObject::connect(m_ThumbnailWork.get(),
                     &ThumbnailWork::Finished,
                     this,
                     [this](uint64_t finished_generation, const ThumbnailList& thumbnails)
                     {
                         // A newer batch was started in the meantime
                         if (finished_generation != m_Generation || m_ThumbnailWork == nullptr)
                         {
                             LogDebug("Dropping stale thumbnails of generation {}...", finished_generation);
                             return;
                         }

                         // Cancelled after the last image was done
                         if (m_ThumbnailWork->CancelRequested())
                         {
                             LogDebug("Dropping cancelled thumbnails of generation {}...", finished_generation);
                             ThumbnailsCancelled();
                             return;
                         }

                         ThumbnailsReady(thumbnails);
                     });
    QObject::connect(m_ThumbnailWork.get(),
                     &ThumbnailWork::Failed,
                     this,
                     [this, generation](const QString& message)
                     {
                         if (generation == m_Generation)
                         {
                             ThumbnailsFailed(message);
                         }
                     });
    QObject::connect(m_ThumbnailWork.get(),
                     &ThumbnailWork::Cancelled,
                     this,
                     [this, generation]()
                     {
                         if (generation == m_Generation)
                         {
                             ThumbnailsCancelled();
                         }
                     });

    m_ThumbnailWork->Start();
}

void GridWorker::CancelThumbnails()
{
    if (m_ThumbnailWork != nullptr)
    {
        m_ThumbnailWork->Cancel();
    }
}

bool GridWorker::StartRender(std::vector<fs::path> images, GridSettings settings, fs::path output)
{
    if (m_Rendering)
    {
        LogWarning("Ignoring render request, a render is already in progress...");
        return false;
    }

    WaitForRender();

    m_Rendering = true;
    m_RenderWork = std::make_unique<RenderWork>(m_RunningRenderWork,
                                                std::move(images),
                                                std::move(settings),
                                                std::move(output));

    QObject::connect(m_RenderWork.get(),
                     &RenderWork::Progress,
                     this,
                     &GridWorker::RenderProgress);
    QObject::connect(m_RenderWork.get(),
                     &RenderWork::Finished,
                     this,
                     [this](const fs::path& output)
                     {
                         m_Rendering = false;
                         RenderFinished(output);
                     });
    QObject::connect(m_RenderWork.get(),
                     &RenderWork::Failed,
                     this,
                     [this](const QString& message)
                     {
                         m_Rendering = false;
                         RenderFailed(message);
                     });
    QObject::connect(m_RenderWork.get(),
                     &RenderWork::Cancelled,
                     this,
                     [this]()
                     {
                         m_Rendering = false;
                         RenderCancelled();
                     });

    m_RenderWork->Start();
    return true;
}

void GridWorker::CancelRender()
{
    if (m_RenderWork != nullptr)
    {
        m_RenderWork->Cancel();
    }
}

bool GridWorker::IsRendering() const
{
    return m_Rendering;
}

uint64_t GridWorker::CurrentGeneration() const
{
    return m_Generation;
}

void GridWorker::WaitForThumbnails()
{
    while (m_RunningThumbnailWork.load(std::memory_order_acquire))
    {
        QThread::yieldCurrentThread();
    }
}

void GridWorker::WaitForRender()
{
    while (m_RunningRenderWork.load(std::memory_order_acquire))
    {
        QThread::yieldCurrentThread();
    }
}
