#include <igm/work/grid_work.hpp>

#include <QThreadPool>

#include <igm/pdf/generate.hpp>
#include <igm/qt_util.hpp>
#include <igm/thumbnails/load_thumbnails.hpp>
#include <igm/util/at_scope_exit.hpp>
#include <igm/util/log.hpp>

GridWork::GridWork(std::atomic_uint32_t& running_work)
    : m_RunningWork{ running_work }
{
    setAutoDelete(false);
}

GridWork::~GridWork() = default;

void GridWork::Start()
{
    m_Running.store(true, std::memory_order_release);
    m_RunningWork.fetch_add(1, std::memory_order_release);
    QThreadPool::globalInstance()->start(this);
}

void GridWork::Cancel()
{
    m_StopSource.request_stop();

    // Never got to run, so nobody else will report the outcome
    if (QThreadPool::globalInstance()->tryTake(this))
    {
        Cancelled();
        LeaveRun();
    }
}

bool GridWork::CancelRequested() const
{
    return m_StopSource.stop_requested();
}

std::stop_token GridWork::StopToken() const
{
    return m_StopSource.get_token();
}

void GridWork::LeaveRun()
{
    if (m_Running.exchange(false, std::memory_order_acq_rel))
    {
        m_RunningWork.fetch_sub(1, std::memory_order_release);
    }
}

ThumbnailWork::ThumbnailWork(std::atomic_uint32_t& running_work,
                             uint64_t generation,
                             std::vector<fs::path> images,
                             PixelSize bounding_box)
    : GridWork{ running_work }
    , m_Generation{ generation }
    , m_Images{ std::move(images) }
    , m_BoundingBox{ bounding_box }
{
}

void ThumbnailWork::run()
{
    AtScopeExit leave_run{
        [this]()
        {
            LeaveRun();
        }
    };

    try
    {
        auto thumbnails{
            LoadThumbnails(m_Images,
                           m_BoundingBox,
                           [this](int percent)
                           {
                               Progress(percent);
                           },
                           StopToken())
        };

        if (!thumbnails.has_value())
        {
            Cancelled();
            return;
        }

        Finished(m_Generation, thumbnails.value());
    }
    catch (const std::exception& e)
    {
        LogError("Loading thumbnails failed: {}", e.what());
        Failed(ToQString(e.what()));
    }
}

uint64_t ThumbnailWork::Generation() const
{
    return m_Generation;
}

RenderWork::RenderWork(std::atomic_uint32_t& running_work,
                       std::vector<fs::path> images,
                       GridSettings settings,
                       fs::path output)
    : GridWork{ running_work }
    , m_Images{ std::move(images) }
    , m_Settings{ std::move(settings) }
    , m_Output{ std::move(output) }
{
}

void RenderWork::run()
{
    AtScopeExit leave_run{
        [this]()
        {
            LeaveRun();
        }
    };

    try
    {
        const auto written_path{
            GeneratePdf(m_Images,
                        m_Settings,
                        m_Output,
                        [this](int percent)
                        {
                            Progress(percent);
                        },
                        StopToken())
        };

        if (!written_path.has_value())
        {
            Cancelled();
            return;
        }

        Finished(written_path.value());
    }
    catch (const std::exception& e)
    {
        LogError("Rendering failed: {}", e.what());
        Failed(ToQString(e.what()));
    }
}
