#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <optional>
#include <vector>

#include <QCoreApplication>
#include <QEventLoop>
#include <QThread>
#include <QTimer>

#include <igm/work/grid_work.hpp>
#include <igm/work/grid_worker.hpp>

#include <test_fixtures.hpp>

namespace
{
const PixelSize c_BoundingBox{ 16_pix, 16_pix };

struct Outcome
{
    std::atomic_int m_Finished{ 0 };
    std::atomic_int m_Failed{ 0 };
    std::atomic_int m_Cancelled{ 0 };

    int Total() const
    {
        return m_Finished + m_Failed + m_Cancelled;
    }
};

void TrackOutcome(GridWork& work, Outcome& outcome)
{
    QObject::connect(
        &work,
        &GridWork::Failed,
        &work,
        [&outcome](const QString&)
        {
            ++outcome.m_Failed;
        },
        Qt::DirectConnection);
    QObject::connect(
        &work,
        &GridWork::Cancelled,
        &work,
        [&outcome]()
        {
            ++outcome.m_Cancelled;
        },
        Qt::DirectConnection);
}

void WaitForRunningWork(const std::atomic_uint32_t& running_work)
{
    while (running_work.load(std::memory_order_acquire) != 0)
    {
        QThread::yieldCurrentThread();
    }
}
} // namespace

TEST_CASE("Thumbnail work reports its generation", "[work_thumbnails]")
{
    const fs::path dir{ MakeTestDir("work_thumbnails") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    std::atomic_uint32_t running_work{ 0 };
    ThumbnailWork work{ running_work, 7, WriteTestImages(dir, 3), c_BoundingBox };

    Outcome outcome;
    TrackOutcome(work, outcome);

    uint64_t finished_generation{ 0 };
    size_t thumbnail_count{ 0 };
    QObject::connect(
        &work,
        &ThumbnailWork::Finished,
        &work,
        [&](uint64_t generation, const ThumbnailList& thumbnails)
        {
            finished_generation = generation;
            thumbnail_count = thumbnails.size();
            ++outcome.m_Finished;
        },
        Qt::DirectConnection);

    work.Start();
    WaitForRunningWork(running_work);

    REQUIRE(outcome.Total() == 1);
    REQUIRE(outcome.m_Finished == 1);
    REQUIRE(finished_generation == 7);
    REQUIRE(thumbnail_count == 3);
}

TEST_CASE("Cancelled work ends exactly once", "[work_cancel]")
{
    const fs::path dir{ MakeTestDir("work_cancel") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    std::atomic_uint32_t running_work{ 0 };
    RenderWork work{ running_work, WriteTestImages(dir, 4), GridSettings{}, dir / "grid.pdf" };

    Outcome outcome;
    TrackOutcome(work, outcome);
    QObject::connect(
        &work,
        &RenderWork::Finished,
        &work,
        [&outcome](const fs::path&)
        {
            ++outcome.m_Finished;
        },
        Qt::DirectConnection);

    work.Cancel();
    REQUIRE(work.CancelRequested());

    work.run();
    REQUIRE(outcome.Total() == 1);
    REQUIRE(outcome.m_Cancelled == 1);
    REQUIRE(running_work == 0);
    REQUIRE_FALSE(fs::exists(dir / "grid.pdf"));
}

TEST_CASE("Render work reports failures", "[work_render_failed]")
{
    const fs::path dir{ MakeTestDir("work_render_failed") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    GridSettings settings{};
    settings.m_RowHeight = 0_mm;

    std::atomic_uint32_t running_work{ 0 };
    RenderWork work{ running_work, WriteTestImages(dir, 1), settings, dir / "grid.pdf" };

    Outcome outcome;
    TrackOutcome(work, outcome);

    work.Start();
    WaitForRunningWork(running_work);

    REQUIRE(outcome.Total() == 1);
    REQUIRE(outcome.m_Failed == 1);
}

TEST_CASE("Worker renders and drops stale thumbnails", "[worker_signals]")
{
    int argc{ 1 };
    char app_name[]{ "image_grid_tests" };
    char* argv[]{ app_name, nullptr };
    QCoreApplication app{ argc, argv };

    const fs::path dir{ MakeTestDir("worker_signals") };
    const auto cleanup{ RemoveTestDirAtExit(dir) };

    const auto images{ WriteTestImages(dir, 6) };

    GridWorker worker{};
    QEventLoop loop{};
    QTimer timeout{};
    timeout.setSingleShot(true);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    SECTION("Thumbnails")
    {
        std::vector<size_t> ready_sizes;
        QObject::connect(&worker,
                         &GridWorker::ThumbnailsReady,
                         &loop,
                         [&](const ThumbnailList& thumbnails)
                         {
                             ready_sizes.push_back(thumbnails.size());
                             loop.quit();
                         });

        worker.StartThumbnails(images, c_BoundingBox);
        worker.StartThumbnails(std::vector<fs::path>(images.begin(), images.begin() + 2), c_BoundingBox);
        REQUIRE(worker.CurrentGeneration() == 2);

        timeout.start(10000);
        loop.exec();

        // Let any result of the first batch arrive
        QCoreApplication::processEvents();

        REQUIRE(ready_sizes.size() == 1);
        REQUIRE(ready_sizes.front() == 2);
    }

    SECTION("Thumbnail progress")
    {
        std::vector<int> reported;
        QObject::connect(&worker,
                         &GridWorker::ThumbnailsProgress,
                         &loop,
                         [&reported](int percent)
                         {
                             reported.push_back(percent);
                         });
        QObject::connect(&worker,
                         &GridWorker::ThumbnailsReady,
                         &loop,
                         &QEventLoop::quit);

        worker.StartThumbnails(images, c_BoundingBox);

        timeout.start(10000);
        loop.exec();

        REQUIRE(reported.size() == images.size());
        REQUIRE(std::ranges::is_sorted(reported));
        REQUIRE(reported.back() == 100);
    }

    SECTION("Cancel thumbnails")
    {
        int cancelled{ 0 };
        int ready{ 0 };
        QObject::connect(&worker,
                         &GridWorker::ThumbnailsCancelled,
                         &loop,
                         [&]()
                         {
                             ++cancelled;
                             loop.quit();
                         });
        QObject::connect(&worker,
                         &GridWorker::ThumbnailsReady,
                         &loop,
                         [&](const ThumbnailList&)
                         {
                             ++ready;
                             loop.quit();
                         });

        worker.StartThumbnails(images, c_BoundingBox);
        worker.CancelThumbnails();

        // Cancelling before the batch was picked up reports right away
        if (cancelled == 0)
        {
            timeout.start(10000);
            loop.exec();
        }
        QCoreApplication::processEvents();

        REQUIRE(cancelled == 1);
        REQUIRE(ready == 0);
    }

    SECTION("Render")
    {
        std::optional<fs::path> finished;
        QObject::connect(&worker,
                         &GridWorker::RenderFinished,
                         &loop,
                         [&](const fs::path& output)
                         {
                             finished = output;
                             loop.quit();
                         });

        GridSettings settings{};
        settings.m_OutputDpi = 72_dpi;

        REQUIRE(worker.StartRender(images, settings, dir / "grid.pdf"));
        REQUIRE(worker.IsRendering());
        REQUIRE_FALSE(worker.StartRender(images, settings, dir / "other.pdf"));

        timeout.start(30000);
        loop.exec();

        REQUIRE(finished.has_value());
        REQUIRE(finished.value() == dir / "grid.pdf");
        REQUIRE_FALSE(worker.IsRendering());
        REQUIRE(fs::exists(dir / "grid.pdf"));
        REQUIRE_FALSE(fs::exists(dir / "other.pdf"));
    }
}
