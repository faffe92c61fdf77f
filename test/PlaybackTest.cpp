#include "PlaybackTest.hpp"
#include "PlaybackSequencer.hpp"
#include "PlaybackManager.hpp"
#include "FramePlayback.hpp"
#include "LoadedImage.hpp"
#include "LoadErrors.hpp"

#include <QTest>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include <QImage>

#include <deque>
#include <functional>
#include <set>
#include <vector>

QTEST_GUILESS_MAIN(PlaybackTest)
#include "PlaybackTest.moc"

using namespace std::chrono_literals;

// Records what the sequencer asks for. Loads succeed unless a failure has been queued.
class RecordingStep : public PlaybackStep
{
public:
    std::chrono::nanoseconds delta = 40ms;
    size_t items = 5;
    std::vector<LoadRequest> loads;
    std::deque<std::function<void()>> failures;
    int prefetchNeighborCalls = 0;
    int processPrefetchedCalls = 0;
    std::vector<size_t> randomPrefetches;

    std::chrono::nanoseconds frameDeltaTime() override
    {
        return this->delta;
    }

    void processPrefetched() override
    {
        this->processPrefetchedCalls++;
    }

    void prefetchNeighbors() override
    {
        this->prefetchNeighborCalls++;
    }

    void prefetchForRandom(size_t index) override
    {
        this->randomPrefetches.push_back(index);
    }

    size_t itemCount() override
    {
        return this->items;
    }

    LoadOutcome load(const LoadRequest& request) override
    {
        this->loads.push_back(request);
        if(!this->failures.empty())
        {
            auto fail = std::move(this->failures.front());
            this->failures.pop_front();
            fail();
        }

        LoadOutcome o;
        o.path = request.kind == LoadRequest::Kind::FilePath ? request.path : QString("item%1").arg(this->loads.size());
        return o;
    }

    QString currentPath() const override
    {
        return "current";
    }
};

void PlaybackTest::testNextUpdateEarliest()
{
    const Clock::time_point t0 = Clock::now();
    const NextUpdate soon = NextUpdate::soonest();
    const NextUpdate early = NextUpdate::waitUntil(t0 + 10ms);
    const NextUpdate late = NextUpdate::waitUntil(t0 + 20ms);
    const NextUpdate never = NextUpdate::latest();

    QCOMPARE(NextUpdate::earliest(never, late).deadline, late.deadline);
    QCOMPARE(NextUpdate::earliest(late, early).deadline, early.deadline);
    QCOMPARE(NextUpdate::earliest(early, soon).kind, NextUpdate::Kind::Soonest);
    QCOMPARE(NextUpdate::earliest(never, never).kind, NextUpdate::Kind::Latest);
}

void PlaybackTest::testPausedWithoutImageWaitsIndefinitely()
{
    RecordingStep step;
    PlaybackSequencer seq(step);

    NextUpdate next = seq.update(Clock::now());
    QCOMPARE(next.kind, NextUpdate::Kind::Latest);
    QVERIFY(step.loads.empty());
    QCOMPARE(step.prefetchNeighborCalls, 0);
    QCOMPARE(seq.loadedPath().state, LoadedImgPath::State::NotYetLoaded);
}

void PlaybackTest::testPausedExecutesExplicitRequest()
{
    RecordingStep step;
    PlaybackSequencer seq(step);

    seq.requestLoad(LoadRequest::filePath("/pics/a.png"));
    NextUpdate next = seq.update(Clock::now());
    QCOMPARE(next.kind, NextUpdate::Kind::Soonest);
    QCOMPARE(step.loads.size(), size_t(1));
    QCOMPARE(step.loads[0], LoadRequest::filePath("/pics/a.png"));
    QCOMPARE(seq.loadedPath(), (LoadedImgPath{LoadedImgPath::State::Loaded, "/pics/a.png"}));
    QVERIFY(seq.pendingRequest().isNone());

    // nothing to do but prefetching
    next = seq.update(Clock::now());
    QCOMPARE(next.kind, NextUpdate::Kind::Latest);
    QCOMPARE(step.loads.size(), size_t(1));
    QCOMPARE(step.prefetchNeighborCalls, 1);
    QVERIFY(step.processPrefetchedCalls >= 2);
}

void PlaybackTest::testForwardNeverSkipsSteps()
{
    RecordingStep step;
    PlaybackSequencer seq(step);
    const Clock::time_point t0 = Clock::now();
    seq.startPlaybackForward(t0);
    QCOMPARE(seq.playbackState(), PlaybackState::Forward);

    NextUpdate next = seq.update(t0 + 10ms);
    QVERIFY(step.loads.empty());
    QCOMPARE(next.kind, NextUpdate::Kind::WaitUntil);
    // half of the remaining 30 ms
    QCOMPARE(next.deadline, t0 + 25ms);
    QCOMPARE(step.prefetchNeighborCalls, 1);

    // five intervals have passed, still only one step is taken
    next = seq.update(t0 + 200ms);
    QCOMPARE(next.kind, NextUpdate::Kind::Soonest);
    QCOMPARE(step.loads.size(), size_t(1));
    QCOMPARE(step.loads[0], LoadRequest::jumpBy(1));

    // falling behind by more than an interval restarts the timing
    seq.update(t0 + 230ms);
    QCOMPARE(step.loads.size(), size_t(1));
    seq.update(t0 + 240ms);
    QCOMPARE(step.loads.size(), size_t(2));
}

void PlaybackTest::testBusyWaitCloseToDeadline()
{
    RecordingStep step;
    PlaybackSequencer seq(step);
    const Clock::time_point t0 = Clock::now();
    seq.startPlaybackForward(t0);

    NextUpdate next = seq.update(t0 + 35ms);
    QCOMPARE(next.kind, NextUpdate::Kind::Soonest);
    QVERIFY(step.loads.empty());
    QCOMPARE(step.prefetchNeighborCalls, 0);
}

void PlaybackTest::testLatenessIsCarriedIntoNextStep()
{
    RecordingStep step;
    PlaybackSequencer seq(step);
    const Clock::time_point t0 = Clock::now();
    seq.startPlaybackForward(t0);

    // 10 ms late
    seq.update(t0 + 50ms);
    QCOMPARE(step.loads.size(), size_t(1));

    // only 30 ms since the last step, but the lateness is made up for
    seq.update(t0 + 80ms);
    QCOMPARE(step.loads.size(), size_t(2));

    seq.update(t0 + 100ms);
    QCOMPARE(step.loads.size(), size_t(2));
    seq.update(t0 + 120ms);
    QCOMPARE(step.loads.size(), size_t(3));
}

void PlaybackTest::testPresentationUsesSlideshowDelay()
{
    RecordingStep step;
    PlaybackSequencer seq(step);
    QCOMPARE(seq.slideshowDelay(), std::chrono::nanoseconds(6s));
    seq.setSlideshowDelay(1s);

    const Clock::time_point t0 = Clock::now();
    seq.startPresentation(t0);

    NextUpdate next = seq.update(t0 + 500ms);
    QVERIFY(step.loads.empty());
    QCOMPARE(next.kind, NextUpdate::Kind::WaitUntil);
    QCOMPARE(next.deadline, t0 + 750ms);

    seq.update(t0 + 1s);
    QCOMPARE(step.loads.size(), size_t(1));
    QCOMPARE(step.loads[0], LoadRequest::jumpBy(1));
}

void PlaybackTest::testRandomPresentationVisitsEveryIndexOnce()
{
    RecordingStep step;
    step.items = 5;
    PlaybackSequencer seq(step);
    seq.setSlideshowDelay(1s);

    Clock::time_point t = Clock::now();
    seq.startRandomPresentation(t);
    QCOMPARE(seq.presentRemaining().size(), size_t(5));

    std::set<size_t> visited;
    for(int i = 0; i < 5; i++)
    {
        t += 1s;
        seq.update(t);
        QCOMPARE(step.loads.size(), size_t(i + 1));
        QCOMPARE(step.loads.back().kind, LoadRequest::Kind::LoadAtIndex);
        QVERIFY(step.loads.back().index < 5);
        visited.insert(step.loads.back().index);
    }
    QCOMPARE(visited.size(), size_t(5));
    QVERIFY(seq.presentRemaining().empty());

    // exhausted, the next step starts a new cycle
    t += 1s;
    seq.update(t);
    QCOMPARE(step.loads.size(), size_t(6));
    QCOMPARE(seq.presentRemaining().size(), size_t(4));
}

void PlaybackTest::testRandomPresentationPopsElapsedSteps()
{
    RecordingStep step;
    step.items = 10;
    PlaybackSequencer seq(step);
    seq.setSlideshowDelay(1s);

    const Clock::time_point t0 = Clock::now();
    seq.startRandomPresentation(t0);

    // prefetches the upcoming index while waiting
    seq.update(t0 + 100ms);
    QCOMPARE(step.randomPrefetches.size(), size_t(1));
    QCOMPARE(step.randomPrefetches[0], seq.presentRemaining().back());

    const size_t third = seq.presentRemaining()[seq.presentRemaining().size() - 3];
    seq.update(t0 + 3s);
    QCOMPARE(step.loads.size(), size_t(1));
    QCOMPARE(step.loads[0], LoadRequest::atIndex(third));
    QCOMPARE(seq.presentRemaining().size(), size_t(7));
}

void PlaybackTest::testWaitingOnLoaderRetriesCurrentItem()
{
    RecordingStep step;
    step.failures.push_back([]{ throw WaitingOnLoader(); });
    PlaybackSequencer seq(step);

    const Clock::time_point t0 = Clock::now();
    seq.requestLoad(LoadRequest::next());
    NextUpdate next = seq.update(t0);
    QCOMPARE(next.kind, NextUpdate::Kind::WaitUntil);
    QCOMPARE(next.deadline, t0 + PlaybackSequencer::RetryInterval);
    QCOMPARE(seq.pendingRequest(), LoadRequest::jumpBy(0));
    QCOMPARE(seq.loadedPath().state, LoadedImgPath::State::NotYetLoaded);

    next = seq.update(t0 + 20ms);
    QCOMPARE(next.kind, NextUpdate::Kind::Soonest);
    QCOMPARE(step.loads.size(), size_t(2));
    QCOMPARE(step.loads[1], LoadRequest::jumpBy(0));
    QCOMPARE(seq.loadedPath().state, LoadedImgPath::State::Loaded);
}

void PlaybackTest::testWaitingOnFilterRetriesSameRequest()
{
    RecordingStep step;
    step.failures.push_back([]{ throw WaitingOnDirectoryFilter(); });
    step.failures.push_back([]{ throw WaitingOnDirectoryFilter(); });
    PlaybackSequencer seq(step);

    seq.requestLoad(LoadRequest::atIndex(3));
    seq.update(Clock::now());
    QCOMPARE(seq.pendingRequest(), LoadRequest::atIndex(3));
    seq.update(Clock::now());
    QCOMPARE(seq.pendingRequest(), LoadRequest::atIndex(3));
    seq.update(Clock::now());
    QVERIFY(seq.pendingRequest().isNone());
    QCOMPARE(step.loads.size(), size_t(3));
    QCOMPARE(seq.loadedPath().state, LoadedImgPath::State::Loaded);
}

void PlaybackTest::testDecodeErrorClearsDisplay()
{
    RecordingStep step;
    PlaybackSequencer seq(step);
    seq.requestLoad(LoadRequest::filePath("/pics/good.png"));
    seq.update(Clock::now());
    QCOMPARE(seq.loadedPath().state, LoadedImgPath::State::Loaded);

    step.failures.push_back([]{ throw ImageDecodeError("/pics/bad.png", "corrupt"); });
    seq.requestLoad(LoadRequest::next());
    NextUpdate next = seq.update(Clock::now());
    QCOMPARE(next.kind, NextUpdate::Kind::Soonest);
    QCOMPARE(seq.loadedPath(), (LoadedImgPath{LoadedImgPath::State::ErrLoading, "/pics/bad.png"}));
    QVERIFY(seq.current().image.isNull());
    // not retried
    QVERIFY(seq.pendingRequest().isNone());

    step.failures.push_back([]{ throw NavigationError::fileNotFound("x.png", "/pics"); });
    seq.requestLoad(LoadRequest::filePath("/pics/x.png"));
    seq.update(Clock::now());
    QCOMPARE(seq.loadedPath(), (LoadedImgPath{LoadedImgPath::State::ErrLoading, "/pics/x.png"}));

    step.failures.push_back([]{ throw NavigationError::emptyDirectory("/pics"); });
    seq.requestLoad(LoadRequest::next());
    seq.update(Clock::now());
    QCOMPARE(seq.loadedPath(), (LoadedImgPath{LoadedImgPath::State::ErrLoading, "current"}));
}

void PlaybackTest::testPathNotYetSpecified()
{
    RecordingStep step;
    step.failures.push_back([]{ throw PathNotYetSpecified(); });
    PlaybackSequencer seq(step);

    seq.requestLoad(LoadRequest::next());
    seq.update(Clock::now());
    QCOMPARE(seq.loadedPath().state, LoadedImgPath::State::NotYetLoaded);
    QVERIFY(seq.pendingRequest().isNone());
    QCOMPARE(seq.update(Clock::now()).kind, NextUpdate::Kind::Latest);
}

static QSharedPointer<LoadedImage> makeAnimation(const std::vector<std::chrono::milliseconds>& delays)
{
    std::vector<AnimationFrameTexture> frames;
    for(auto d : delays)
    {
        AnimationFrameTexture f;
        f.texture = TextureHandle(new RasterTexture(QImage(4, 4, QImage::Format_RGBA8888)));
        f.delay = d;
        frames.push_back(f);
    }
    return QSharedPointer<LoadedImage>::create("/pics/anim.gif", QDateTime::currentDateTime(), std::move(frames));
}

void PlaybackTest::testFramePlayback()
{
    FramePlayback frames;
    QVERIFY_EXCEPTION_THROWN(frames.load(LoadRequest::next()), PathNotYetSpecified);
    QCOMPARE(frames.itemCount(), size_t(0));
    QCOMPARE(frames.frameDeltaTime(), std::chrono::nanoseconds(FramePlayback::DefaultFrameDelay));

    frames.setImage(makeAnimation({0ms, 50ms, 30ms}));
    QCOMPARE(frames.itemCount(), size_t(3));
    QCOMPARE(frames.currentFrame(), size_t(0));
    // a frame without delay is shown for the default time
    QCOMPARE(frames.frameDeltaTime(), std::chrono::nanoseconds(100ms));

    LoadOutcome o = frames.load(LoadRequest::next());
    QCOMPARE(o.frameIndex, size_t(1));
    QCOMPARE(o.path, QString("/pics/anim.gif"));
    QCOMPARE(frames.frameDeltaTime(), std::chrono::nanoseconds(50ms));

    QCOMPARE(frames.load(LoadRequest::jumpBy(-2)).frameIndex, size_t(2));
    QCOMPARE(frames.load(LoadRequest::next()).frameIndex, size_t(0));
    QCOMPARE(frames.load(LoadRequest::previous()).frameIndex, size_t(2));
    QCOMPARE(frames.load(LoadRequest::jumpBy(7)).frameIndex, size_t(0));
    QCOMPARE(frames.load(LoadRequest::atIndex(1)).frameIndex, size_t(1));
    QVERIFY_EXCEPTION_THROWN(frames.load(LoadRequest::atIndex(3)), NavigationError);
    QVERIFY_EXCEPTION_THROWN(frames.load(LoadRequest::filePath("/pics/other.gif")), std::invalid_argument);

    frames.setImage(makeAnimation({10ms}));
    QCOMPARE(frames.currentFrame(), size_t(0));

    // played by a sequencer, every frame lasts its own delay
    FramePlayback anim;
    anim.setImage(makeAnimation({10ms, 40ms}));
    PlaybackSequencer seq(anim);
    const Clock::time_point t0 = Clock::now();
    seq.startPlaybackForward(t0);
    seq.update(t0 + 10ms);
    QCOMPARE(seq.current().frameIndex, size_t(1));
    seq.update(t0 + 40ms);
    QCOMPARE(seq.current().frameIndex, size_t(1));
    seq.update(t0 + 50ms);
    QCOMPARE(seq.current().frameIndex, size_t(0));
}

static bool writePng(const QTemporaryDir& dir, const QString& name, QSize size)
{
    QImage img(size, QImage::Format_RGB32);
    img.fill(Qt::gray);
    return img.save(dir.filePath(name), "PNG");
}

void PlaybackTest::testManagerCouplesFolderAndFrames()
{
    QTemporaryDir tmp;
    QVERIFY(writePng(tmp, "a.png", QSize(6, 4)));
    QVERIFY(writePng(tmp, "b.png", QSize(3, 3)));
    {
        QFile f(tmp.filePath("c.png"));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("broken");
    }
    const QDir canonicalDir(QDir(tmp.path()).canonicalPath());

    PlaybackManager manager(1000000, 1, std::make_shared<RasterTextureUploader>());
    QVERIFY(manager.currentFrame() == nullptr);
    QCOMPARE(manager.update().kind, NextUpdate::Kind::Latest);

    manager.requestLoad(LoadRequest::filePath(tmp.filePath("a.png")));
    QCOMPARE(manager.update().kind, NextUpdate::Kind::Soonest);
    QCOMPARE(manager.loadedPath(), (LoadedImgPath{LoadedImgPath::State::Loaded, canonicalDir.absoluteFilePath("a.png")}));
    QVERIFY(manager.currentFrame() != nullptr);
    QCOMPARE(manager.currentTexture()->size(), QSize(6, 4));
    // a still image does not animate
    QCOMPARE(manager.animationState(), PlaybackState::Paused);
    QCOMPARE(manager.playbackState(), PlaybackState::Paused);

    manager.requestLoad(LoadRequest::next());
    manager.update();
    QCOMPARE(manager.loadedPath().path, canonicalDir.absoluteFilePath("b.png"));
    QCOMPARE(manager.currentTexture()->size(), QSize(3, 3));

    manager.requestLoad(LoadRequest::next());
    manager.update();
    QCOMPARE(manager.loadedPath(), (LoadedImgPath{LoadedImgPath::State::ErrLoading, canonicalDir.absoluteFilePath("c.png")}));
    QVERIFY(manager.currentFrame() == nullptr);
    QVERIFY(manager.currentTexture().isNull());

    // wraps around to the first image
    manager.requestLoad(LoadRequest::next());
    manager.update();
    QCOMPARE(manager.loadedPath().path, canonicalDir.absoluteFilePath("a.png"));
    QCOMPARE(manager.cachedFromDir(), std::vector<bool>({true, true, false}));
}
