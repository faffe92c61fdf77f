#include "PlaybackSequencer.hpp"

#include "LoadErrors.hpp"

#include <QRandomGenerator>
#include <QDebug>

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <optional>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

struct PlaybackSequencer::Impl
{
    PlaybackStep& step;
    PlaybackState state = PlaybackState::Paused;
    std::chrono::nanoseconds slideshowDelay = DefaultSlideshowDelay;

    LoadRequest request;
    std::vector<size_t> presentRemaining;

    Clock::time_point lastFrameTime = Clock::now();
    std::chrono::nanoseconds drift{0};

    LoadOutcome current;
    LoadedImgPath loadedPath;

    Impl(PlaybackStep& s) : step(s)
    {}

    void start(PlaybackState newState, Clock::time_point now)
    {
        this->lastFrameTime = now;
        this->drift = 0ns;
        this->state = newState;
    }

    void refillPresentRemaining()
    {
        this->presentRemaining.resize(this->step.itemCount());
        std::iota(this->presentRemaining.begin(), this->presentRemaining.end(), size_t(0));
        std::shuffle(this->presentRemaining.begin(), this->presentRemaining.end(), *QRandomGenerator::global());
    }

    std::optional<size_t> popRandom()
    {
        if(this->presentRemaining.empty())
        {
            this->refillPresentRemaining();
            if(this->presentRemaining.empty())
            {
                return std::nullopt;
            }
        }
        size_t idx = this->presentRemaining.back();
        this->presentRemaining.pop_back();
        return idx;
    }

    std::chrono::nanoseconds frameDeltaTime()
    {
        std::chrono::nanoseconds delta;
        switch(this->state)
        {
        case PlaybackState::Present:
        case PlaybackState::RandomPresent:
            delta = this->slideshowDelay;
            break;
        default:
            delta = this->step.frameDeltaTime();
            break;
        }
        return std::max<std::chrono::nanoseconds>(delta, 1ms);
    }

    // Returns the request to execute now, or None if the current step is not over yet.
    LoadRequest advance(Clock::time_point now, std::chrono::nanoseconds delta, NextUpdate& next)
    {
        const std::chrono::nanoseconds elapsed = (now - this->lastFrameTime) + this->drift;
        const int64_t steps = elapsed / delta;

        if(steps > 0)
        {
            LoadRequest req;
            int64_t consumed = 1;
            if(this->state == PlaybackState::RandomPresent)
            {
                std::optional<size_t> target;
                for(int64_t i = 0; i < steps; i++)
                {
                    target = this->popRandom();
                }
                if(target)
                {
                    req = LoadRequest::atIndex(*target);
                }
                consumed = steps;
            }
            else
            {
                req = LoadRequest::jumpBy(1);
            }

            const std::chrono::nanoseconds lateness = elapsed - consumed * delta;
            this->drift = lateness < delta ? lateness : 0ns;
            this->lastFrameTime = now;
            return req;
        }

        this->step.processPrefetched();

        if(elapsed > std::chrono::duration_cast<std::chrono::nanoseconds>(delta * BusyWaitThreshold))
        {
            next = NextUpdate::soonest();
        }
        else
        {
            if(this->state == PlaybackState::RandomPresent && !this->presentRemaining.empty())
            {
                this->step.prefetchForRandom(this->presentRemaining.back());
            }
            else
            {
                this->step.prefetchNeighbors();
            }

            const auto wait = std::max<std::chrono::nanoseconds>((delta - elapsed) / 2, 1ms);
            next = NextUpdate::waitUntil(now + wait);
        }
        return LoadRequest();
    }

    void clearDisplay(LoadedImgPath::State state, const QString& path)
    {
        this->current = LoadOutcome();
        this->loadedPath = LoadedImgPath{state, path};
    }

    // Runs the load and turns its outcome into what is displayed and when to come back
    NextUpdate execute(const LoadRequest& req, Clock::time_point now, bool explicitRequest)
    {
        try
        {
            LoadOutcome outcome = this->step.load(req);
            this->loadedPath = LoadedImgPath{LoadedImgPath::State::Loaded, outcome.path};
            this->current = std::move(outcome);

            if(explicitRequest && this->state != PlaybackState::Paused)
            {
                // an explicit jump restarts the interval of the new step
                this->lastFrameTime = now;
                this->drift = 0ns;
            }
            return NextUpdate::soonest();
        }
        catch(const WaitingOnLoader&)
        {
            // navigation already happened, retry the item we are at
            this->request = LoadRequest::jumpBy(0);
        }
        catch(const WaitingOnDirectoryFilter&)
        {
            if(req.kind == LoadRequest::Kind::LoadAtIndex || req.kind == LoadRequest::Kind::FilePath)
            {
                this->request = req;
            }
            else
            {
                this->request = LoadRequest::jumpBy(0);
            }
        }
        catch(const PathNotYetSpecified&)
        {
            this->clearDisplay(LoadedImgPath::State::NotYetLoaded, QString());
            return NextUpdate::soonest();
        }
        catch(const ImageDecodeError& e)
        {
            qWarning() << "Error occurred while loading image:" << e.what();
            this->clearDisplay(LoadedImgPath::State::ErrLoading, e.path());
            return NextUpdate::soonest();
        }
        catch(const std::exception& e)
        {
            qWarning() << "Error occurred while loading image:" << e.what();
            const QString path = req.kind == LoadRequest::Kind::FilePath ? req.path : this->step.currentPath();
            this->clearDisplay(LoadedImgPath::State::ErrLoading, path);
            return NextUpdate::soonest();
        }

        return NextUpdate::waitUntil(now + RetryInterval);
    }
};

PlaybackSequencer::PlaybackSequencer(PlaybackStep& step) : d(std::make_unique<Impl>(step))
{}

PlaybackSequencer::~PlaybackSequencer() = default;

PlaybackState PlaybackSequencer::playbackState() const
{
    return d->state;
}

void PlaybackSequencer::startPlaybackForward(Clock::time_point now)
{
    d->start(PlaybackState::Forward, now);
}

void PlaybackSequencer::startPresentation(Clock::time_point now)
{
    d->start(PlaybackState::Present, now);
}

void PlaybackSequencer::startRandomPresentation(Clock::time_point now)
{
    d->start(PlaybackState::RandomPresent, now);
    d->refillPresentRemaining();
}

void PlaybackSequencer::pausePlayback()
{
    d->state = PlaybackState::Paused;
}

void PlaybackSequencer::requestLoad(const LoadRequest& request)
{
    d->request = request;
}

const LoadRequest& PlaybackSequencer::pendingRequest() const
{
    return d->request;
}

void PlaybackSequencer::reset(const LoadOutcome& displayed)
{
    d->request = LoadRequest();
    d->drift = 0ns;
    d->current = displayed;
    if(displayed.image)
    {
        d->loadedPath = LoadedImgPath{LoadedImgPath::State::Loaded, displayed.path};
    }
    else
    {
        d->loadedPath = LoadedImgPath();
    }
}

NextUpdate PlaybackSequencer::update(Clock::time_point now)
{
    // taken out first, so a request never survives the update it was executed in
    LoadRequest req = std::exchange(d->request, LoadRequest());

    if(d->state == PlaybackState::Paused && req.isNone() && d->loadedPath.state == LoadedImgPath::State::NotYetLoaded)
    {
        return NextUpdate::latest();
    }

    const std::chrono::nanoseconds delta = d->frameDeltaTime();
    NextUpdate next = NextUpdate::latest();
    bool explicitRequest = !req.isNone();

    if(d->state == PlaybackState::Paused)
    {
        d->step.processPrefetched();
        if(explicitRequest)
        {
            next = NextUpdate::waitUntil(now + RetryInterval);
        }
        else
        {
            d->step.prefetchNeighbors();
        }
    }
    else if(!explicitRequest)
    {
        req = d->advance(now, delta, next);
    }
    else
    {
        next = NextUpdate::waitUntil(now + 1ms);
    }

    if(req.isNone())
    {
        return next;
    }

    return d->execute(req, now, explicitRequest);
}

std::chrono::nanoseconds PlaybackSequencer::slideshowDelay() const
{
    return d->slideshowDelay;
}

void PlaybackSequencer::setSlideshowDelay(std::chrono::nanoseconds delay)
{
    d->slideshowDelay = delay;
}

const LoadOutcome& PlaybackSequencer::current() const
{
    return d->current;
}

const LoadedImgPath& PlaybackSequencer::loadedPath() const
{
    return d->loadedPath;
}

const std::vector<size_t>& PlaybackSequencer::presentRemaining() const
{
    return d->presentRemaining;
}
