#pragma once

#include "LoadRequest.hpp"
#include "NextUpdate.hpp"
#include "PlaybackStep.hpp"
#include "types.hpp"

#include <QString>

#include <chrono>
#include <memory>
#include <vector>

// Whether the last load put something on screen
struct LoadedImgPath
{
    enum class State
    {
        NotYetLoaded,
        ErrLoading,
        Loaded,
    };

    State state = State::NotYetLoaded;
    QString path;

    bool operator==(const LoadedImgPath& other) const = default;
};

/**
 * Drives a PlaybackStep through time. The host calls update() once per cycle and sleeps
 * according to the returned NextUpdate.
 *
 * While playing, steps advance one at a time even when the host falls behind, except for random
 * presentation which pops as many entries off its shuffle stack as steps have elapsed. Lateness
 * smaller than one step interval is carried into the next step, so the effective rate does not
 * creep when loading takes a varying amount of time.
 */
class PlaybackSequencer
{
public:
    static constexpr std::chrono::nanoseconds DefaultSlideshowDelay = std::chrono::seconds(6);
    // how long to wait before retrying a load that could not be served yet
    static constexpr std::chrono::milliseconds RetryInterval{20};
    static constexpr float BusyWaitThreshold = 0.8f;

    explicit PlaybackSequencer(PlaybackStep& step);
    ~PlaybackSequencer();

    PlaybackSequencer(const PlaybackSequencer&) = delete;
    PlaybackSequencer& operator=(const PlaybackSequencer&) = delete;

    PlaybackState playbackState() const;
    void startPlaybackForward(Clock::time_point now = Clock::now());
    void startPresentation(Clock::time_point now = Clock::now());
    void startRandomPresentation(Clock::time_point now = Clock::now());
    void pausePlayback();

    // replaces any request that has not been executed yet
    void requestLoad(const LoadRequest& request);
    const LoadRequest& pendingRequest() const;

    // Forgets the current request and shows the given outcome. The playback state is left untouched.
    void reset(const LoadOutcome& displayed);

    NextUpdate update(Clock::time_point now = Clock::now());

    std::chrono::nanoseconds slideshowDelay() const;
    void setSlideshowDelay(std::chrono::nanoseconds delay);

    const LoadOutcome& current() const;
    const LoadedImgPath& loadedPath() const;

    // remaining indices of the current random presentation cycle, the next one is at the back
    const std::vector<size_t>& presentRemaining() const;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
