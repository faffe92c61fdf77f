#pragma once

#include "LoadRequest.hpp"

#include <QSharedPointer>
#include <QString>

#include <chrono>

class LoadedImage;

// What a successful load puts on screen
struct LoadOutcome
{
    QSharedPointer<LoadedImage> image;
    size_t frameIndex = 0;
    QString path;
};

/**
 * Defines what advancing by one step means for a PlaybackSequencer,
 * e.g. moving to the next file of a directory or to the next frame of an animation.
 */
class PlaybackStep
{
public:
    virtual ~PlaybackStep() = default;

    // time between two steps while playing forward
    virtual std::chrono::nanoseconds frameDeltaTime() = 0;

    virtual void processPrefetched() = 0;
    virtual void prefetchNeighbors() = 0;
    virtual void prefetchForRandom(size_t index) = 0;

    // number of addressable items, the range random presentation shuffles
    virtual size_t itemCount() = 0;

    // Executes the request. Throws WaitingOnLoader, WaitingOnDirectoryFilter or PathNotYetSpecified
    // for conditions that resolve themselves, anything else is a failure of the requested item.
    virtual LoadOutcome load(const LoadRequest& request) = 0;

    virtual QString currentPath() const = 0;
};
