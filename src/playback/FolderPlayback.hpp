#pragma once

#include "PlaybackStep.hpp"

class ImageCache;

// Steps through the files of the current directory
class FolderPlayback : public PlaybackStep
{
public:
    static constexpr double FramesPerSecond = 25.0;

    explicit FolderPlayback(ImageCache& cache);

    std::chrono::nanoseconds frameDeltaTime() override;
    void processPrefetched() override;
    void prefetchNeighbors() override;
    void prefetchForRandom(size_t index) override;
    size_t itemCount() override;
    LoadOutcome load(const LoadRequest& request) override;
    QString currentPath() const override;

private:
    ImageCache& cache;
};
