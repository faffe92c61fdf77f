#pragma once

#include "PlaybackStep.hpp"

class LoadedImage;

/**
 * Steps through the frames of the displayed image. Every request wraps around,
 * except LoadAtIndex, which must address an existing frame.
 */
class FramePlayback : public PlaybackStep
{
public:
    // used for frames that do not carry a delay and while no image is shown
    static constexpr std::chrono::milliseconds DefaultFrameDelay{100};

    // shows frame 0 of img
    void setImage(QSharedPointer<LoadedImage> img);
    const QSharedPointer<LoadedImage>& image() const;
    size_t currentFrame() const;

    std::chrono::nanoseconds frameDeltaTime() override;
    void processPrefetched() override;
    void prefetchNeighbors() override;
    void prefetchForRandom(size_t index) override;
    size_t itemCount() override;
    LoadOutcome load(const LoadRequest& request) override;
    QString currentPath() const override;

private:
    QSharedPointer<LoadedImage> img;
    size_t frameIdx = 0;
};
