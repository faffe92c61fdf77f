#pragma once

#include "LoadRequest.hpp"
#include "LoadedImage.hpp"
#include "NextUpdate.hpp"
#include "PlaybackSequencer.hpp"
#include "Texture.hpp"
#include "types.hpp"

#include <QSharedPointer>

#include <memory>
#include <vector>

class ImageCache;

/**
 * Couples playback through the files of a directory with playback through the frames of the
 * displayed file. Whenever a different file is shown, its animation restarts at frame 0 and
 * plays only if the file has more than one frame.
 */
class PlaybackManager
{
public:
    // configured from Lumen::globalInstance(), keeps textures in main memory
    PlaybackManager();
    PlaybackManager(qint64 capacity, unsigned threads, std::shared_ptr<TextureUploader> uploader);
    ~PlaybackManager();

    PlaybackManager(const PlaybackManager&) = delete;
    PlaybackManager& operator=(const PlaybackManager&) = delete;

    ImageCache& cache();
    PlaybackSequencer& folder();
    PlaybackSequencer& animation();

    void requestLoad(const LoadRequest& request);
    NextUpdate update(Clock::time_point now = Clock::now());

    QSharedPointer<LoadedImage> currentImage() const;
    TextureHandle currentTexture() const;
    // nullptr while nothing is displayed
    const AnimationFrameTexture* currentFrame() const;
    const LoadedImgPath& loadedPath() const;

    PlaybackState playbackState() const;
    PlaybackState animationState() const;

    void updateDirectory();
    std::vector<bool> cachedFromDir() const;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
