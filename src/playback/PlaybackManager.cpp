#include "PlaybackManager.hpp"

#include "FolderPlayback.hpp"
#include "FramePlayback.hpp"
#include "ImageCache.hpp"
#include "Lumen.hpp"

#include <QDebug>

#include <stdexcept>

struct PlaybackManager::Impl
{
    ImageCache cache;
    FolderPlayback folderStep;
    FramePlayback frameStep;
    PlaybackSequencer folder;
    PlaybackSequencer animation;

    // the image the frame sequencer was last reset to
    QSharedPointer<LoadedImage> shownImage;

    Impl(qint64 capacity, unsigned threads, std::shared_ptr<TextureUploader> uploader)
        : cache(capacity, threads, std::move(uploader)), folderStep(cache), folder(folderStep), animation(frameStep)
    {}

    void syncAnimation(Clock::time_point now)
    {
        const QSharedPointer<LoadedImage>& img = this->folder.current().image;
        if(img == this->shownImage)
        {
            return;
        }

        this->shownImage = img;
        this->frameStep.setImage(img);

        LoadOutcome first;
        if(img)
        {
            first.image = img;
            first.path = img->path();
        }
        this->animation.reset(first);

        if(img && img->isAnimated())
        {
            this->animation.startPlaybackForward(now);
        }
        else
        {
            this->animation.pausePlayback();
        }
    }
};

static Lumen& requireLumen()
{
    Lumen* l = Lumen::globalInstance();
    if(l == nullptr)
    {
        throw std::logic_error("PlaybackManager() requires a Lumen instance");
    }
    return *l;
}

PlaybackManager::PlaybackManager()
    : PlaybackManager(requireLumen().cacheCapacity(), requireLumen().workerThreadCount(), std::make_shared<RasterTextureUploader>())
{
    d->folder.setSlideshowDelay(requireLumen().slideshowDelay());
    qDebug() << "PlaybackManager created with" << d->cache.textures().totalCapacity() << "bytes of cache";
}

PlaybackManager::PlaybackManager(qint64 capacity, unsigned threads, std::shared_ptr<TextureUploader> uploader)
    : d(std::make_unique<Impl>(capacity, threads, std::move(uploader)))
{}

PlaybackManager::~PlaybackManager() = default;

ImageCache& PlaybackManager::cache()
{
    return d->cache;
}

PlaybackSequencer& PlaybackManager::folder()
{
    return d->folder;
}

PlaybackSequencer& PlaybackManager::animation()
{
    return d->animation;
}

void PlaybackManager::requestLoad(const LoadRequest& request)
{
    d->folder.requestLoad(request);
}

NextUpdate PlaybackManager::update(Clock::time_point now)
{
    NextUpdate folderNext = d->folder.update(now);
    d->syncAnimation(now);
    NextUpdate frameNext = d->animation.update(now);
    return NextUpdate::earliest(folderNext, frameNext);
}

QSharedPointer<LoadedImage> PlaybackManager::currentImage() const
{
    return d->folder.current().image;
}

TextureHandle PlaybackManager::currentTexture() const
{
    const AnimationFrameTexture* f = this->currentFrame();
    return f ? f->texture : TextureHandle();
}

const AnimationFrameTexture* PlaybackManager::currentFrame() const
{
    const LoadOutcome& o = d->animation.current();
    if(o.image.isNull())
    {
        return nullptr;
    }
    return &o.image->frame(o.frameIndex);
}

const LoadedImgPath& PlaybackManager::loadedPath() const
{
    return d->folder.loadedPath();
}

PlaybackState PlaybackManager::playbackState() const
{
    return d->folder.playbackState();
}

PlaybackState PlaybackManager::animationState() const
{
    return d->animation.playbackState();
}

void PlaybackManager::updateDirectory()
{
    d->cache.updateDirectory();
}

std::vector<bool> PlaybackManager::cachedFromDir() const
{
    return d->cache.cachedFromDir();
}
