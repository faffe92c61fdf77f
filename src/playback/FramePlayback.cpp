#include "FramePlayback.hpp"

#include "LoadedImage.hpp"
#include "LoadErrors.hpp"

#include <cstdint>
#include <stdexcept>

void FramePlayback::setImage(QSharedPointer<LoadedImage> img)
{
    this->img = std::move(img);
    this->frameIdx = 0;
}

const QSharedPointer<LoadedImage>& FramePlayback::image() const
{
    return this->img;
}

size_t FramePlayback::currentFrame() const
{
    return this->frameIdx;
}

std::chrono::nanoseconds FramePlayback::frameDeltaTime()
{
    if(this->img.isNull())
    {
        return DefaultFrameDelay;
    }

    auto delay = this->img->frame(this->frameIdx).delay;
    if(delay.count() == 0)
    {
        return DefaultFrameDelay;
    }
    return delay;
}

void FramePlayback::processPrefetched()
{
}

void FramePlayback::prefetchNeighbors()
{
}

void FramePlayback::prefetchForRandom(size_t)
{
}

size_t FramePlayback::itemCount()
{
    return this->img.isNull() ? 0 : this->img->frameCount();
}

LoadOutcome FramePlayback::load(const LoadRequest& request)
{
    if(this->img.isNull())
    {
        throw PathNotYetSpecified();
    }

    const int64_t count = static_cast<int64_t>(this->img->frameCount());
    const int64_t curr = static_cast<int64_t>(this->frameIdx);
    int64_t target = curr;

    switch(request.kind)
    {
    case LoadRequest::Kind::LoadNext:
        target = curr + 1;
        break;
    case LoadRequest::Kind::LoadPrevious:
        target = curr - 1;
        break;
    case LoadRequest::Kind::Jump:
        target = curr + request.jump;
        break;
    case LoadRequest::Kind::LoadAtIndex:
        if(request.index >= this->img->frameCount())
        {
            throw NavigationError::indexOutOfRange(static_cast<qint64>(request.index), count);
        }
        target = static_cast<int64_t>(request.index);
        break;
    case LoadRequest::Kind::FilePath:
        throw std::invalid_argument("Animation frames cannot be addressed by a file path");
    case LoadRequest::Kind::None:
        throw std::logic_error("FramePlayback::load() called without a request");
    }

    this->frameIdx = static_cast<size_t>(((target % count) + count) % count);

    LoadOutcome outcome;
    outcome.image = this->img;
    outcome.frameIndex = this->frameIdx;
    outcome.path = this->img->path();
    return outcome;
}

QString FramePlayback::currentPath() const
{
    return this->img.isNull() ? QString() : this->img->path();
}
