#include "FolderPlayback.hpp"

#include "ImageCache.hpp"
#include "LoadedImage.hpp"

#include <cstdint>
#include <stdexcept>

FolderPlayback::FolderPlayback(ImageCache& cache) : cache(cache)
{}

std::chrono::nanoseconds FolderPlayback::frameDeltaTime()
{
    return std::chrono::nanoseconds(static_cast<int64_t>(1e9 / FramesPerSecond));
}

void FolderPlayback::processPrefetched()
{
    this->cache.processPrefetched();
}

void FolderPlayback::prefetchNeighbors()
{
    this->cache.prefetchNeighbors();
}

void FolderPlayback::prefetchForRandom(size_t index)
{
    this->cache.prefetchAtImageIndex(index);
}

size_t FolderPlayback::itemCount()
{
    return this->cache.imageCount().value_or(0);
}

LoadOutcome FolderPlayback::load(const LoadRequest& request)
{
    QSharedPointer<LoadedImage> img;
    switch(request.kind)
    {
    case LoadRequest::Kind::LoadNext:
        img = this->cache.loadNext();
        break;
    case LoadRequest::Kind::LoadPrevious:
        img = this->cache.loadPrev();
        break;
    case LoadRequest::Kind::FilePath:
        img = this->cache.loadSpecific(request.path);
        break;
    case LoadRequest::Kind::LoadAtIndex:
        img = this->cache.loadAtIndex(request.index);
        break;
    case LoadRequest::Kind::Jump:
        img = this->cache.loadJump(request.jump);
        break;
    case LoadRequest::Kind::None:
        throw std::logic_error("FolderPlayback::load() called without a request");
    }

    LoadOutcome outcome;
    outcome.image = img;
    outcome.path = img->path();
    return outcome;
}

QString FolderPlayback::currentPath() const
{
    return this->cache.currentFilePath();
}
