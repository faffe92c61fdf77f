#include "LoadedImage.hpp"

#include "TextureCache.hpp"
#include "Formatter.hpp"

#include <stdexcept>

LoadedImage::LoadedImage(const QString& path, const QDateTime& lastModified, std::vector<AnimationFrameTexture>&& frames)
    : mPath(path), mLastModified(lastModified), mFrames(std::move(frames))
{
    if(mFrames.empty())
    {
        throw std::invalid_argument(Formatter() << "LoadedImage for '" << path << "' must contain at least one frame");
    }

    for(const auto& f : mFrames)
    {
        if(f.texture.isNull())
        {
            throw std::invalid_argument(Formatter() << "LoadedImage for '" << path << "' contains a frame without texture");
        }
        mSizeEstimate += TextureCache::sizeEstimate(f.texture->size());
    }
}

const QString& LoadedImage::path() const
{
    return mPath;
}

const QDateTime& LoadedImage::lastModified() const
{
    return mLastModified;
}

const std::vector<AnimationFrameTexture>& LoadedImage::frames() const
{
    return mFrames;
}

const AnimationFrameTexture& LoadedImage::frame(size_t index) const
{
    if(index >= mFrames.size())
    {
        throw std::out_of_range(Formatter() << "Frame " << index << " requested, but '" << mPath << "' only has " << mFrames.size());
    }
    return mFrames[index];
}

size_t LoadedImage::frameCount() const
{
    return mFrames.size();
}

bool LoadedImage::isAnimated() const
{
    return mFrames.size() > 1;
}

qint64 LoadedImage::sizeEstimate() const
{
    return mSizeEstimate;
}
