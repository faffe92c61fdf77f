#pragma once

#include "Texture.hpp"
#include "types.hpp"

#include <QDateTime>
#include <QString>

#include <chrono>
#include <vector>

struct AnimationFrameTexture
{
    TextureHandle texture;
    std::chrono::nanoseconds delay{0};
    Orientation orientation = Orientation::Deg0;
};

// All uploaded frames of one file together with the modification time of the file they were decoded from.
class LoadedImage
{
public:
    LoadedImage(const QString& path, const QDateTime& lastModified, std::vector<AnimationFrameTexture>&& frames);

    const QString& path() const;
    const QDateTime& lastModified() const;
    const std::vector<AnimationFrameTexture>& frames() const;
    const AnimationFrameTexture& frame(size_t index) const;
    size_t frameCount() const;
    bool isAnimated() const;

    // what this image is charged against the cache capacity
    qint64 sizeEstimate() const;

private:
    QString mPath;
    QDateTime mLastModified;
    std::vector<AnimationFrameTexture> mFrames;
    qint64 mSizeEstimate = 0;
};
