#include "ImageCache.hpp"

#include "DirectoryFilter.hpp"
#include "LoadErrors.hpp"

#include <QFileInfo>
#include <QDebug>

#include <algorithm>

struct ImageCache::Impl
{
    Directory dir;
    TextureCache textures;

    Impl(qint64 capacity, unsigned threads, std::shared_ptr<TextureUploader> uploader)
        : textures(capacity, threads, std::move(uploader))
    {}

    QSharedPointer<LoadedImage> loadCurrent()
    {
        const DirItem* item = this->dir.currDescriptor();
        if(item == nullptr)
        {
            throw NavigationError::emptyDirectory(this->dir.path());
        }
        if(!DirectoryFilter::isFileSupported(item->path))
        {
            const auto& files = this->dir.files();
            const bool anySupported = std::any_of(files.begin(), files.end(),
                                                  [](const DirItem& f) { return DirectoryFilter::isFileSupported(f.path); });
            if(!anySupported)
            {
                throw NavigationError::emptyDirectory(this->dir.path());
            }
            // navigation never stops on such a file, it has been opened explicitly
            throw NavigationError::fileNotSupported(item->path);
        }
        return this->textures.loadSpecific(item->path);
    }

    void requireDirectory() const
    {
        if(!this->dir.hasDirectory())
        {
            throw PathNotYetSpecified();
        }
    }
};

ImageCache::ImageCache(qint64 capacity, unsigned threads, std::shared_ptr<TextureUploader> uploader)
    : d(std::make_unique<Impl>(capacity, threads, std::move(uploader)))
{}

ImageCache::~ImageCache() = default;

QSharedPointer<LoadedImage> ImageCache::loadSpecific(const QString& path)
{
    QFileInfo info(path);
    if(info.isDir())
    {
        d->dir.changeDirectory(info.absoluteFilePath());
    }
    else
    {
        // an explicitly named file is decoded even if its name does not look like an image
        d->dir.changeDirectoryWithFilename(info.absolutePath(), info.fileName());
        return d->textures.loadSpecific(d->dir.currDescriptor()->path);
    }
    return d->loadCurrent();
}

QSharedPointer<LoadedImage> ImageCache::loadNext()
{
    return this->loadJump(1);
}

QSharedPointer<LoadedImage> ImageCache::loadPrev()
{
    return this->loadJump(-1);
}

QSharedPointer<LoadedImage> ImageCache::loadJump(int jumpCount)
{
    d->requireDirectory();

    for(int i = 0; i < jumpCount; i++)
    {
        d->dir.jumpToNext();
    }
    for(int i = 0; i > jumpCount; i--)
    {
        d->dir.jumpToPrev();
    }

    return d->loadCurrent();
}

QSharedPointer<LoadedImage> ImageCache::loadAtIndex(size_t imageIndex)
{
    d->requireDirectory();
    d->dir.setCurrImgIndex(imageIndex);
    return d->loadCurrent();
}

void ImageCache::processPrefetched()
{
    d->textures.processPrefetched();
}

void ImageCache::prefetchNeighbors()
{
    if(!d->dir.hasDirectory())
    {
        return;
    }
    d->textures.sendLoadRequests(d->dir.files(), d->dir.currFileIndex());
}

void ImageCache::prefetchAtImageIndex(size_t imageIndex)
{
    const DirItem* item = d->dir.imageByIndex(imageIndex);
    if(item != nullptr)
    {
        d->textures.requestPrefetch(*item);
    }
}

void ImageCache::updateDirectory()
{
    d->dir.updateDirectory();
}

QString ImageCache::currentFilePath() const
{
    const DirItem* item = d->dir.currDescriptor();
    return item ? item->path : QString();
}

QString ImageCache::currentFilename() const
{
    return d->dir.currFilename();
}

size_t ImageCache::currentFileIndex() const
{
    return d->dir.currFileIndex();
}

size_t ImageCache::currentDirLen() const
{
    return d->dir.files().size();
}

std::optional<size_t> ImageCache::imageCount()
{
    return d->dir.imageCount();
}

std::optional<size_t> ImageCache::currImgIndex()
{
    return d->dir.currImgIndex();
}

std::vector<bool> ImageCache::cachedFromDir() const
{
    const auto& files = d->dir.files();
    std::vector<bool> result;
    result.reserve(files.size());
    for(const auto& item : files)
    {
        result.push_back(d->textures.contains(item.fileName()));
    }
    return result;
}

Directory& ImageCache::directory()
{
    return d->dir;
}

TextureCache& ImageCache::textures()
{
    return d->textures;
}
