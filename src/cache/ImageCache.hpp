#pragma once

#include "Directory.hpp"
#include "TextureCache.hpp"

#include <QSharedPointer>
#include <QString>

#include <memory>
#include <optional>
#include <vector>

/**
 * Resolves navigation against the current Directory and loads the resulting file through the TextureCache.
 * Every load* function moves the current position first, so a load that has to be retried
 * is retried for the new position by loadJump(0).
 */
class ImageCache
{
public:
    ImageCache(qint64 capacity, unsigned threads, std::shared_ptr<TextureUploader> uploader);
    ~ImageCache();

    ImageCache(const ImageCache&) = delete;
    ImageCache& operator=(const ImageCache&) = delete;

    // path may be a file or a directory, in which case its first supported image is loaded
    QSharedPointer<LoadedImage> loadSpecific(const QString& path);
    QSharedPointer<LoadedImage> loadNext();
    QSharedPointer<LoadedImage> loadPrev();
    // loadJump(0) loads the current file again
    QSharedPointer<LoadedImage> loadJump(int jumpCount);
    QSharedPointer<LoadedImage> loadAtIndex(size_t imageIndex);

    void processPrefetched();
    void prefetchNeighbors();
    void prefetchAtImageIndex(size_t imageIndex);
    void updateDirectory();

    QString currentFilePath() const;
    QString currentFilename() const;
    size_t currentFileIndex() const;
    size_t currentDirLen() const;
    std::optional<size_t> imageCount();
    std::optional<size_t> currImgIndex();
    // one flag per file of the current directory, set if the file has an entry in the texture cache
    std::vector<bool> cachedFromDir() const;

    Directory& directory();
    TextureCache& textures();

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
