#pragma once

#include "DirItem.hpp"
#include "LoadedImage.hpp"
#include "Texture.hpp"

#include <QSharedPointer>
#include <QSize>
#include <QString>

#include <memory>
#include <vector>

/**
 * Capacity limited cache of uploaded images of exactly one directory, keyed by file name.
 *
 * The image the user is waiting for is decoded synchronously by loadSpecific(), its
 * neighbours are decoded by a pool of background threads and picked up by processPrefetched().
 * When space is needed, entries before the requested file (in directory order) are dropped
 * first, the ones following it last.
 *
 * Must only be used by the thread that created it.
 */
class TextureCache
{
public:
    static constexpr int MaxBulkPrefetchRequests = 4;

    TextureCache(qint64 capacity, unsigned threads, std::shared_ptr<TextureUploader> uploader);
    ~TextureCache();

    TextureCache(const TextureCache&) = delete;
    TextureCache& operator=(const TextureCache&) = delete;

    // Throws WaitingOnLoader if the file is currently decoded in the background, ImageDecodeError if decoding fails,
    // std::runtime_error if the file does not exist.
    QSharedPointer<LoadedImage> loadSpecific(const QString& path);

    // Uploads and inserts whatever the background decoders have finished. Never blocks.
    void processPrefetched();

    // Dispatches decode requests for the files following currentIndex. See MaxBulkPrefetchRequests.
    void sendLoadRequests(const std::vector<DirItem>& listing, size_t currentIndex);
    // Returns true if a decode request has been dispatched for item. Nothing is dispatched while the cache
    // cannot take another image of the current estimate, while MaxBulkPrefetchRequests are outstanding,
    // or for a file whose background decode failed and which has not changed since.
    bool requestPrefetch(const DirItem& item);

    qint64 remainingCapacity() const;
    qint64 totalCapacity() const;
    // sum of the estimates of all cached images
    qint64 cachedBytes() const;
    // the estimate of the image loaded last, used to guess the cost of prefetching
    qint64 currentEstimate() const;

    QString currentDirectory() const;
    size_t entryCount() const;
    size_t pendingRequestCount() const;
    bool contains(const QString& fileName) const;
    bool isLoadRequested(const QString& fileName) const;
    QSharedPointer<LoadedImage> cached(const QString& fileName) const;

    static qint64 sizeEstimate(const QSize& size);

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
