#include "TextureCache.hpp"

#include "DirectoryFilter.hpp"
#include "ImageLoader.hpp"
#include "PendingRequests.hpp"
#include "LoadErrors.hpp"
#include "NaturalSort.hpp"
#include "TraceTimer.hpp"
#include "xThreadGuard.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QThread>
#include <QDebug>

#include <iterator>
#include <map>

namespace
{
struct CachedTexture
{
    // placeholder for an image a background decoder has been asked for
    bool loadRequested = false;
    quint32 requestId = 0;
    QSharedPointer<LoadedImage> image;

    static CachedTexture placeholder(quint32 requestId)
    {
        CachedTexture c;
        c.loadRequested = true;
        c.requestId = requestId;
        return c;
    }

    static CachedTexture texture(QSharedPointer<LoadedImage> image)
    {
        CachedTexture c;
        c.image = std::move(image);
        return c;
    }
};
}

struct TextureCache::Impl
{
    const QThread* owner = QThread::currentThread();

    QString currDir;
    // ordered like the directory listing, so iterating visits the files in display order
    std::map<QString, CachedTexture, FileNameLess> entries;
    // files whose background decode failed, with the modification time they had back then
    std::map<QString, QDateTime> failed;

    qint64 totalCapacity;
    qint64 remainingCapacity;
    qint64 currEstSize;

    std::shared_ptr<TextureUploader> uploader;
    PendingRequests pending;
    ImageLoader loader;

    Impl(qint64 capacity, unsigned threads, std::shared_ptr<TextureUploader> up)
        : totalCapacity(capacity), remainingCapacity(capacity), currEstSize(capacity), uploader(std::move(up)), loader(threads)
    {}

    void switchDirectory(const QString& dir)
    {
        qDebug() << "Texture cache switches from" << this->currDir << "to" << dir << ", dropping" << this->entries.size() << "entries";

        for(quint32 id : this->pending.allIds())
        {
            if(this->loader.tryTake(id))
            {
                this->pending.remove(id);
            }
        }
        this->pending.cancelAll();

        this->entries.clear();
        this->failed.clear();
        this->remainingCapacity = this->totalCapacity;
        this->currDir = dir;
    }

    QSharedPointer<LoadedImage> upload(const QString& path, const QDateTime& lastModified, std::vector<DecodedFrame>& frames)
    {
        std::vector<AnimationFrameTexture> textures;
        textures.reserve(frames.size());
        for(auto& f : frames)
        {
            AnimationFrameTexture t;
            t.texture = this->uploader->upload(f.image);
            if(t.texture.isNull())
            {
                throw std::runtime_error(Formatter() << "Texture upload failed for '" << path << "'");
            }
            t.delay = f.delay;
            t.orientation = f.orientation;
            textures.push_back(std::move(t));
        }
        return QSharedPointer<LoadedImage>::create(path, lastModified, std::move(textures));
    }

    // Makes room for an image of the given cost. Images before target go first, walking away from the beginning
    // of the directory towards target. Only if that is not enough, images after target are dropped, farthest first.
    void evictFor(const QString& target, qint64 needed)
    {
        FileNameLess less;
        for(auto it = this->entries.begin(); it != this->entries.end() && this->remainingCapacity < needed;)
        {
            if(!less(it->first, target))
            {
                break;
            }

            if(it->second.loadRequested)
            {
                ++it;
                continue;
            }

            this->remainingCapacity += it->second.image->sizeEstimate();
            qDebug() << "Evicting" << it->first;
            it = this->entries.erase(it);
        }

        while(this->remainingCapacity < needed)
        {
            auto victim = this->entries.end();
            for(auto rit = this->entries.rbegin(); rit != this->entries.rend() && less(target, rit->first); ++rit)
            {
                if(!rit->second.loadRequested)
                {
                    victim = std::prev(rit.base());
                    break;
                }
            }

            if(victim == this->entries.end())
            {
                break;
            }

            this->remainingCapacity += victim->second.image->sizeEstimate();
            qDebug() << "Evicting" << victim->first;
            this->entries.erase(victim);
        }
    }

    void applyPrefetched(const QString& name, QSharedPointer<LoadedImage> img)
    {
        const qint64 est = img->sizeEstimate();
        auto it = this->entries.find(name);
        if(it == this->entries.end())
        {
            this->entries.emplace(name, CachedTexture::texture(std::move(img)));
            this->remainingCapacity -= est;
        }
        else if(it->second.loadRequested)
        {
            it->second = CachedTexture::texture(std::move(img));
            this->remainingCapacity -= est;
        }
        else if(it->second.image->lastModified() < img->lastModified())
        {
            this->remainingCapacity += it->second.image->sizeEstimate() - est;
            it->second = CachedTexture::texture(std::move(img));
        }
    }

    void finishRequest(quint32 id)
    {
        const PendingRequestInfo* info = this->pending.get(id);
        if(info == nullptr)
        {
            return;
        }

        const bool cancelled = info->cancelled;
        auto results = this->pending.takeResults(id);
        this->pending.setFinished(id);

        if(cancelled || !results || results->empty())
        {
            return;
        }

        const DecodeResult& last = results->back();
        const QFileInfo fileInfo(last.path);
        const QString name = fileInfo.fileName();

        if(QDir(fileInfo.absolutePath()).canonicalPath() != this->currDir)
        {
            return;
        }

        if(last.kind == DecodeResult::Kind::Failed)
        {
            // forget the placeholder, a later loadSpecific() will surface the error
            auto it = this->entries.find(name);
            if(it != this->entries.end() && it->second.loadRequested && it->second.requestId == id)
            {
                this->entries.erase(it);
            }
            this->failed[name] = fileInfo.lastModified();
            return;
        }

        QDateTime lastModified;
        std::vector<DecodedFrame> frames;
        for(auto& r : *results)
        {
            switch(r.kind)
            {
            case DecodeResult::Kind::Start:
                lastModified = r.lastModified;
                break;
            case DecodeResult::Kind::Frame:
                frames.push_back(std::move(r.frame));
                break;
            default:
                break;
            }
        }

        if(frames.empty())
        {
            qWarning() << "Background decoder did not deliver any frame for" << last.path;
            return;
        }

        this->applyPrefetched(name, this->upload(last.path, lastModified, frames));
    }
};

TextureCache::TextureCache(qint64 capacity, unsigned threads, std::shared_ptr<TextureUploader> uploader)
    : d(std::make_unique<Impl>(capacity, threads, std::move(uploader)))
{
    if(!d->uploader)
    {
        throw std::invalid_argument("TextureCache requires a TextureUploader");
    }
}

TextureCache::~TextureCache() = default;

qint64 TextureCache::sizeEstimate(const QSize& size)
{
    // 1.5 accounts for the mipmaps of the texture
    return static_cast<qint64>(static_cast<double>(size.width()) * size.height() * 4 * 1.5);
}

QSharedPointer<LoadedImage> TextureCache::loadSpecific(const QString& path)
{
    xThreadGuard g(d->owner, "TextureCache::loadSpecific");

    QFileInfo info(path);
    if(!info.exists())
    {
        throw std::runtime_error(Formatter() << "File '" << path << "' does not exist");
    }

    const QString dir = QDir(info.absolutePath()).canonicalPath();
    const QString name = info.fileName();
    const QString fullPath = QDir(dir).absoluteFilePath(name);

    if(dir != d->currDir)
    {
        d->switchDirectory(dir);
    }

    this->processPrefetched();

    const QDateTime lastModified = info.lastModified();
    auto it = d->entries.find(name);
    if(it != d->entries.end())
    {
        if(it->second.loadRequested)
        {
            if(!d->loader.tryTake(it->second.requestId))
            {
                throw WaitingOnLoader();
            }

            // not started yet, the user is waiting for it, so decode right here
            d->pending.remove(it->second.requestId);
            d->entries.erase(it);
        }
        else if(it->second.image->lastModified() == lastModified)
        {
            return it->second.image;
        }
        else
        {
            qDebug() << name << "changed on disk, reloading";
            d->remainingCapacity += it->second.image->sizeEstimate();
            d->entries.erase(it);
        }
    }

    std::vector<DecodedFrame> frames;
    {
        TraceTimer t(typeid(TextureCache), 100);
        t.setInfo(fullPath.toStdString());
        try
        {
            frames = ImageLoader::loadFrames(fullPath);
        }
        catch(const std::exception& e)
        {
            throw ImageDecodeError(fullPath, e.what());
        }
    }

    d->failed.erase(name);

    QSharedPointer<LoadedImage> img = d->upload(fullPath, lastModified, frames);
    const qint64 est = img->sizeEstimate();
    d->currEstSize = est;

    if(d->remainingCapacity < est)
    {
        d->evictFor(name, est);
    }
    d->remainingCapacity -= est;

    d->entries.insert_or_assign(name, CachedTexture::texture(img));
    return img;
}

void TextureCache::processPrefetched()
{
    xThreadGuard g(d->owner, "TextureCache::processPrefetched");

    while(auto result = d->loader.tryRecvPrefetched())
    {
        const quint32 id = result->requestId;
        const DecodeResult::Kind kind = result->kind;

        if(!d->pending.addLoadResult(std::move(*result)))
        {
            continue;
        }

        if(kind == DecodeResult::Kind::Done || kind == DecodeResult::Kind::Failed)
        {
            d->finishRequest(id);
        }
    }
}

bool TextureCache::requestPrefetch(const DirItem& item)
{
    xThreadGuard g(d->owner, "TextureCache::requestPrefetch");

    if(!DirectoryFilter::isFileSupported(item.path))
    {
        return false;
    }

    if(d->remainingCapacity <= d->currEstSize
       || d->pending.size() >= static_cast<size_t>(MaxBulkPrefetchRequests))
    {
        return false;
    }

    QFileInfo info(item.path);
    if(QDir(info.absolutePath()).canonicalPath() != d->currDir)
    {
        return false;
    }

    const QString name = info.fileName();
    auto failedIt = d->failed.find(name);
    if(failedIt != d->failed.end())
    {
        if(failedIt->second == info.lastModified())
        {
            // not retried in the background until the file changes
            return false;
        }
        d->failed.erase(failedIt);
    }

    auto it = d->entries.find(name);
    if(it == d->entries.end())
    {
        d->entries.emplace(name, CachedTexture::placeholder(item.requestId));
    }
    else if(it->second.loadRequested || it->second.image->lastModified() == info.lastModified() || d->pending.idForPath(item.path))
    {
        return false;
    }

    DecodeRequest req{item.requestId, item.path};
    d->pending.addRequest(req);
    d->loader.sendLoadRequest(std::move(req));
    return true;
}

void TextureCache::sendLoadRequests(const std::vector<DirItem>& listing, size_t currentIndex)
{
    xThreadGuard g(d->owner, "TextureCache::sendLoadRequests");

    // Assume every image is as large as the one loaded last
    qint64 estimatedRemaining = d->remainingCapacity;
    int requested = 0;

    for(size_t index = currentIndex + 1; index < listing.size(); index++)
    {
        if(estimatedRemaining <= d->currEstSize
           || requested >= MaxBulkPrefetchRequests
           || d->pending.size() >= static_cast<size_t>(MaxBulkPrefetchRequests))
        {
            break;
        }

        if(this->requestPrefetch(listing[index]))
        {
            requested++;
            estimatedRemaining -= d->currEstSize;
        }
    }
}

qint64 TextureCache::remainingCapacity() const
{
    return d->remainingCapacity;
}

qint64 TextureCache::totalCapacity() const
{
    return d->totalCapacity;
}

qint64 TextureCache::cachedBytes() const
{
    qint64 sum = 0;
    for(const auto& [name, entry] : d->entries)
    {
        if(!entry.loadRequested)
        {
            sum += entry.image->sizeEstimate();
        }
    }
    return sum;
}

qint64 TextureCache::currentEstimate() const
{
    return d->currEstSize;
}

QString TextureCache::currentDirectory() const
{
    return d->currDir;
}

size_t TextureCache::entryCount() const
{
    return d->entries.size();
}

size_t TextureCache::pendingRequestCount() const
{
    return d->pending.size();
}

bool TextureCache::contains(const QString& fileName) const
{
    return d->entries.find(fileName) != d->entries.end();
}

bool TextureCache::isLoadRequested(const QString& fileName) const
{
    auto it = d->entries.find(fileName);
    return it != d->entries.end() && it->second.loadRequested;
}

QSharedPointer<LoadedImage> TextureCache::cached(const QString& fileName) const
{
    auto it = d->entries.find(fileName);
    if(it == d->entries.end() || it->second.loadRequested)
    {
        return nullptr;
    }
    return it->second.image;
}
