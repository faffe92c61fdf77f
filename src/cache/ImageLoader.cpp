#include "ImageLoader.hpp"

#include "DecoderFactory.hpp"
#include "SmartImageDecoder.hpp"
#include "Formatter.hpp"

#include <QThread>
#include <QFileInfo>
#include <QDebug>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>

struct ImageLoader::Impl
{
    std::mutex requestMtx;
    std::condition_variable requestCv;
    std::deque<DecodeRequest> requests;

    std::mutex resultMtx;
    std::deque<DecodeResult> results;

    std::vector<std::unique_ptr<QThread>> workers;

    void pushResult(DecodeResult&& r)
    {
        std::lock_guard<std::mutex> l(this->resultMtx);
        this->results.push_back(std::move(r));
    }

    DecodeRequest popRequest()
    {
        std::unique_lock<std::mutex> lck(this->requestMtx);
        this->requestCv.wait(lck, [&]{ return !this->requests.empty(); });
        DecodeRequest req = std::move(this->requests.front());
        this->requests.pop_front();
        return req;
    }

    void process(const DecodeRequest& req)
    {
        DecodeResult start;
        start.kind = DecodeResult::Kind::Start;
        start.requestId = req.requestId;
        start.path = req.path;

        try
        {
            QFileInfo info(req.path);
            if(!info.exists())
            {
                throw std::runtime_error(Formatter() << "File '" << req.path << "' does not exist");
            }
            start.lastModified = info.lastModified();

            std::vector<DecodedFrame> frames = ImageLoader::loadFrames(req.path);

            this->pushResult(std::move(start));
            for(auto& f : frames)
            {
                DecodeResult r;
                r.kind = DecodeResult::Kind::Frame;
                r.requestId = req.requestId;
                r.path = req.path;
                r.frame = std::move(f);
                this->pushResult(std::move(r));
            }

            DecodeResult done;
            done.kind = DecodeResult::Kind::Done;
            done.requestId = req.requestId;
            done.path = req.path;
            this->pushResult(std::move(done));
        }
        catch(const std::exception& e)
        {
            qWarning() << "Prefetching" << req.path << "failed:" << e.what();

            DecodeResult failed;
            failed.kind = DecodeResult::Kind::Failed;
            failed.requestId = req.requestId;
            failed.path = req.path;
            failed.errorMessage = QString::fromUtf8(e.what());
            this->pushResult(std::move(failed));
        }
    }

    void run()
    {
        while(true)
        {
            DecodeRequest req = this->popRequest();
            if(req.path.isEmpty())
            {
                return;
            }
            this->process(req);
        }
    }
};

ImageLoader::ImageLoader(unsigned threadCount) : d(std::make_unique<Impl>())
{
    threadCount = std::max(1u, threadCount);
    for(unsigned i = 0; i < threadCount; i++)
    {
        std::unique_ptr<QThread> t(QThread::create([this]{ d->run(); }));
        t->setObjectName(QString("Image Loader %1").arg(i));
        t->start(QThread::LowPriority);
        d->workers.push_back(std::move(t));
    }
}

ImageLoader::~ImageLoader()
{
    {
        std::lock_guard<std::mutex> l(d->requestMtx);
        // queued but not started requests are pointless now
        d->requests.clear();
        for(size_t i = 0; i < d->workers.size(); i++)
        {
            d->requests.push_back(DecodeRequest{});
        }
    }
    d->requestCv.notify_all();

    for(auto& t : d->workers)
    {
        if(!t->wait())
        {
            qWarning() << "Failed to join" << t->objectName();
        }
    }
}

unsigned ImageLoader::threadCount() const
{
    return static_cast<unsigned>(d->workers.size());
}

void ImageLoader::sendLoadRequest(DecodeRequest request)
{
    if(request.path.isEmpty())
    {
        throw std::invalid_argument("ImageLoader::sendLoadRequest(): path must not be empty");
    }

    {
        std::lock_guard<std::mutex> l(d->requestMtx);
        d->requests.push_back(std::move(request));
    }
    d->requestCv.notify_one();
}

std::optional<DecodeResult> ImageLoader::tryRecvPrefetched()
{
    std::lock_guard<std::mutex> l(d->resultMtx);
    if(d->results.empty())
    {
        return std::nullopt;
    }

    DecodeResult r = std::move(d->results.front());
    d->results.pop_front();
    return r;
}

bool ImageLoader::tryTake(quint32 requestId)
{
    std::lock_guard<std::mutex> l(d->requestMtx);
    auto it = std::find_if(d->requests.begin(), d->requests.end(),
                           [&](const DecodeRequest& r) { return r.requestId == requestId && !r.path.isEmpty(); });
    if(it == d->requests.end())
    {
        return false;
    }
    d->requests.erase(it);
    return true;
}

std::vector<DecodedFrame> ImageLoader::loadFrames(const QString& path, bool allowAnimation)
{
    QFileInfo info(path);
    std::unique_ptr<SmartImageDecoder> dec = DecoderFactory::globalInstance()->getDecoder(info);
    if(!dec)
    {
        throw std::runtime_error(Formatter() << "No decoder available for '" << info.fileName() << "'");
    }

    std::vector<DecodedFrame> frames;
    try
    {
        dec->open();
        dec->init();
        frames = dec->decode(allowAnimation);
    }
    catch(const std::exception&)
    {
        dec->close();
        throw;
    }
    dec->close();
    return frames;
}

DecodedFrame ImageLoader::loadImage(const QString& path)
{
    std::vector<DecodedFrame> frames = loadFrames(path, false);
    return std::move(frames.front());
}
