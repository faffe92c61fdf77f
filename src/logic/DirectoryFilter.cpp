#include "DirectoryFilter.hpp"

#include <QThread>
#include <QFileInfo>
#include <QDebug>

#include <condition_variable>
#include <mutex>

QString DirItem::fileName() const
{
    return QFileInfo(this->path).fileName();
}

struct DirectoryFilter::Impl
{
    enum class State
    {
        Ready,
        InputGiven,
        Pending,
        OutputReady,
    };

    mutable std::mutex mtx;
    std::condition_variable cv;
    State state = State::Ready;
    bool stopRequested = false;
    std::vector<DirItem> input;
    std::vector<size_t> output;

    std::unique_ptr<QThread> worker;

    static std::vector<size_t> filter(const std::vector<DirItem>& listing)
    {
        std::vector<size_t> imgToFile;
        imgToFile.reserve(listing.size());
        for(size_t i = 0; i < listing.size(); i++)
        {
            if(DirectoryFilter::isFileSupported(listing[i].path))
            {
                imgToFile.push_back(i);
            }
        }
        return imgToFile;
    }

    void run()
    {
        std::unique_lock<std::mutex> lck(this->mtx);
        while(true)
        {
            this->cv.wait(lck, [&]{ return this->stopRequested || this->state == State::InputGiven; });
            if(this->stopRequested)
            {
                return;
            }

            std::vector<DirItem> job = std::move(this->input);
            this->input.clear();
            this->state = State::Pending;

            lck.unlock();
            std::vector<size_t> result = filter(job);
            lck.lock();

            if(this->state == State::Pending)
            {
                this->output = std::move(result);
                this->state = State::OutputReady;
            }
            // else: superseded by a newer input while filtering, drop the result
        }
    }
};

DirectoryFilter::DirectoryFilter() : d(std::make_unique<Impl>())
{
    d->worker.reset(QThread::create([this]{ d->run(); }));
    d->worker->setObjectName("Directory Filter");
    d->worker->start(QThread::LowPriority);
}

DirectoryFilter::~DirectoryFilter()
{
    {
        std::lock_guard<std::mutex> l(d->mtx);
        d->stopRequested = true;
    }
    d->cv.notify_all();

    if(!d->worker->wait())
    {
        qWarning() << "Failed to join the directory filter thread";
    }
}

void DirectoryFilter::giveInput(std::vector<DirItem> listing)
{
    {
        std::lock_guard<std::mutex> l(d->mtx);
        d->input = std::move(listing);
        d->output.clear();
        d->state = Impl::State::InputGiven;
    }
    d->cv.notify_one();
}

std::optional<std::vector<size_t>> DirectoryFilter::tryGetOutput()
{
    std::lock_guard<std::mutex> l(d->mtx);
    if(d->state != Impl::State::OutputReady)
    {
        return std::nullopt;
    }

    d->state = Impl::State::Ready;
    return std::move(d->output);
}

bool DirectoryFilter::isReady() const
{
    std::lock_guard<std::mutex> l(d->mtx);
    return d->state == Impl::State::Ready;
}

const QStringList& DirectoryFilter::supportedExtensions()
{
    static const QStringList ext
    {
        "jpg", "jpeg", "png", "gif", "webp", "tif", "tiff", "tga", "bmp", "ico", "hdr", "pbm", "pam", "ppm", "pgm"
    };
    return ext;
}

bool DirectoryFilter::isFileSupported(const QString& path)
{
    QString suffix = QFileInfo(path).suffix();
    if(suffix.isEmpty())
    {
        return false;
    }
    return supportedExtensions().contains(suffix, Qt::CaseInsensitive);
}
