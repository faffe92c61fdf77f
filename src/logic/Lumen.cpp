#include "Lumen.hpp"

#include "Settings.hpp"

#include <QFile>
#include <QPointer>
#include <QRegularExpression>
#include <QThread>
#include <QDebug>

#include <algorithm>
#include <mutex>

static QPointer<Lumen> global;

struct Lumen::Impl
{
    Lumen* q;

    std::recursive_mutex m;
    std::unique_ptr<Settings> settings;
    KeyBindings keyBindings = KeyBindings::defaults();

    ViewMode viewMode = ViewMode::Unknown;
    AntialiasMode antialiasing = AntialiasMode::Auto;
    std::chrono::milliseconds slideshowDelay{6000};
    // 0 means derive from the system
    qint64 cacheCapacity = 0;
    unsigned workerThreads = 0;

    Impl(Lumen* parent, std::unique_ptr<Settings> s) : q(parent), settings(std::move(s))
    {
        if(::global.isNull())
        {
            ::global = QPointer<Lumen>(q);
        }
    }

    void readSettings()
    {
        q->setViewMode(this->settings->viewMode());
        q->setAntialiasing(this->settings->antialiasing());
        q->setSlideshowDelay(this->settings->slideshowDelay());

        std::lock_guard<std::recursive_mutex> l(this->m);
        this->cacheCapacity = this->settings->cacheCapacityOverride();
        this->workerThreads = static_cast<unsigned>(std::max(this->settings->workerThreadOverride(), 0));
        this->keyBindings = KeyBindings::fromSettings(*this->settings);
    }

    void writeSettings()
    {
        std::lock_guard<std::recursive_mutex> l(this->m);
        this->settings->setViewMode(this->viewMode);
        this->settings->setAntialiasing(this->antialiasing);
        this->settings->setSlideshowDelay(this->slideshowDelay);
        this->settings->setCacheCapacityOverride(this->cacheCapacity);
        this->settings->setWorkerThreadOverride(static_cast<int>(this->workerThreads));
        this->settings->sync();
        if(this->settings->status() != QSettings::NoError)
        {
            qWarning() << "Failed to write settings to" << this->settings->fileName();
        }
    }
};

Lumen* Lumen::globalInstance()
{
    return global.get();
}

qint64 Lumen::systemCacheCapacity()
{
    QFile meminfo("/proc/meminfo");
    if(meminfo.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        static const QRegularExpression re("^MemTotal:\\s+(\\d+)\\s+kB");
        while(!meminfo.atEnd())
        {
            const QString line = QString::fromLatin1(meminfo.readLine());
            QRegularExpressionMatch match = re.match(line);
            if(match.hasMatch())
            {
                bool ok = false;
                qint64 kib = match.captured(1).toLongLong(&ok);
                if(ok && kib > 0)
                {
                    return (kib / 8) * 1024;
                }
            }
        }
    }

    qInfo() << "Could not get system memory size, using default value";
    return FallbackCacheCapacity;
}

unsigned Lumen::systemWorkerThreadCount()
{
    return static_cast<unsigned>(std::clamp(QThread::idealThreadCount(), 2, 4));
}

Lumen::Lumen() : d(std::make_unique<Impl>(this, std::make_unique<Settings>()))
{
    d->readSettings();
}

Lumen::Lumen(const QString& settingsFile) : d(std::make_unique<Impl>(this, std::make_unique<Settings>(settingsFile)))
{
    d->readSettings();
}

Lumen::~Lumen()
{
    d->writeSettings();
}

Settings& Lumen::settings()
{
    return *d->settings;
}

const KeyBindings& Lumen::keyBindings() const
{
    return d->keyBindings;
}

ViewMode Lumen::viewMode()
{
    std::lock_guard<std::recursive_mutex> l(d->m);
    return d->viewMode;
}

void Lumen::setViewMode(ViewMode v)
{
    ViewMode old;
    {
        std::lock_guard<std::recursive_mutex> l(d->m);
        old = d->viewMode;
        d->viewMode = v;
    }
    // always emit, to allow fitting the image again
    emit this->viewModeChanged(v, old);
}

AntialiasMode Lumen::antialiasing()
{
    std::lock_guard<std::recursive_mutex> l(d->m);
    return d->antialiasing;
}

void Lumen::setAntialiasing(AntialiasMode a)
{
    AntialiasMode old;
    {
        std::lock_guard<std::recursive_mutex> l(d->m);
        old = d->antialiasing;
        d->antialiasing = a;
    }
    if(old != a)
    {
        emit this->antialiasingChanged(a, old);
    }
}

std::chrono::milliseconds Lumen::slideshowDelay()
{
    std::lock_guard<std::recursive_mutex> l(d->m);
    return d->slideshowDelay;
}

void Lumen::setSlideshowDelay(std::chrono::milliseconds delay)
{
    if(delay.count() <= 0)
    {
        qWarning() << "Ignoring non-positive slideshow delay of" << delay.count() << "ms";
        return;
    }

    std::chrono::milliseconds old;
    {
        std::lock_guard<std::recursive_mutex> l(d->m);
        old = d->slideshowDelay;
        d->slideshowDelay = delay;
    }
    if(old != delay)
    {
        emit this->slideshowDelayChanged(delay.count(), old.count());
    }
}

qint64 Lumen::cacheCapacity()
{
    std::lock_guard<std::recursive_mutex> l(d->m);
    return d->cacheCapacity > 0 ? d->cacheCapacity : systemCacheCapacity();
}

void Lumen::setCacheCapacity(qint64 bytes)
{
    std::lock_guard<std::recursive_mutex> l(d->m);
    d->cacheCapacity = std::max<qint64>(bytes, 0);
}

unsigned Lumen::workerThreadCount()
{
    std::lock_guard<std::recursive_mutex> l(d->m);
    return d->workerThreads > 0 ? d->workerThreads : systemWorkerThreadCount();
}

void Lumen::setWorkerThreadCount(unsigned threads)
{
    std::lock_guard<std::recursive_mutex> l(d->m);
    d->workerThreads = threads;
}

void Lumen::readSettings()
{
    d->readSettings();
}

void Lumen::writeSettings()
{
    d->writeSettings();
}
