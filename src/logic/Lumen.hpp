#pragma once

#include "KeyBindings.hpp"
#include "types.hpp"

#include <QObject>
#include <QString>

#include <chrono>
#include <memory>

class Settings;

/**
 * Holds the user preferences shared by the cache and the playback. Exactly one instance is
 * reachable through globalInstance(), the first one constructed. All accessors are thread-safe.
 */
class Lumen : public QObject
{
    Q_OBJECT

public:
    static constexpr qint64 FallbackCacheCapacity = 500000000;

    static Lumen* globalInstance();

    // total physical memory / 8, or FallbackCacheCapacity if it cannot be determined
    static qint64 systemCacheCapacity();
    // number of CPUs, clamped to [2, 4]
    static unsigned systemWorkerThreadCount();

    Lumen();
    explicit Lumen(const QString& settingsFile);
    ~Lumen() override;

    Settings& settings();
    const KeyBindings& keyBindings() const;

    ViewMode viewMode();
    void setViewMode(ViewMode);

    AntialiasMode antialiasing();
    void setAntialiasing(AntialiasMode);

    std::chrono::milliseconds slideshowDelay();
    void setSlideshowDelay(std::chrono::milliseconds);

    qint64 cacheCapacity();
    void setCacheCapacity(qint64 bytes);

    unsigned workerThreadCount();
    void setWorkerThreadCount(unsigned threads);

    void readSettings();
    void writeSettings();

signals:
    void viewModeChanged(ViewMode newMode, ViewMode old);
    void antialiasingChanged(AntialiasMode newMode, AntialiasMode old);
    void slideshowDelayChanged(qint64 newDelayMs, qint64 oldMs);

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
