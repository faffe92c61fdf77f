#pragma once

#include "types.hpp"

#include <QSettings>
#include <QString>

#include <chrono>

class Settings : public QSettings
{
public:
    Settings();
    // for a settings file at an explicit location
    explicit Settings(const QString& fileName);
    ~Settings() override;

    ViewMode viewMode();
    void setViewMode(ViewMode mode);

    AntialiasMode antialiasing();
    void setAntialiasing(AntialiasMode mode);

    std::chrono::milliseconds slideshowDelay();
    void setSlideshowDelay(std::chrono::milliseconds delay);

    // 0 means derive from the system
    qint64 cacheCapacityOverride();
    void setCacheCapacityOverride(qint64 bytes);

    int workerThreadOverride();
    void setWorkerThreadOverride(int threads);
};
