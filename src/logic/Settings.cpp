#include "Settings.hpp"

Settings::Settings() : QSettings(QSettings::IniFormat, QSettings::UserScope, "Lumen", "Lumen")
{
}

Settings::Settings(const QString& fileName) : QSettings(fileName, QSettings::IniFormat)
{
}

Settings::~Settings() = default;

ViewMode Settings::viewMode()
{
    return static_cast<ViewMode>(this->value("view/mode", static_cast<int>(ViewMode::Fit)).toInt());
}

void Settings::setViewMode(ViewMode mode)
{
    this->setValue("view/mode", static_cast<int>(mode));
}

AntialiasMode Settings::antialiasing()
{
    return static_cast<AntialiasMode>(this->value("view/antialiasing", static_cast<int>(AntialiasMode::Auto)).toInt());
}

void Settings::setAntialiasing(AntialiasMode mode)
{
    this->setValue("view/antialiasing", static_cast<int>(mode));
}

std::chrono::milliseconds Settings::slideshowDelay()
{
    return std::chrono::milliseconds(this->value("playback/slideshowDelayMs", 6000).toLongLong());
}

void Settings::setSlideshowDelay(std::chrono::milliseconds delay)
{
    this->setValue("playback/slideshowDelayMs", static_cast<qlonglong>(delay.count()));
}

qint64 Settings::cacheCapacityOverride()
{
    return this->value("cache/capacityBytes", 0).toLongLong();
}

void Settings::setCacheCapacityOverride(qint64 bytes)
{
    this->setValue("cache/capacityBytes", static_cast<qlonglong>(bytes));
}

int Settings::workerThreadOverride()
{
    return this->value("cache/workerThreads", 0).toInt();
}

void Settings::setWorkerThreadOverride(int threads)
{
    this->setValue("cache/workerThreads", threads);
}
