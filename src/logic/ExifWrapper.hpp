#pragma once

#include "types.hpp"

#include <memory>
#include <QString>

class QByteArray;

/**
 * This helper class reads EXIF metadata using libkexiv2. Only the orientation
 * is of interest for displaying images.
 */
class ExifWrapper
{
public:
    ExifWrapper();
    ~ExifWrapper();

    ExifWrapper(const ExifWrapper &) = delete;
    ExifWrapper &operator=(const ExifWrapper &) = delete;

    // NOTE: data must stay alive as long as this object is used
    bool loadFromData(const QByteArray &data);
    Orientation orientation();

    static Orientation fromExifOrientation(int exifValue);

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
