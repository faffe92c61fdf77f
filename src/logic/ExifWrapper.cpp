#include "ExifWrapper.hpp"

#include <QByteArray>
#include <QDebug>
#include <KExiv2/KExiv2>
#include <optional>

using OR = KExiv2Iface::KExiv2::ImageOrientation;

struct ExifWrapper::Impl
{
    KExiv2Iface::KExiv2 mExivHandle;

    std::optional<Orientation> cachedOrientation;
};

ExifWrapper::ExifWrapper()
    : d(std::make_unique<Impl>())
{
}

ExifWrapper::~ExifWrapper() = default;

bool ExifWrapper::loadFromData(const QByteArray &data)
{
    d->cachedOrientation.reset();
    return d->mExivHandle.loadFromData(data);
}

Orientation ExifWrapper::orientation()
{
    if(!d->cachedOrientation)
    {
        // getImageOrientation() is a bit expensive down in Exiv2
        OR o = d->mExivHandle.getImageOrientation();
        d->cachedOrientation = fromExifOrientation(static_cast<int>(o));
    }

    return d->cachedOrientation.value();
}

// The rotations are counter-clockwise, i.e. the way the texture has to be turned for display.
Orientation ExifWrapper::fromExifOrientation(int exifValue)
{
    switch(exifValue)
    {
    case OR::ORIENTATION_NORMAL:
        return Orientation::Deg0;
    case OR::ORIENTATION_HFLIP:
        return Orientation::Deg0HorFlip;
    case OR::ORIENTATION_ROT_180:
        return Orientation::Deg180;
    case OR::ORIENTATION_VFLIP:
        return Orientation::Deg180HorFlip;
    case OR::ORIENTATION_ROT_90_HFLIP:
        return Orientation::Deg90VerFlip;
    case OR::ORIENTATION_ROT_90:
        return Orientation::Deg270;
    case OR::ORIENTATION_ROT_90_VFLIP:
        return Orientation::Deg270VerFlip;
    case OR::ORIENTATION_ROT_270:
        return Orientation::Deg90;
    default:
        qDebug() << "Unspecified EXIF orientation" << exifValue << ", assuming upright image";
        return Orientation::Deg0;
    }
}
