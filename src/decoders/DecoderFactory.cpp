#include "DecoderFactory.hpp"

#include "SmartImageDecoder.hpp"
#include "SmartJpegDecoder.hpp"
#include "SmartPngDecoder.hpp"
#include "QtReaderDecoder.hpp"

#include <QImageReader>
#include <QDebug>


DecoderFactory::DecoderFactory() = default;

DecoderFactory::~DecoderFactory() = default;

DecoderFactory *DecoderFactory::globalInstance()
{
    static DecoderFactory fac;
    return &fac;
}

std::unique_ptr<SmartImageDecoder> DecoderFactory::getDecoder(const QFileInfo &info)
{
    // try to derive decoder from fileExtension
    auto dec = this->getDecoder(info, info.suffix().toLower().toLatin1());
    if(!dec)
    {
        // if that didn't work, try to determine type by opening the file
        dec = this->getDecoder(info, QByteArray());
    }

    return dec;
}

std::unique_ptr<SmartImageDecoder> DecoderFactory::getDecoder(const QFileInfo &info, const QByteArray &formatHint)
{
    if(!info.isFile())
    {
        return nullptr;
    }

    QByteArray format;

    if(formatHint.isEmpty())
    {
        qInfo() << "Could not determine file extension for file " << info.fileName();
        QImageReader r(info.absoluteFilePath());
        format = r.format();
        qDebug() << "Determined format " << format << " for file " << info.fileName();
    }
    else
    {
        format = formatHint;
    }

    if(format == "jpeg" || format == "jpg")
    {
        return std::make_unique<SmartJpegDecoder>(info);
    }
    else if(format == "png")
    {
        return std::make_unique<SmartPngDecoder>(info);
    }
    else if(!format.isEmpty() && QImageReader::supportedImageFormats().contains(format))
    {
        return std::make_unique<QtReaderDecoder>(info, format);
    }

    return nullptr;
}
