#include "SmartImageDecoder.hpp"

#include "Formatter.hpp"
#include "ExifWrapper.hpp"

#include <QtDebug>
#include <QFile>
#include <QColorTransform>
#include <QScopedPointer>
#include <cstdlib>
#include <new>

struct SmartImageDecoder::Impl
{
    SmartImageDecoder *q;

    QFileInfo fileInfo;
    DecodingState state = DecodingState::Ready;
    QString errorMessage;
    QString decodingMessage;

    QSize size;
    QColorSpace colorSpace;
    Orientation orientation = Orientation::Deg0;

    // DO NOT STORE THE QFILE DIRECTLY!
    // QFile is a QObject! It has thread affinity! Creating it by the worker thread and destrorying it by the UI thread will lead to memory corruption!
    QScopedPointer<QFile> file;
    qint64 encodedInputBufferSize = 0;
    const unsigned char *encodedInputBufferPtr = nullptr;

    Impl(SmartImageDecoder *q) : q(q)
    {}

    void open()
    {
        if(this->file != nullptr && this->file->isOpen())
        {
            throw std::logic_error("File is already open!");
        }

        this->file.reset(new QFile(this->fileInfo.absoluteFilePath()));

        if(!this->file->open(QIODevice::ReadOnly))
        {
            throw std::runtime_error(Formatter() << "Unable to open file '" << this->fileInfo.absoluteFilePath() << "', error was: " << this->file->errorString());
        }
    }

    void fail(DecodingState state, const std::exception& e)
    {
        this->errorMessage = QString::fromUtf8(e.what());
        q->setDecodingState(state);
    }

    template<typename T>
    QImage allocateImageBuffer(uint32_t width, uint32_t height, QImage::Format format)
    {
        const size_t needed = size_t(width) * height;
        const size_t rowStride = width * sizeof(T);

        try
        {
            q->setDecodingMessage("Allocating image output buffer");

            std::unique_ptr<T, decltype(&free)> mem(static_cast<T *>(calloc(needed, sizeof(T))), &::free);

            if(mem.get() == nullptr)
            {
                throw std::bad_alloc();
            }

            QImage image(reinterpret_cast<uint8_t *>(mem.get()), width, height, rowStride, format, &free, mem.get());

            if(image.isNull())
            {
                throw std::runtime_error("QImage ctor created a NULL image...");
            }

            mem.release();
            return image;
        }
        catch(const std::bad_alloc &)
        {
            throw std::runtime_error(Formatter() << "Unable to allocate " << (needed * sizeof(T)) / 1024. / 1024. << " MiB for the decoded image with dimensions " << width << "x" << height << " px");
        }
    }
};

SmartImageDecoder::SmartImageDecoder(const QFileInfo& info) : d(std::make_unique<Impl>(this))
{
    d->fileInfo = info;
}

SmartImageDecoder::~SmartImageDecoder() = default;

const QFileInfo& SmartImageDecoder::fileInfo() const
{
    return d->fileInfo;
}

DecodingState SmartImageDecoder::decodingState() const
{
    return d->state;
}

QString SmartImageDecoder::errorMessage() const
{
    return d->errorMessage;
}

QString SmartImageDecoder::decodingMessage() const
{
    return d->decodingMessage;
}

QSize SmartImageDecoder::size() const
{
    return d->size;
}

Orientation SmartImageDecoder::orientation() const
{
    return d->orientation;
}

void SmartImageDecoder::setDecodingState(DecodingState state)
{
    d->state = state;
}

void SmartImageDecoder::setDecodingMessage(QString &&msg)
{
    d->decodingMessage = std::move(msg);
}

void SmartImageDecoder::setSize(const QSize& size)
{
    d->size = size;
}

void SmartImageDecoder::setColorSpace(const QColorSpace& csp)
{
    d->colorSpace = csp;
}

const unsigned char* SmartImageDecoder::encodedInputBuffer() const
{
    return d->encodedInputBufferPtr;
}

qint64 SmartImageDecoder::encodedInputBufferSize() const
{
    return d->encodedInputBufferSize;
}

void SmartImageDecoder::open()
{
    try
    {
        d->open();
    }
    catch(const std::exception &e)
    {
        d->fail(DecodingState::Fatal, e);
        throw;
    }
}

// initializes the decoder, by reading as much of the file as necessary to know about most important information
void SmartImageDecoder::init()
{
    try
    {
        if(!d->file || !d->file->isOpen())
        {
            throw std::logic_error("Decoder must be opened for init()");
        }

        // mmap() the file-> Do NOT use MAP_PRIVATE! See https://stackoverflow.com/a/7222430
        qint64 mapSize = d->file->size();
        const unsigned char *fileMapped = d->file->map(0, mapSize, QFileDevice::NoOptions);

        if(fileMapped == nullptr)
        {
            throw std::runtime_error(Formatter() << "Could not mmap() file '" << d->file->fileName() << "', error was: " << d->file->errorString());
        }

        d->encodedInputBufferSize = mapSize;
        d->encodedInputBufferPtr = fileMapped;

        this->decodeHeader(d->encodedInputBufferPtr, d->encodedInputBufferSize);

        ExifWrapper exif;
        if(exif.loadFromData(QByteArray::fromRawData(reinterpret_cast<const char *>(fileMapped), mapSize)))
        {
            d->orientation = exif.orientation();
        }
        else
        {
            d->orientation = Orientation::Deg0;
        }

        this->setDecodingState(DecodingState::Metadata);
    }
    catch(const std::exception &e)
    {
        d->fail(DecodingState::Fatal, e);
        throw;
    }
}

std::vector<DecodedFrame> SmartImageDecoder::decode(bool allowAnimation)
{
    try
    {
        if(d->state == DecodingState::Ready)
        {
            this->init();
        }
        else if(d->state != DecodingState::Metadata)
        {
            throw std::logic_error("decode() requires an initialized decoder, call reset() first");
        }

        std::vector<DecodedFrame> frames = this->decodingLoop(allowAnimation);
        if(frames.empty())
        {
            throw std::runtime_error(Formatter() << "Decoder did not produce any frame for '" << d->fileInfo.fileName() << "'");
        }

        for(auto& f : frames)
        {
            f.orientation = d->orientation;
        }

        this->setDecodingState(DecodingState::FullImage);
        return frames;
    }
    catch(const std::exception &e)
    {
        // init() has already recorded its failure as Fatal
        if(d->state != DecodingState::Fatal)
        {
            d->fail(DecodingState::Error, e);
        }
        throw;
    }
}

void SmartImageDecoder::convertColorSpace(QImage &image)
{
    static const QColorSpace srgbSpace(QColorSpace::SRgb);
    const QColorSpace& csp = d->colorSpace;

    if(csp.isValid() && csp != srgbSpace)
    {
        this->setDecodingMessage("Transforming colorspace...");
        image.applyColorTransform(csp.transformationToColorSpace(srgbSpace));
    }
    image.setColorSpace(srgbSpace);
}

void SmartImageDecoder::close()
{
    d->encodedInputBufferSize = 0;
    d->encodedInputBufferPtr = nullptr;

    if(d->file)
    {
        d->file->close();
        d->file.reset();
    }
}

void SmartImageDecoder::reset()
{
    d->errorMessage.clear();
    d->decodingMessage.clear();
    d->size = QSize();
    d->colorSpace = QColorSpace();
    d->orientation = Orientation::Deg0;
    this->setDecodingState(DecodingState::Ready);
}

QImage SmartImageDecoder::allocateImageBuffer(uint32_t width, uint32_t height, QImage::Format format)
{
    switch(format)
    {
    case QImage::Format_RGB32:
    case QImage::Format_ARGB32:
    case QImage::Format_RGBX8888:
    case QImage::Format_RGBA8888:
        return d->allocateImageBuffer<uint32_t>(width, height, format);

    default:
        throw std::logic_error(Formatter() << "QImage Format '" << format << "' not supported currently");
    }
}
