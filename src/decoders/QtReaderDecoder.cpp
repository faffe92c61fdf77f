#include "QtReaderDecoder.hpp"

#include "Formatter.hpp"

#include <QBuffer>
#include <QImageReader>
#include <QDebug>

struct QtReaderDecoder::Impl
{
    QByteArray format;
    QByteArray encoded;
    QBuffer buffer;
    std::unique_ptr<QImageReader> reader;

    static std::chrono::nanoseconds frameDelay(int delayMs)
    {
        if(delayMs <= 0)
        {
            delayMs = QtReaderDecoder::DefaultFrameDelayMs;
        }
        return std::chrono::milliseconds(delayMs);
    }

    void release()
    {
        this->reader.reset();
        if(this->buffer.isOpen())
        {
            this->buffer.close();
        }
        this->buffer.setData(QByteArray());
        this->encoded.clear();
    }
};

QtReaderDecoder::QtReaderDecoder(const QFileInfo& info, const QByteArray& format) : SmartImageDecoder(info), d(std::make_unique<Impl>())
{
    d->format = format;
}

QtReaderDecoder::~QtReaderDecoder()
{
    d->release();
}

void QtReaderDecoder::decodeHeader(const unsigned char* buffer, qint64 nbytes)
{
    d->release();

    // the mapped file outlives the reader, see close()
    d->encoded = QByteArray::fromRawData(reinterpret_cast<const char*>(buffer), nbytes);
    d->buffer.setData(d->encoded);
    if(!d->buffer.open(QIODevice::ReadOnly))
    {
        throw std::runtime_error(Formatter() << "Unable to open in-memory buffer of '" << this->fileInfo().fileName() << "'");
    }

    d->reader = std::make_unique<QImageReader>(&d->buffer, d->format);
    d->reader->setAutoTransform(false);

    if(!d->reader->canRead())
    {
        throw std::runtime_error(Formatter() << "No Qt image plugin is able to read '" << this->fileInfo().fileName() << "': " << d->reader->errorString());
    }

    this->setDecodingMessage("Reading header via QImageReader");

    QSize size = d->reader->size();
    this->setSize(size);
}

std::vector<DecodedFrame> QtReaderDecoder::decodingLoop(bool allowAnimation)
{
    if(!d->reader)
    {
        throw std::logic_error("QtReaderDecoder::decodingLoop() called without decodeHeader()");
    }

    std::vector<DecodedFrame> frames;
    const bool animated = allowAnimation && d->reader->supportsAnimation();

    this->setDecodingMessage("Decoding via QImageReader");

    do
    {
        QImage img = d->reader->read();
        if(img.isNull())
        {
            if(frames.empty())
            {
                throw std::runtime_error(Formatter() << "QImageReader failed on '" << this->fileInfo().fileName() << "': " << d->reader->errorString());
            }
            // a truncated animation still shows the frames read so far
            qWarning() << "Stopped reading frames of" << this->fileInfo().fileName() << "after" << frames.size() << "frames:" << d->reader->errorString();
            break;
        }

        if(frames.empty())
        {
            this->setSize(img.size());
            this->setColorSpace(img.colorSpace());
        }

        img.convertTo(QImage::Format_RGBA8888);
        this->convertColorSpace(img);

        DecodedFrame frame;
        frame.image = std::move(img);
        frame.delay = animated ? Impl::frameDelay(d->reader->nextImageDelay()) : std::chrono::nanoseconds(0);
        frames.push_back(std::move(frame));
    }
    while(animated && d->reader->canRead());

    return frames;
}

void QtReaderDecoder::close()
{
    d->release();

    SmartImageDecoder::close();
}
