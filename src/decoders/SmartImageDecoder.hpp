#pragma once

#include <QFileInfo>
#include <QColorSpace>
#include <QSize>
#include <QImage>
#include <cstdint>
#include <memory>
#include <vector>

#include "DecodingState.hpp"
#include "DecodedFrame.hpp"
#include "types.hpp"

/**
 * Base class for image decoders. Not a QObject and may therefore be owned by any thread, passed around as pleased.
 * A decoder instance is used for exactly one file.
 */
class SmartImageDecoder
{
public:
    SmartImageDecoder(const QFileInfo& info);
    virtual ~SmartImageDecoder();

    SmartImageDecoder(const SmartImageDecoder&) = delete;
    SmartImageDecoder& operator=(const SmartImageDecoder&) = delete;

    const QFileInfo& fileInfo() const;
    DecodingState decodingState() const;
    QString errorMessage() const;
    QString decodingMessage() const;
    QSize size() const;
    Orientation orientation() const;

    // open(), init(), decode(), close(), reset() must be called by the same thread!
    // they are virtual for the purpose of unit testing.
    virtual void open();
    virtual void init();
    // returns all frames of an animation if allowAnimation is set, only the first one otherwise
    virtual std::vector<DecodedFrame> decode(bool allowAnimation = true);
    virtual void close();
    void reset();

protected:
    virtual void decodeHeader(const unsigned char* buffer, qint64 nbytes) = 0;
    virtual std::vector<DecodedFrame> decodingLoop(bool allowAnimation) = 0;

    QImage allocateImageBuffer(uint32_t width, uint32_t height, QImage::Format format);
    void convertColorSpace(QImage& image);

    void setSize(const QSize& size);
    void setColorSpace(const QColorSpace& csp);
    void setDecodingState(DecodingState state);
    void setDecodingMessage(QString&& msg);

    const unsigned char* encodedInputBuffer() const;
    qint64 encodedInputBufferSize() const;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
