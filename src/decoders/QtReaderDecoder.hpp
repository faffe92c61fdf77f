#pragma once

#include "SmartImageDecoder.hpp"

#include <QByteArray>

/**
 * Decodes everything the installed Qt image format plugins can read, including the frames of
 * animated GIF and WebP files.
 */
class QtReaderDecoder : public SmartImageDecoder
{
public:
    // Frames which claim a delay of zero are shown for this long
    static constexpr int DefaultFrameDelayMs = 100;

    QtReaderDecoder(const QFileInfo& info, const QByteArray& format = QByteArray());
    ~QtReaderDecoder() override;

    QtReaderDecoder(const QtReaderDecoder&) = delete;
    QtReaderDecoder& operator=(const QtReaderDecoder&) = delete;

    void close() override;

protected:
    void decodeHeader(const unsigned char* buffer, qint64 nbytes) override;
    std::vector<DecodedFrame> decodingLoop(bool allowAnimation) override;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
