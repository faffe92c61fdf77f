#pragma once

#include "SmartImageDecoder.hpp"


class SmartJpegDecoder : public SmartImageDecoder
{
public:
    SmartJpegDecoder(const QFileInfo& info);
    ~SmartJpegDecoder() override;

    SmartJpegDecoder(const SmartJpegDecoder&) = delete;
    SmartJpegDecoder& operator=(const SmartJpegDecoder&) = delete;

    void close() override;

protected:
    void decodeHeader(const unsigned char* buffer, qint64 nbytes) override;
    std::vector<DecodedFrame> decodingLoop(bool allowAnimation) override;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
