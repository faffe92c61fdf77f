#pragma once

#include "SmartImageDecoder.hpp"


class SmartPngDecoder : public SmartImageDecoder
{
public:
    SmartPngDecoder(const QFileInfo& info);
    ~SmartPngDecoder() override;

    SmartPngDecoder(const SmartPngDecoder&) = delete;
    SmartPngDecoder& operator=(const SmartPngDecoder&) = delete;

    void close() override;

protected:
    void decodeHeader(const unsigned char* buffer, qint64 nbytes) override;
    std::vector<DecodedFrame> decodingLoop(bool allowAnimation) override;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
