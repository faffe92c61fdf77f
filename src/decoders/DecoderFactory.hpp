#pragma once

#include <QFileInfo>
#include <QByteArray>
#include <memory>

class SmartImageDecoder;

class DecoderFactory
{
public:
    static DecoderFactory* globalInstance();

    ~DecoderFactory();

    // returns nullptr if no decoder is able to handle the file
    std::unique_ptr<SmartImageDecoder> getDecoder(const QFileInfo& info);
    std::unique_ptr<SmartImageDecoder> getDecoder(const QFileInfo& info, const QByteArray& formatHint);

private:
    DecoderFactory();
};
