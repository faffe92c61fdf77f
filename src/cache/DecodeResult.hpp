#pragma once

#include "DecodedFrame.hpp"

#include <QDateTime>
#include <QString>

struct DecodeRequest
{
    quint32 requestId = 0;
    // an empty path tells the receiving worker to quit
    QString path;
};

// What a decoder worker reports back. One request produces Start, then any number of Frame, then Done or Failed.
struct DecodeResult
{
    enum class Kind
    {
        Start,
        Frame,
        Done,
        Failed,
    };

    Kind kind = Kind::Failed;
    quint32 requestId = 0;
    QString path;

    // Start only
    QDateTime lastModified;
    // Frame only
    DecodedFrame frame;
    // Failed only
    QString errorMessage;
};
