#pragma once

#include <QtGlobal>

enum DecodingState : quint32
{
    // Decoder is idle, nothing has been decoded yet
    Ready,

    // Dimensions, color space and orientation are known at this stage
    Metadata,

    // Decoding has finished successfully, all requested frames are available.
    FullImage,

    // The decoding process has failed, reset() allows another attempt.
    Error,

    // The file could not even be opened or its header could not be read.
    Fatal,
};
