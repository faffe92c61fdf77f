#pragma once

#include "types.hpp"

#include <QImage>

#include <chrono>

// One RGBA8888 frame as produced by a decoder. Still images consist of exactly one frame with zero delay.
struct DecodedFrame
{
    QImage image;
    std::chrono::nanoseconds delay{0};
    Orientation orientation = Orientation::Deg0;
};
