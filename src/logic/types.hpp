#pragma once

#include <QMetaType>

// How the displayed image is fitted into the viewport
enum class ViewMode : int
{
    Unknown,
    None,
    Fit,
};

enum class AntialiasMode : int
{
    Auto,
    Always,
    Never,
};

// The eight EXIF orientations, expressed as rotation followed by an optional flip
enum class Orientation : int
{
    Deg0,
    Deg0HorFlip,
    Deg90,
    Deg90VerFlip,
    Deg180,
    Deg180HorFlip,
    Deg270,
    Deg270VerFlip,
};

enum class PlaybackState : int
{
    Paused,
    Forward,
    Present,
    RandomPresent,
};

class LoadedImage;
class SmartImageDecoder;
class Texture;
