#pragma once

#include "Formatter.hpp"

#include <QString>

#include <stdexcept>

// The requested image is still being decoded by a background worker. Retry later.
class WaitingOnLoader : public std::runtime_error
{
public:
    WaitingOnLoader() : std::runtime_error("Image is still being decoded in the background")
    {}
};

// The supported-file mappings of the current directory are not known yet. Retry later.
class WaitingOnDirectoryFilter : public std::runtime_error
{
public:
    WaitingOnDirectoryFilter() : std::runtime_error("Directory filtering has not finished yet")
    {}
};

// Relative navigation was requested before any file or directory was opened.
class PathNotYetSpecified : public std::runtime_error
{
public:
    PathNotYetSpecified() : std::runtime_error("No file or directory has been opened yet")
    {}
};

class NavigationError : public std::runtime_error
{
public:
    enum class Reason
    {
        FileNotFound,
        IndexOutOfRange,
        EmptyDirectory,
        UnsupportedFile,
    };

    NavigationError(Reason reason, const std::string& msg) : std::runtime_error(msg), mReason(reason)
    {}

    static NavigationError fileNotFound(const QString& name, const QString& dir)
    {
        return NavigationError(Reason::FileNotFound, Formatter() << "Could not find file '" << name << "' in directory '" << dir << "'");
    }

    static NavigationError indexOutOfRange(qint64 index, qint64 count)
    {
        return NavigationError(Reason::IndexOutOfRange, Formatter() << "Image index " << index << " is out of range, the directory contains " << count << " images");
    }

    static NavigationError emptyDirectory(const QString& dir)
    {
        return NavigationError(Reason::EmptyDirectory, Formatter() << "Directory '" << dir << "' does not contain any supported image");
    }

    static NavigationError fileNotSupported(const QString& path)
    {
        return NavigationError(Reason::UnsupportedFile, Formatter() << "File '" << path << "' is not a supported image");
    }

    Reason reason() const
    {
        return mReason;
    }

private:
    Reason mReason;
};

// Decoding a file failed. Carries the path and the message of the underlying decoder error.
class ImageDecodeError : public std::runtime_error
{
public:
    ImageDecodeError(const QString& path, const std::string& cause)
        : std::runtime_error(Formatter() << "Failed to decode '" << path << "': " << cause), mPath(path)
    {}

    const QString& path() const
    {
        return mPath;
    }

private:
    QString mPath;
};
