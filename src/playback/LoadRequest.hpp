#pragma once

#include <QString>

#include <cstddef>

// A navigation action handed to a PlaybackSequencer. Executed on its next update().
struct LoadRequest
{
    enum class Kind
    {
        None,
        LoadNext,
        LoadPrevious,
        FilePath,
        LoadAtIndex,
        Jump,
    };

    Kind kind = Kind::None;
    QString path;
    size_t index = 0;
    int jump = 0;

    static LoadRequest next()
    {
        LoadRequest r;
        r.kind = Kind::LoadNext;
        return r;
    }

    static LoadRequest previous()
    {
        LoadRequest r;
        r.kind = Kind::LoadPrevious;
        return r;
    }

    static LoadRequest filePath(const QString& path)
    {
        LoadRequest r;
        r.kind = Kind::FilePath;
        r.path = path;
        return r;
    }

    static LoadRequest atIndex(size_t index)
    {
        LoadRequest r;
        r.kind = Kind::LoadAtIndex;
        r.index = index;
        return r;
    }

    static LoadRequest jumpBy(int count)
    {
        LoadRequest r;
        r.kind = Kind::Jump;
        r.jump = count;
        return r;
    }

    bool isNone() const
    {
        return this->kind == Kind::None;
    }

    bool operator==(const LoadRequest& other) const = default;
};
