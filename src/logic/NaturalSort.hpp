#pragma once

#include <QString>

// Compares file names the way a human would: case insensitive, with embedded digit runs compared by value.
// Returns true if l sorts before r.
bool compareFileName(const QString &l, const QString &r);

struct FileNameLess
{
    bool operator()(const QString &l, const QString &r) const
    {
        return compareFileName(l, r);
    }
};
