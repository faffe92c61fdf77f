#pragma once

#include <QString>
#include <QtGlobal>

// One entry of a directory listing, as seen at scan time.
struct DirItem
{
    QString path;
    // unique per scanned entry, increases monotonically over the lifetime of a Directory
    quint32 requestId = 0;

    QString fileName() const;
};
