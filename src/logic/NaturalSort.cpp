#include "NaturalSort.hpp"

#include <QByteArray>

#ifdef _WINDOWS
#include <windows.h>
#include <shlwapi.h>
#include <string>
#else
#include <cstring>
#endif

bool compareFileName(const QString &l, const QString &r)
{
#ifdef _WINDOWS
    std::wstring lw = l.toCaseFolded().toStdWString();
    std::wstring rw = r.toCaseFolded().toStdWString();
    int res = StrCmpLogicalW(lw.c_str(), rw.c_str());
#else
    QByteArray lfile = l.toCaseFolded().toUtf8();
    QByteArray rfile = r.toCaseFolded().toUtf8();
    int res = strverscmp(lfile.constData(), rfile.constData());
#endif

    if(res == 0)
    {
        // "A.png" and "a.png" may coexist, keep the order strict
        return l < r;
    }
    return res < 0;
}
