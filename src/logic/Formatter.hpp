#pragma once

#include <QString>

#include <sstream>
#include <string>

class Formatter
{
public:
    Formatter() = default;
    ~Formatter() = default;

    Formatter(const Formatter &) = delete;
    Formatter(Formatter&&) = delete;

    template <typename Type>
    Formatter & operator << (const Type & value)
    {
        stream << value;
        return *this;
    }

    Formatter & operator << (const QString & value)
    {
        stream << value.toStdString();
        return *this;
    }

    std::string str() const { return stream.str(); }
    QString qstr() const { return QString::fromStdString(stream.str()); }
    operator std::string () const { return stream.str(); }

private:
    std::stringstream stream;
};
