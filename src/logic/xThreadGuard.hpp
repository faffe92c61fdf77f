#pragma once

#include "Formatter.hpp"

#include <QThread>
#include <QObject>

#include <stdexcept>

// Throws if the current thread is not the one the guarded object belongs to.
class xThreadGuard
{
public:
    xThreadGuard(const QObject* o, const char* operation = nullptr) : xThreadGuard(o->thread(), operation)
    {}
    xThreadGuard(const QThread * thrd, const char* operation = nullptr)
    {
        if(QThread::currentThread() != thrd)
        {
            Formatter f;
            f << "Cross Thread Exception!";
            if(operation != nullptr)
            {
                f << " '" << operation << "' must be called from thread " << thrd;
            }
            throw std::logic_error(f.str());
        }
    }
    xThreadGuard(const xThreadGuard&) = delete;
    xThreadGuard(xThreadGuard&&) = delete;
    ~xThreadGuard() = default;
};
