#include "PendingRequests.hpp"

#include <QDebug>

void PendingRequests::addRequest(const DecodeRequest& request)
{
    // a newer request for the same path supersedes the older one
    auto old = this->pathToId.find(request.path);
    if(old != this->pathToId.end() && old->second != request.requestId)
    {
        auto info = this->byId.find(old->second);
        if(info != this->byId.end())
        {
            info->second.cancelled = true;
        }
    }

    this->pathToId[request.path] = request.requestId;

    PendingRequestInfo info;
    info.path = request.path;
    this->byId[request.requestId] = std::move(info);
}

bool PendingRequests::addLoadResult(DecodeResult result)
{
    auto it = this->byId.find(result.requestId);
    if(it == this->byId.end())
    {
        qDebug() << "Dropping decode result for unknown request" << result.requestId << result.path;
        return false;
    }

    it->second.results.push_back(std::move(result));
    return true;
}

std::optional<std::vector<DecodeResult>> PendingRequests::takeResults(quint32 id)
{
    auto it = this->byId.find(id);
    if(it == this->byId.end())
    {
        return std::nullopt;
    }

    std::vector<DecodeResult> res = std::move(it->second.results);
    it->second.results.clear();
    if(it->second.finished)
    {
        this->remove(id);
    }
    return res;
}

void PendingRequests::setFinished(quint32 id)
{
    auto it = this->byId.find(id);
    if(it == this->byId.end())
    {
        return;
    }

    if(it->second.results.empty())
    {
        this->remove(id);
    }
    else
    {
        it->second.finished = true;
    }
}

bool PendingRequests::cancel(const QString& path)
{
    auto it = this->pathToId.find(path);
    if(it == this->pathToId.end())
    {
        return false;
    }

    auto info = this->byId.find(it->second);
    if(info == this->byId.end())
    {
        return false;
    }

    info->second.cancelled = true;
    info->second.results.clear();
    return true;
}

void PendingRequests::cancelAll()
{
    for(auto& [id, info] : this->byId)
    {
        info.cancelled = true;
        info.results.clear();
    }
}

std::optional<quint32> PendingRequests::idForPath(const QString& path) const
{
    auto it = this->pathToId.find(path);
    if(it == this->pathToId.end() || !this->contains(it->second))
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<bool> PendingRequests::cancelled(quint32 id) const
{
    const PendingRequestInfo* info = this->get(id);
    if(info == nullptr)
    {
        return std::nullopt;
    }
    return info->cancelled;
}

const PendingRequestInfo* PendingRequests::get(quint32 id) const
{
    auto it = this->byId.find(id);
    if(it == this->byId.end() || it->second.finished)
    {
        return nullptr;
    }
    return &it->second;
}

bool PendingRequests::contains(quint32 id) const
{
    return this->get(id) != nullptr;
}

std::vector<quint32> PendingRequests::allIds() const
{
    std::vector<quint32> ids;
    ids.reserve(this->byId.size());
    for(const auto& [id, info] : this->byId)
    {
        ids.push_back(id);
    }
    return ids;
}

size_t PendingRequests::size() const
{
    size_t n = 0;
    for(const auto& [id, info] : this->byId)
    {
        if(!info.finished)
        {
            n++;
        }
    }
    return n;
}

void PendingRequests::remove(quint32 id)
{
    auto it = this->byId.find(id);
    if(it == this->byId.end())
    {
        return;
    }

    auto p = this->pathToId.find(it->second.path);
    if(p != this->pathToId.end() && p->second == id)
    {
        this->pathToId.erase(p);
    }
    this->byId.erase(it);
}
