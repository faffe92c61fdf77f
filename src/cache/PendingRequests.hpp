#pragma once

#include "DecodeResult.hpp"

#include <QString>

#include <optional>
#include <map>
#include <unordered_map>
#include <vector>

struct PendingRequestInfo
{
    QString path;
    bool cancelled = false;
    bool finished = false;
    std::vector<DecodeResult> results;
};

/**
 * Book keeping of the requests handed to the ImageLoader that have not been fully consumed yet.
 * Results are correlated by request id, a secondary index allows cancelling by path.
 */
class PendingRequests
{
public:
    void addRequest(const DecodeRequest& request);
    // Returns false for results of unknown requests, which are to be discarded.
    bool addLoadResult(DecodeResult result);

    // Moves out the results received so far. A finished request is removed along the way.
    std::optional<std::vector<DecodeResult>> takeResults(quint32 id);
    // Marks the request as complete, removing it right away if there is nothing left to take.
    void setFinished(quint32 id);

    // Cancelled requests stay known until finished so that their late results can be dropped
    bool cancel(const QString& path);
    void cancelAll();

    std::optional<quint32> idForPath(const QString& path) const;
    std::optional<bool> cancelled(quint32 id) const;
    const PendingRequestInfo* get(quint32 id) const;
    // true for a request whose results are still expected
    bool contains(quint32 id) const;
    std::vector<quint32> allIds() const;
    size_t size() const;

    void remove(quint32 id);

private:
    std::unordered_map<quint32, PendingRequestInfo> byId;
    std::map<QString, quint32> pathToId;
};
