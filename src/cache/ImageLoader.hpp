#pragma once

#include "DecodeResult.hpp"

#include <memory>
#include <optional>
#include <vector>

/**
 * A fixed number of worker threads decoding images requested via sendLoadRequest().
 *
 * Each request is picked up by exactly one idle worker. Results are collected in a queue
 * which is polled without blocking by the owner. Failures are logged and reported as
 * DecodeResult::Kind::Failed, they are never retried.
 */
class ImageLoader
{
public:
    explicit ImageLoader(unsigned threadCount);
    // pushes one quit sentinel per worker and joins them
    ~ImageLoader();

    ImageLoader(const ImageLoader&) = delete;
    ImageLoader& operator=(const ImageLoader&) = delete;

    unsigned threadCount() const;

    void sendLoadRequest(DecodeRequest request);
    std::optional<DecodeResult> tryRecvPrefetched();

    // Removes a request that no worker has picked up yet. Returns false if it is already being decoded or unknown.
    bool tryTake(quint32 requestId);

    // Synchronous decoding on the calling thread. Throw std::runtime_error on failure.
    static std::vector<DecodedFrame> loadFrames(const QString& path, bool allowAnimation = true);
    static DecodedFrame loadImage(const QString& path);

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
