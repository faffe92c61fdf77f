#pragma once

#include "DirItem.hpp"

#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <vector>

/**
 * Determines on a worker thread which entries of a directory listing are supported images.
 *
 * The filter holds exactly one slot: giving a new input replaces whatever input has not been
 * picked up yet, and the result of an input that has been superseded meanwhile is dropped.
 * The output maps image index -> file index.
 */
class DirectoryFilter
{
public:
    DirectoryFilter();
    ~DirectoryFilter();

    DirectoryFilter(const DirectoryFilter&) = delete;
    DirectoryFilter& operator=(const DirectoryFilter&) = delete;

    void giveInput(std::vector<DirItem> listing);
    // non-blocking, returns the output at most once
    std::optional<std::vector<size_t>> tryGetOutput();
    // true if there is neither an input waiting nor a job running nor an output to be taken
    bool isReady() const;

    static bool isFileSupported(const QString& path);
    static const QStringList& supportedExtensions();

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
