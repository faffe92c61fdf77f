#pragma once

#include "DirItem.hpp"

#include <QString>

#include <memory>
#include <optional>
#include <vector>

/**
 * The naturally sorted listing of one directory plus the current position in it.
 *
 * Files are addressed by file index (position in the listing, supported or not) and
 * supported images additionally by image index. The latter is only known once the
 * DirectoryFilter has finished, until then all image-index queries report std::nullopt.
 */
class Directory
{
public:
    Directory();
    ~Directory();

    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;

    // Rescans only if dir is not the current directory. Throws std::runtime_error if dir cannot be read.
    void changeDirectory(const QString& dir);
    // Throws NavigationError if fileName does not exist in dir.
    void changeDirectoryWithFilename(const QString& dir, const QString& fileName);

    // Moves to the nearest supported file, wrapping around. Stays put if there is none.
    void jumpToNext();
    void jumpToPrev();

    // Throws WaitingOnDirectoryFilter or NavigationError
    void setCurrImgIndex(size_t index);
    std::optional<size_t> currImgIndex();
    std::optional<size_t> imageCount();
    const DirItem* imageByIndex(size_t index);

    // Rescans the current directory, trying to stay on the same file
    void updateDirectory();

    bool hasDirectory() const;
    QString path() const;
    const std::vector<DirItem>& files() const;
    size_t currFileIndex() const;
    const DirItem* currDescriptor() const;
    QString currFilename() const;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
