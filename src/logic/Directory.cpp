#include "Directory.hpp"

#include "DirectoryFilter.hpp"
#include "LoadErrors.hpp"
#include "NaturalSort.hpp"
#include "TraceTimer.hpp"

#include <QDir>
#include <QFileInfo>
#include <QDebug>

#include <algorithm>
#include <filesystem>
#include <system_error>

struct Directory::Impl
{
    QString dirPath;
    std::vector<DirItem> listing;
    size_t currFileIdx = 0;
    quint32 nextRequestId = 0;

    DirectoryFilter filter;
    bool filtered = false;
    std::vector<size_t> imgToFile;
    std::vector<std::optional<size_t>> fileToImg;

    void collectDirectory(const QString& dir)
    {
        TraceTimer t(typeid(Directory), 100);
        t.setInfo(dir.toStdString());

        std::error_code ec;
        auto it = std::filesystem::directory_iterator(QDir(dir).filesystemAbsolutePath(), ec);
        if(ec)
        {
            throw std::runtime_error(Formatter() << "Cannot read directory '" << dir << "': " << ec.message());
        }

        std::vector<DirItem> items;
        for(const auto& entry : it)
        {
            std::error_code typeEc;
            // is_regular_file() follows symlinks
            if(!entry.is_regular_file(typeEc))
            {
                continue;
            }

            DirItem item;
            item.path = QDir(dir).absoluteFilePath(QString::fromStdU16String(entry.path().filename().u16string()));
            items.push_back(std::move(item));
        }

        std::sort(items.begin(), items.end(),
                  [](const DirItem& l, const DirItem& r)
                  {
                      return compareFileName(l.fileName(), r.fileName());
                  });

        for(auto& item : items)
        {
            item.requestId = this->nextRequestId++;
        }

        this->listing = std::move(items);
        this->filtered = false;
        this->imgToFile.clear();
        this->fileToImg.clear();
        this->filter.giveInput(this->listing);
    }

    bool checkFilterReady()
    {
        if(this->filtered)
        {
            return true;
        }

        auto output = this->filter.tryGetOutput();
        if(!output)
        {
            return false;
        }

        this->imgToFile = std::move(*output);
        this->fileToImg.assign(this->listing.size(), std::nullopt);
        for(size_t img = 0; img < this->imgToFile.size(); img++)
        {
            this->fileToImg[this->imgToFile[img]] = img;
        }
        this->filtered = true;
        return true;
    }

    std::optional<size_t> firstSupportedFrom(size_t start) const
    {
        for(size_t i = start; i < this->listing.size(); i++)
        {
            if(DirectoryFilter::isFileSupported(this->listing[i].path))
            {
                return i;
            }
        }
        return std::nullopt;
    }

    std::optional<size_t> findFile(const QString& fileName) const
    {
        auto it = std::find_if(this->listing.begin(), this->listing.end(),
                               [&](const DirItem& item) { return item.fileName() == fileName; });
        if(it == this->listing.end())
        {
            return std::nullopt;
        }
        return static_cast<size_t>(std::distance(this->listing.begin(), it));
    }

    template<typename StepFn>
    void jump(StepFn step)
    {
        const size_t len = this->listing.size();
        for(size_t i = 1; i <= len; i++)
        {
            size_t idx = step(i, len);
            if(DirectoryFilter::isFileSupported(this->listing[idx].path))
            {
                this->currFileIdx = idx;
                return;
            }
        }
    }
};

Directory::Directory() : d(std::make_unique<Impl>())
{}

Directory::~Directory() = default;

void Directory::changeDirectory(const QString& dir)
{
    QString canonical = QDir(dir).canonicalPath();
    if(canonical.isEmpty())
    {
        throw std::runtime_error(Formatter() << "Directory '" << dir << "' does not exist");
    }

    if(canonical == d->dirPath)
    {
        return;
    }

    d->collectDirectory(canonical);
    d->dirPath = canonical;
    d->currFileIdx = d->firstSupportedFrom(0).value_or(0);
    qDebug() << "Changed directory to" << canonical << "with" << d->listing.size() << "entries";
}

void Directory::changeDirectoryWithFilename(const QString& dir, const QString& fileName)
{
    this->changeDirectory(dir);

    auto idx = d->findFile(fileName);
    if(!idx)
    {
        throw NavigationError::fileNotFound(fileName, d->dirPath);
    }
    d->currFileIdx = *idx;
}

void Directory::jumpToNext()
{
    d->jump([this](size_t i, size_t len) { return (d->currFileIdx + i) % len; });
}

void Directory::jumpToPrev()
{
    d->jump([this](size_t i, size_t len) { return (d->currFileIdx + len - (i % len)) % len; });
}

void Directory::setCurrImgIndex(size_t index)
{
    if(!d->checkFilterReady())
    {
        throw WaitingOnDirectoryFilter();
    }

    if(index >= d->imgToFile.size())
    {
        throw NavigationError::indexOutOfRange(index, d->imgToFile.size());
    }

    d->currFileIdx = d->imgToFile[index];
}

std::optional<size_t> Directory::currImgIndex()
{
    if(!d->checkFilterReady() || d->currFileIdx >= d->fileToImg.size())
    {
        return std::nullopt;
    }
    return d->fileToImg[d->currFileIdx];
}

std::optional<size_t> Directory::imageCount()
{
    if(!d->checkFilterReady())
    {
        return std::nullopt;
    }
    return d->imgToFile.size();
}

const DirItem* Directory::imageByIndex(size_t index)
{
    if(!d->checkFilterReady() || index >= d->imgToFile.size())
    {
        return nullptr;
    }
    return &d->listing[d->imgToFile[index]];
}

void Directory::updateDirectory()
{
    if(d->dirPath.isEmpty())
    {
        return;
    }

    const QString prevName = this->currFilename();
    const size_t prevIdx = d->currFileIdx;

    d->collectDirectory(d->dirPath);

    if(auto idx = d->findFile(prevName))
    {
        d->currFileIdx = *idx;
    }
    else
    {
        d->currFileIdx = d->firstSupportedFrom(prevIdx).value_or(0);
    }
}

bool Directory::hasDirectory() const
{
    return !d->dirPath.isEmpty();
}

QString Directory::path() const
{
    return d->dirPath;
}

const std::vector<DirItem>& Directory::files() const
{
    return d->listing;
}

size_t Directory::currFileIndex() const
{
    return d->currFileIdx;
}

const DirItem* Directory::currDescriptor() const
{
    if(d->currFileIdx >= d->listing.size())
    {
        return nullptr;
    }
    return &d->listing[d->currFileIdx];
}

QString Directory::currFilename() const
{
    const DirItem* item = this->currDescriptor();
    return item ? item->fileName() : QString();
}
