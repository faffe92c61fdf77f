#include "Formatter.hpp"
#include "ImageCache.hpp"
#include "LoadedImage.hpp"
#include "Lumen.hpp"
#include "PlaybackManager.hpp"
#include "types.hpp"

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QThread>
#include <QTimer>
#include <QtDebug>

#include <algorithm>
#include <chrono>
#include <stdexcept>

using namespace std::chrono_literals;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("Lumen");
    app.setApplicationName("lumen-slideshow");

    QCommandLineParser parser;
    parser.setApplicationDescription("Plays the images of a directory without displaying them, logging each image shown.");
    parser.addHelpOption();
    parser.addPositionalArgument("path", "Image file or directory to open");
    QCommandLineOption forwardOption("forward", "Step through the directory at the full frame rate");
    QCommandLineOption presentOption("present", "Slideshow in directory order");
    QCommandLineOption randomOption("random", "Slideshow in random order");
    QCommandLineOption delayOption("delay", "Slideshow delay in milliseconds", "ms");
    parser.addOptions({forwardOption, presentOption, randomOption, delayOption});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if(args.size() != 1)
    {
        parser.showHelp(-1);
    }

    // set UI Thread to high prio
    QThread::currentThread()->setPriority(QThread::HighestPriority);

    try
    {
        Lumen lumen;

        if(parser.isSet(delayOption))
        {
            bool ok = false;
            qint64 ms = parser.value(delayOption).toLongLong(&ok);
            if(!ok || ms <= 0)
            {
                throw std::invalid_argument(Formatter() << "Invalid slideshow delay '" << parser.value(delayOption) << "'");
            }
            lumen.setSlideshowDelay(std::chrono::milliseconds(ms));
        }

        QFileInfo info(args.front());
        if(!info.exists())
        {
            throw std::runtime_error(Formatter() << "Path '" << args.front() << "' not found");
        }

        PlaybackManager manager;
        manager.requestLoad(LoadRequest::filePath(info.absoluteFilePath()));

        if(parser.isSet(randomOption))
        {
            manager.folder().startRandomPresentation();
        }
        else if(parser.isSet(presentOption))
        {
            manager.folder().startPresentation();
        }
        else if(parser.isSet(forwardOption))
        {
            manager.folder().startPlaybackForward();
        }

        QTimer timer;
        timer.setSingleShot(true);
        LoadedImgPath lastShown;
        QSharedPointer<LoadedImage> lastImage;
        QObject::connect(&timer, &QTimer::timeout, &app,
            [&]()
            {
                const Clock::time_point now = Clock::now();
                const NextUpdate next = manager.update(now);

                const LoadedImgPath& shown = manager.loadedPath();
                if(!(shown == lastShown) || manager.currentImage() != lastImage)
                {
                    switch(shown.state)
                    {
                    case LoadedImgPath::State::Loaded:
                        qInfo().noquote() << "Showing" << shown.path << QString("(%1/%2)").arg(manager.cache().currentFileIndex() + 1).arg(manager.cache().currentDirLen());
                        break;
                    case LoadedImgPath::State::ErrLoading:
                        qWarning().noquote() << "Could not show" << shown.path;
                        break;
                    case LoadedImgPath::State::NotYetLoaded:
                        break;
                    }
                    lastShown = shown;
                    lastImage = manager.currentImage();
                }

                switch(next.kind)
                {
                case NextUpdate::Kind::Soonest:
                    timer.start(0);
                    break;
                case NextUpdate::Kind::WaitUntil:
                {
                    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next.deadline - now);
                    timer.start(std::max<std::chrono::milliseconds>(wait, 0ms));
                    break;
                }
                case NextUpdate::Kind::Latest:
                    if(manager.playbackState() == PlaybackState::Paused)
                    {
                        // nothing will ever change without user input
                        app.quit();
                    }
                    else
                    {
                        timer.start(100ms);
                    }
                    break;
                }
            });
        timer.start(0);

        return app.exec();
    }
    catch(const std::exception& e)
    {
        qCritical() << "An unexpected error caused lumen-slideshow to terminate:" << e.what();
    }
    return -1;
}
