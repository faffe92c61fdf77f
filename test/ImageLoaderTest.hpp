
#pragma once

#include <QObject>

class ImageLoaderTest : public QObject
{
    Q_OBJECT
private slots:
    void testBackgroundDecodeReportsAllStages();
    void testFailureIsReported();
    void testEmptyPathIsRejected();
    void testTryTakeUnknownRequest();
    void testShutdownWithQueuedRequests();
    void testSynchronousLoading();
};
