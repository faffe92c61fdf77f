
#pragma once

#include <QObject>

class PlaybackTest : public QObject
{
    Q_OBJECT
private slots:
    void testNextUpdateEarliest();
    void testPausedWithoutImageWaitsIndefinitely();
    void testPausedExecutesExplicitRequest();
    void testForwardNeverSkipsSteps();
    void testBusyWaitCloseToDeadline();
    void testLatenessIsCarriedIntoNextStep();
    void testPresentationUsesSlideshowDelay();
    void testRandomPresentationVisitsEveryIndexOnce();
    void testRandomPresentationPopsElapsedSteps();
    void testWaitingOnLoaderRetriesCurrentItem();
    void testWaitingOnFilterRetriesSameRequest();
    void testDecodeErrorClearsDisplay();
    void testPathNotYetSpecified();
    void testFramePlayback();
    void testManagerCouplesFolderAndFrames();
};
