#include "DecoderTest.hpp"
#include "DecoderFactory.hpp"
#include "SmartImageDecoder.hpp"
#include "SmartJpegDecoder.hpp"
#include "SmartPngDecoder.hpp"
#include "QtReaderDecoder.hpp"
#include "ExifWrapper.hpp"

#include <QTest>
#include <QDebug>
#include <QTemporaryFile>
#include <QTemporaryDir>
#include <QImage>
#include <QColor>
#include <QFile>

QTEST_GUILESS_MAIN(DecoderTest)
#include "DecoderTest.moc"

constexpr const char errHeader[] = "Some header decode error";
constexpr const char errDec[]    = "Some decoding decode error";


class ImageDecoderUnderTest : public SmartImageDecoder
{
    friend class DecoderTest;
    bool decodeHeaderFail = false;
    bool decodingLoopFail = false;
public:
    void setDecodeHeaderFail(bool b)
    {
        this->decodeHeaderFail = b;
    }

    void setDecodingLoopFail(bool b)
    {
        this->decodingLoopFail = b;
    }

    ImageDecoderUnderTest(const QFileInfo& info) : SmartImageDecoder(info)
    {}

protected:
    void decodeHeader(const unsigned char*, qint64) override
    {
        if(this->decodeHeaderFail)
            throw std::runtime_error(errHeader);

        this->setSize(QSize(2, 2));
    }

    std::vector<DecodedFrame> decodingLoop(bool) override
    {
        if(this->decodingLoopFail)
            throw std::runtime_error(errDec);

        DecodedFrame f;
        f.image = this->allocateImageBuffer(2, 2, QImage::Format_RGBA8888);
        return {f};
    }
};

static QImage makeTestImage(int w, int h, QImage::Format format)
{
    QImage img(w, h, format);
    img.fill(QColor(10, 200, 30));
    return img;
}

void DecoderTest::errorWhileOpeningFile()
{
    ImageDecoderUnderTest dec(QFileInfo("IdON0tEx1st.jpg"));

    QCOMPARE(dec.decodingState(), DecodingState::Ready);
    QVERIFY_EXCEPTION_THROWN(dec.open(), std::runtime_error);
    QCOMPARE(dec.decodingState(), DecodingState::Fatal);
    QVERIFY(!dec.errorMessage().isEmpty());
    dec.reset();
    QCOMPARE(dec.decodingState(), DecodingState::Ready);
    QVERIFY(dec.errorMessage().isEmpty());
    dec.close();
}

void DecoderTest::testInitialize()
{
    QTemporaryFile jpg("lumentestfile-XXXXXX.jpg");
    QVERIFY(jpg.open());

    ImageDecoderUnderTest dec{QFileInfo(jpg)};

    QVERIFY_EXCEPTION_THROWN(dec.init(), std::logic_error);
    QCOMPARE(dec.decodingState(), DecodingState::Fatal);
    dec.reset();

    // try to open an empty file
    dec.open();
    QVERIFY_EXCEPTION_THROWN(dec.init(), std::runtime_error);
    QCOMPARE(dec.decodingState(), DecodingState::Fatal);
    dec.reset();
    QCOMPARE(dec.decodingState(), DecodingState::Ready);
    QVERIFY(dec.errorMessage().isEmpty());
    dec.close();

    // try to open a non-empty file successfully
    QVERIFY(jpg.putChar('\0'));
    QVERIFY(jpg.flush());
    QCOMPARE(jpg.size(), 1);
    dec.open();
    dec.init();
    QCOMPARE(dec.decodingState(), DecodingState::Metadata);
    QCOMPARE(dec.size(), QSize(2, 2));
    QCOMPARE(dec.orientation(), Orientation::Deg0);
    dec.close();
    QCOMPARE(dec.decodingState(), DecodingState::Metadata);
    dec.reset();

    // try to open a non-empty file non-successfully with err msg
    dec.setDecodeHeaderFail(true);
    dec.open();
    QVERIFY_EXCEPTION_THROWN(dec.init(), std::runtime_error);
    QCOMPARE(dec.decodingState(), DecodingState::Fatal);
    QCOMPARE(dec.errorMessage(), QString(errHeader));
    dec.close();
    QCOMPARE(dec.decodingState(), DecodingState::Fatal);
    dec.reset();
    QCOMPARE(dec.decodingState(), DecodingState::Ready);
    QVERIFY(dec.errorMessage().isEmpty());

    dec.setDecodeHeaderFail(false);
    dec.setDecodingLoopFail(true);
    dec.open();
    dec.init();
    QCOMPARE(dec.decodingState(), DecodingState::Metadata);
    QVERIFY_EXCEPTION_THROWN(dec.decode(), std::runtime_error);
    QCOMPARE(dec.decodingState(), DecodingState::Error);
    QCOMPARE(dec.errorMessage(), QString(errDec));
    dec.close();
    QCOMPARE(dec.decodingState(), DecodingState::Error);
    QCOMPARE(dec.errorMessage(), QString(errDec));
    dec.reset();
    QCOMPARE(dec.decodingState(), DecodingState::Ready);
    QVERIFY(dec.errorMessage().isEmpty());

    dec.setDecodingLoopFail(false);
    dec.open();
    // decode() initializes on its own
    auto frames = dec.decode();
    QCOMPARE(frames.size(), size_t(1));
    QCOMPARE(frames[0].image.size(), QSize(2, 2));
    QCOMPARE(dec.decodingState(), DecodingState::FullImage);
    dec.close();
}

void DecoderTest::testDecodeRequiresReset()
{
    QTemporaryFile file("lumentestfile-XXXXXX.jpg");
    QVERIFY(file.open());
    QVERIFY(file.putChar('\0'));
    QVERIFY(file.flush());

    ImageDecoderUnderTest dec{QFileInfo(file)};
    dec.open();
    dec.decode();
    QCOMPARE(dec.decodingState(), DecodingState::FullImage);

    // decoding the same file twice needs a reset() in between
    QVERIFY_EXCEPTION_THROWN(dec.decode(), std::logic_error);
    dec.close();
}

void DecoderTest::testJpegDecoding()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString path = tmp.filePath("photo.jpg");
    QVERIFY(makeTestImage(16, 8, QImage::Format_RGB32).save(path, "JPG"));

    auto dec = DecoderFactory::globalInstance()->getDecoder(QFileInfo(path));
    QVERIFY(dec != nullptr);
    QVERIFY(dynamic_cast<SmartJpegDecoder*>(dec.get()) != nullptr);

    dec->open();
    dec->init();
    QCOMPARE(dec->size(), QSize(16, 8));

    auto frames = dec->decode();
    dec->close();

    QCOMPARE(frames.size(), size_t(1));
    const QImage& img = frames[0].image;
    QCOMPARE(img.size(), QSize(16, 8));
    QCOMPARE(img.format(), QImage::Format_RGBA8888);
    QCOMPARE(frames[0].delay.count(), 0);

    // lossy, but not that lossy
    QColor px = img.pixelColor(8, 4);
    QVERIFY(qAbs(px.green() - 200) < 10);
    QVERIFY(qAbs(px.red() - 10) < 10);
}

void DecoderTest::testPngDecodingKeepsAlpha()
{
    QTemporaryDir tmp;
    const QString path = tmp.filePath("alpha.png");
    QImage src = makeTestImage(5, 7, QImage::Format_ARGB32);
    src.setPixelColor(0, 0, QColor(0, 0, 0, 0));
    QVERIFY(src.save(path, "PNG"));

    auto dec = DecoderFactory::globalInstance()->getDecoder(QFileInfo(path));
    QVERIFY(dynamic_cast<SmartPngDecoder*>(dec.get()) != nullptr);

    dec->open();
    auto frames = dec->decode();
    dec->close();

    QCOMPARE(frames.size(), size_t(1));
    const QImage& img = frames[0].image;
    QCOMPARE(img.size(), QSize(5, 7));
    QCOMPARE(img.format(), QImage::Format_RGBA8888);
    QCOMPARE(img.pixelColor(0, 0).alpha(), 0);
    QCOMPARE(img.pixelColor(1, 1), QColor(10, 200, 30));
}

void DecoderTest::testQImageReaderFallback()
{
    QTemporaryDir tmp;
    const QString path = tmp.filePath("plain.bmp");
    QVERIFY(makeTestImage(3, 4, QImage::Format_RGB32).save(path, "BMP"));

    auto dec = DecoderFactory::globalInstance()->getDecoder(QFileInfo(path));
    QVERIFY(dynamic_cast<QtReaderDecoder*>(dec.get()) != nullptr);

    dec->open();
    auto frames = dec->decode();
    dec->close();

    QCOMPARE(frames.size(), size_t(1));
    QCOMPARE(frames[0].image.size(), QSize(3, 4));
    QCOMPARE(frames[0].image.format(), QImage::Format_RGBA8888);
    QCOMPARE(frames[0].image.pixelColor(2, 3), QColor(10, 200, 30));

    // a PNG with the wrong extension is still recognized by its content
    const QString disguised = tmp.filePath("disguised.dat");
    QVERIFY(makeTestImage(2, 2, QImage::Format_RGB32).save(disguised, "PNG"));
    QVERIFY(DecoderFactory::globalInstance()->getDecoder(QFileInfo(disguised)) != nullptr);
}

void DecoderTest::testFactoryRejectsUnknownFiles()
{
    QTemporaryDir tmp;
    const QString path = tmp.filePath("notes.txt");
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("this is not an image");
    f.close();

    QVERIFY(DecoderFactory::globalInstance()->getDecoder(QFileInfo(path)) == nullptr);
    QVERIFY(DecoderFactory::globalInstance()->getDecoder(QFileInfo(tmp.path())) == nullptr);
}

void DecoderTest::testExifOrientationMapping()
{
    QCOMPARE(ExifWrapper::fromExifOrientation(0), Orientation::Deg0);
    QCOMPARE(ExifWrapper::fromExifOrientation(1), Orientation::Deg0);
    QCOMPARE(ExifWrapper::fromExifOrientation(2), Orientation::Deg0HorFlip);
    QCOMPARE(ExifWrapper::fromExifOrientation(3), Orientation::Deg180);
    QCOMPARE(ExifWrapper::fromExifOrientation(4), Orientation::Deg180HorFlip);
    QCOMPARE(ExifWrapper::fromExifOrientation(5), Orientation::Deg90VerFlip);
    QCOMPARE(ExifWrapper::fromExifOrientation(6), Orientation::Deg270);
    QCOMPARE(ExifWrapper::fromExifOrientation(7), Orientation::Deg270VerFlip);
    QCOMPARE(ExifWrapper::fromExifOrientation(8), Orientation::Deg90);
    QCOMPARE(ExifWrapper::fromExifOrientation(42), Orientation::Deg0);
}
