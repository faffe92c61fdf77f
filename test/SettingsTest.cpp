#include "SettingsTest.hpp"
#include "Settings.hpp"
#include "Lumen.hpp"
#include "KeyBindings.hpp"

#include <QTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QKeySequence>

QTEST_MAIN(SettingsTest)
#include "SettingsTest.moc"

using namespace std::chrono_literals;

void SettingsTest::testDefaults()
{
    QTemporaryDir tmp;
    Lumen lumen(tmp.filePath("lumen.ini"));

    QCOMPARE(lumen.viewMode(), ViewMode::Fit);
    QCOMPARE(lumen.antialiasing(), AntialiasMode::Auto);
    QCOMPARE(lumen.slideshowDelay(), std::chrono::milliseconds(6000));
    QCOMPARE(lumen.cacheCapacity(), Lumen::systemCacheCapacity());
    QCOMPARE(lumen.workerThreadCount(), Lumen::systemWorkerThreadCount());
}

void SettingsTest::testPersistence()
{
    QTemporaryDir tmp;
    const QString file = tmp.filePath("lumen.ini");
    {
        Lumen lumen(file);
        lumen.setViewMode(ViewMode::None);
        lumen.setAntialiasing(AntialiasMode::Never);
        lumen.setSlideshowDelay(2500ms);
        lumen.setCacheCapacity(123456789);
        lumen.setWorkerThreadCount(3);
    }

    Settings raw(file);
    QCOMPARE(raw.viewMode(), ViewMode::None);
    QCOMPARE(raw.slideshowDelay(), std::chrono::milliseconds(2500));

    Lumen lumen(file);
    QCOMPARE(lumen.viewMode(), ViewMode::None);
    QCOMPARE(lumen.antialiasing(), AntialiasMode::Never);
    QCOMPARE(lumen.slideshowDelay(), std::chrono::milliseconds(2500));
    QCOMPARE(lumen.cacheCapacity(), qint64(123456789));
    QCOMPARE(lumen.workerThreadCount(), 3u);

    // back to the system defaults
    lumen.setCacheCapacity(0);
    lumen.setWorkerThreadCount(0);
    QCOMPARE(lumen.cacheCapacity(), Lumen::systemCacheCapacity());
    QCOMPARE(lumen.workerThreadCount(), Lumen::systemWorkerThreadCount());
}

void SettingsTest::testGlobalInstance()
{
    QTemporaryDir tmp;
    QVERIFY(Lumen::globalInstance() == nullptr);
    {
        Lumen first(tmp.filePath("first.ini"));
        Lumen second(tmp.filePath("second.ini"));
        QCOMPARE(Lumen::globalInstance(), &first);
    }
    QVERIFY(Lumen::globalInstance() == nullptr);
}

void SettingsTest::testChangeSignals()
{
    QTemporaryDir tmp;
    Lumen lumen(tmp.filePath("lumen.ini"));
    QSignalSpy spy(&lumen, &Lumen::slideshowDelayChanged);

    lumen.setSlideshowDelay(3s);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toLongLong(), 3000);
    QCOMPARE(spy.at(0).at(1).toLongLong(), 6000);

    // unchanged, no signal
    lumen.setSlideshowDelay(3s);
    QCOMPARE(spy.count(), 1);

    lumen.setSlideshowDelay(0ms);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(lumen.slideshowDelay(), std::chrono::milliseconds(3000));
}

void SettingsTest::testSystemDefaults()
{
    QVERIFY(Lumen::systemCacheCapacity() > 0);
    const unsigned threads = Lumen::systemWorkerThreadCount();
    QVERIFY(threads >= 2 && threads <= 4);
}

void SettingsTest::testDefaultKeyBindings()
{
    const KeyBindings kb = KeyBindings::defaults();

    QCOMPARE(kb.action(QKeySequence(Qt::Key_Right)), QString(KeyBindings::ImageNext));
    QCOMPARE(kb.action(QKeySequence(Qt::Key_D)), QString(KeyBindings::ImageNext));
    QCOMPARE(kb.action(QKeySequence(Qt::Key_PageUp)), QString(KeyBindings::ImagePrevious));
    QCOMPARE(kb.action(QKeySequence(Qt::ALT | Qt::Key_P)), QString(KeyBindings::PlayRandomPresentation));
    QCOMPARE(kb.action(QKeySequence(Qt::Key_P)), QString(KeyBindings::PlayPresentation));
    QVERIFY(kb.action(QKeySequence(Qt::Key_Z)).isEmpty());

    QCOMPARE(kb.keys(KeyBindings::PlayAnimation).size(), qsizetype(2));
    QVERIFY(kb.keys("no_such_action").isEmpty());
    QCOMPARE(kb.actions().size(), qsizetype(12));
}

void SettingsTest::testKeyBindingOverrides()
{
    QTemporaryDir tmp;
    Settings settings(tmp.filePath("bindings.ini"));
    settings.setValue("bindings/img_next", QStringList({"N", "Ctrl+Right"}));
    settings.setValue("bindings/bogus_action", QStringList({"B"}));

    const KeyBindings kb = KeyBindings::fromSettings(settings);
    QCOMPARE(kb.action(QKeySequence(Qt::Key_N)), QString(KeyBindings::ImageNext));
    QCOMPARE(kb.action(QKeySequence(Qt::CTRL | Qt::Key_Right)), QString(KeyBindings::ImageNext));
    QVERIFY(kb.action(QKeySequence(Qt::Key_Right)).isEmpty());
    QVERIFY(kb.action(QKeySequence(Qt::Key_B)).isEmpty());
    // untouched actions keep their defaults
    QCOMPARE(kb.action(QKeySequence(Qt::Key_Left)), QString(KeyBindings::ImagePrevious));
}
