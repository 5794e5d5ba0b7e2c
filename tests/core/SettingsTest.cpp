#include <QtTest/QtTest>

#include <QSettings>
#include <QTemporaryDir>

#include "calmerge/core/AppContext.hpp"
#include "calmerge/core/Settings.hpp"
#include "calmerge/data/CalendarRepository.hpp"
#include "calmerge/service/CalendarService.hpp"

using namespace calmerge::core;

class SettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsWhenEmpty();
    void saveAndLoad();
    void clampsBundleLimit();
    void contextWiresSettings();

private:
    QTemporaryDir m_dir;
};

void SettingsTest::defaultsWhenEmpty()
{
    QSettings settings(m_dir.filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);
    const EngineSettings loaded = EngineSettings::load(settings);

    QVERIFY(loaded.removeDuplicates);
    QVERIFY(!loaded.skipTransparentConflicts);
    QVERIFY(!loaded.skipCancelledConflicts);
    QVERIFY(loaded.productId.isEmpty());
    QCOMPARE(loaded.defaultBundleName, QStringLiteral("Shared calendars"));
    QCOMPARE(loaded.maxCalendarsPerBundle, 15);
}

void SettingsTest::saveAndLoad()
{
    const QString path = m_dir.filePath(QStringLiteral("roundtrip.ini"));
    {
        QSettings settings(path, QSettings::IniFormat);
        EngineSettings stored;
        stored.removeDuplicates = false;
        stored.skipTransparentConflicts = true;
        stored.skipCancelledConflicts = true;
        stored.productId = QStringLiteral("-//Example//Test//EN");
        stored.defaultBundleName = QStringLiteral("Team");
        stored.maxCalendarsPerBundle = 4;
        stored.save(settings);
    }

    QSettings settings(path, QSettings::IniFormat);
    QVERIFY(settings.contains(QStringLiteral("conflicts/skipTransparent")));
    const EngineSettings loaded = EngineSettings::load(settings);
    QVERIFY(!loaded.removeDuplicates);
    QVERIFY(loaded.skipTransparentConflicts);
    QVERIFY(loaded.skipCancelledConflicts);
    QCOMPARE(loaded.productId, QStringLiteral("-//Example//Test//EN"));
    QCOMPARE(loaded.defaultBundleName, QStringLiteral("Team"));
    QCOMPARE(loaded.maxCalendarsPerBundle, 4);
}

void SettingsTest::clampsBundleLimit()
{
    QSettings settings(m_dir.filePath(QStringLiteral("limits.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("bundle/maxCalendars"), 99);
    QCOMPARE(EngineSettings::load(settings).maxCalendarsPerBundle, 15);

    settings.setValue(QStringLiteral("bundle/maxCalendars"), 0);
    QCOMPARE(EngineSettings::load(settings).maxCalendarsPerBundle, 1);
}

void SettingsTest::contextWiresSettings()
{
    EngineSettings settings;
    settings.skipCancelledConflicts = true;
    AppContext context(settings);

    QVERIFY(context.settings().skipCancelledConflicts);
    QVERIFY(context.calendarService().settings().skipCancelledConflicts);
    QVERIFY(context.calendarRepository().fetchCalendars().empty());
}

QTEST_GUILESS_MAIN(SettingsTest)
#include "SettingsTest.moc"
