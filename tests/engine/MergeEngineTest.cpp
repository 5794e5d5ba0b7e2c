#include <QtTest/QtTest>

#include "calmerge/core/TemporalCodec.hpp"
#include "calmerge/engine/MergeEngine.hpp"

using namespace calmerge;
using namespace calmerge::engine;

namespace {
data::CalendarEvent makeEvent(const QString &title, const char *start, const char *end)
{
    data::CalendarEvent event;
    event.title = title;
    event.start = *core::parseInstant(QString::fromLatin1(start));
    event.end = *core::parseInstant(QString::fromLatin1(end));
    return event;
}

data::Calendar makeCalendar(const QString &name, const std::vector<data::CalendarEvent> &events)
{
    data::Calendar calendar;
    calendar.name = name;
    calendar.events = events;
    return calendar;
}
} // namespace

class MergeEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void mergesWithDeduplication();
    void keepsEverythingWithoutDeduplication();
    void preservesCalendarOrder();
    void leavesSourcesUntouched();
    void acceptsFewerThanTwoCalendars();
};

void MergeEngineTest::mergesWithDeduplication()
{
    const auto work = makeCalendar(QStringLiteral("Work"),
                                   {makeEvent(QStringLiteral("Standup"), "20240115T090000Z", "20240115T091500Z")});
    const auto team = makeCalendar(QStringLiteral("Team"),
                                   {makeEvent(QStringLiteral(" standup"), "20240115T090000Z", "20240115T091500Z"),
                                    makeEvent(QStringLiteral("Lunch"), "20240115T120000Z", "20240115T130000Z")});

    const MergeResult result = merge({work, team}, QStringLiteral("Everything"), true);
    QCOMPARE(result.mergedEvents, 2);
    QCOMPARE(result.removedDuplicates, 1);
    QCOMPARE(result.calendar.name, QStringLiteral("Everything"));
    QCOMPARE(result.calendar.events.size(), std::size_t(2));
    QCOMPARE(result.calendar.events.at(0).title, QStringLiteral("Standup"));
    QCOMPARE(result.calendar.events.at(1).title, QStringLiteral("Lunch"));
    QVERIFY(!result.calendar.id.isNull());
    QVERIFY(result.calendar.id != work.id);
    QVERIFY(result.calendar.id != team.id);
}

void MergeEngineTest::keepsEverythingWithoutDeduplication()
{
    const auto event = makeEvent(QStringLiteral("Sync"), "20240115T100000", "20240115T110000");
    const std::vector<data::Calendar> calendars = {
        makeCalendar(QStringLiteral("A"), {event, event}),
        makeCalendar(QStringLiteral("B"), {event}),
        makeCalendar(QStringLiteral("C"), {}),
    };

    const MergeResult result = merge(calendars, QStringLiteral("All"), false);
    QCOMPARE(result.mergedEvents, 3);
    QCOMPARE(result.removedDuplicates, 0);
    QCOMPARE(result.calendar.events.size(), std::size_t(3));
}

void MergeEngineTest::preservesCalendarOrder()
{
    auto first = makeEvent(QStringLiteral("Review"), "20240115T100000Z", "20240115T110000Z");
    auto second = first;
    first.description = QStringLiteral("from A");
    second.description = QStringLiteral("from B");
    const auto a = makeCalendar(QStringLiteral("A"), {first});
    const auto b = makeCalendar(QStringLiteral("B"), {second});

    QCOMPARE(merge({a, b}, QStringLiteral("AB"), true).calendar.events.front().description, QStringLiteral("from A"));
    QCOMPARE(merge({b, a}, QStringLiteral("BA"), true).calendar.events.front().description, QStringLiteral("from B"));
}

void MergeEngineTest::leavesSourcesUntouched()
{
    auto event = makeEvent(QStringLiteral("Planning"), "20240115T100000Z", "20240115T110000Z");
    event.sequence = 4;
    const auto source = makeCalendar(QStringLiteral("Source"), {event, event});
    const auto copy = source;

    const MergeResult result = merge({source}, QStringLiteral("Target"), true);
    QCOMPARE(source.events, copy.events);
    QCOMPARE(source.name, copy.name);
    QCOMPARE(result.calendar.events.front(), event);
    QCOMPARE(result.calendar.events.front().sequence, 4);
}

void MergeEngineTest::acceptsFewerThanTwoCalendars()
{
    const MergeResult empty = merge({}, QStringLiteral("Nothing"), true);
    QCOMPARE(empty.mergedEvents, 0);
    QVERIFY(empty.calendar.events.empty());
    QCOMPARE(empty.calendar.name, QStringLiteral("Nothing"));
}

QTEST_GUILESS_MAIN(MergeEngineTest)
#include "MergeEngineTest.moc"
