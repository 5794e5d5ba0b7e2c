#include <QtTest/QtTest>

#include "calmerge/data/InMemoryCalendarRepository.hpp"

using namespace calmerge::data;

class CalendarRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void addAndFetch();
    void keepsInsertionOrder();
    void updateAndRemove();
    void assignsFreshIdOnCollision();
};

void CalendarRepositoryTest::addAndFetch()
{
    InMemoryCalendarRepository repo;
    Calendar calendar;
    calendar.name = QStringLiteral("Work");
    calendar.color = QStringLiteral("#ff0000");
    const auto stored = repo.addCalendar(calendar);

    QVERIFY(!stored.id.isNull());

    const auto list = repo.fetchCalendars();
    QCOMPARE(list.size(), std::size_t(1));
    QCOMPARE(list.front().name, QStringLiteral("Work"));

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->color, QStringLiteral("#ff0000"));
    QVERIFY(!repo.findById(QUuid::createUuid()).has_value());
}

void CalendarRepositoryTest::keepsInsertionOrder()
{
    InMemoryCalendarRepository repo;
    const QStringList names = {QStringLiteral("c"), QStringLiteral("a"), QStringLiteral("b")};
    for (const auto &name : names) {
        Calendar calendar;
        calendar.name = name;
        repo.addCalendar(calendar);
    }

    const auto list = repo.fetchCalendars();
    QCOMPARE(list.size(), std::size_t(3));
    for (int i = 0; i < names.size(); ++i) {
        QCOMPARE(list.at(static_cast<std::size_t>(i)).name, names.at(i));
    }
}

void CalendarRepositoryTest::updateAndRemove()
{
    InMemoryCalendarRepository repo;
    Calendar calendar;
    calendar.name = QStringLiteral("Initial");
    const auto stored = repo.addCalendar(calendar);

    Calendar toUpdate = stored;
    toUpdate.name = QStringLiteral("Updated");
    QVERIFY(repo.updateCalendar(toUpdate));

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->name, QStringLiteral("Updated"));

    Calendar unknown;
    QVERIFY(!repo.updateCalendar(unknown));

    QVERIFY(repo.removeCalendar(stored.id));
    QVERIFY(!repo.findById(stored.id).has_value());
    QVERIFY(repo.fetchCalendars().empty());
    QVERIFY(!repo.removeCalendar(stored.id));
}

void CalendarRepositoryTest::assignsFreshIdOnCollision()
{
    InMemoryCalendarRepository repo;
    Calendar calendar;
    const auto first = repo.addCalendar(calendar);
    const auto second = repo.addCalendar(calendar);

    QCOMPARE(first.id, calendar.id);
    QVERIFY(second.id != first.id);
    QCOMPARE(repo.fetchCalendars().size(), std::size_t(2));
}

QTEST_GUILESS_MAIN(CalendarRepositoryTest)
#include "CalendarRepositoryTest.moc"
