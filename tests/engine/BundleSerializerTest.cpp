#include <QtTest/QtTest>

#include "calmerge/core/TemporalCodec.hpp"
#include "calmerge/data/IcsReader.hpp"
#include "calmerge/engine/BundleSerializer.hpp"

using namespace calmerge;
using namespace calmerge::engine;

namespace {
data::CalendarEvent makeEvent(const QString &title, const char *start, const char *end)
{
    data::CalendarEvent event;
    event.uid = data::generateUid();
    event.title = title;
    event.start = *core::parseInstant(QString::fromLatin1(start));
    event.end = *core::parseInstant(QString::fromLatin1(end));
    return event;
}

BundleOptions fixedOptions()
{
    BundleOptions options;
    options.name = QStringLiteral("Shared");
    options.generatedAt = QDateTime(QDate(2024, 2, 1), QTime(8, 30, 0), Qt::UTC);
    return options;
}

data::CalendarEvent richEvent()
{
    auto event = makeEvent(QStringLiteral("Quarterly review; budget, plans"), "20240115T090000Z", "20240115T103000Z");
    event.description = QStringLiteral("Bring numbers.\nAnd a laptop.");
    event.location = QStringLiteral("HQ, Room 3");
    event.status = data::EventStatus::Tentative;
    event.eventClass = data::EventClass::Confidential;
    event.transparency = data::Transparency::Opaque;
    event.priority = 1;
    event.sequence = 2;
    event.categories = QStringList{QStringLiteral("Finance"), QStringLiteral("Q1, planning")};
    event.resources = QStringList{QStringLiteral("Projector")};
    event.recurrenceRule = QStringLiteral("FREQ=MONTHLY;INTERVAL=3");
    event.recurrenceDates.insert({*core::parseInstant(QStringLiteral("20240220T090000Z")), data::RecurrenceDateType::RDate});
    event.recurrenceDates.insert({*core::parseInstant(QStringLiteral("20240415T090000Z")), data::RecurrenceDateType::ExDate});
    event.recurrenceId = *core::parseInstant(QStringLiteral("20240115T090000Z"));
    event.organizer = data::Organizer{QStringLiteral("Finance: Lead"), QStringLiteral("lead@example.com")};
    data::Attendee attendee;
    attendee.name = QStringLiteral("Sam");
    attendee.email = QStringLiteral("sam@example.com");
    attendee.role = QStringLiteral("OPT-PARTICIPANT");
    attendee.status = QStringLiteral("TENTATIVE");
    attendee.rsvp = true;
    event.attendees.push_back(attendee);
    data::Alarm alarm;
    alarm.action = QStringLiteral("DISPLAY");
    alarm.relativeTrigger = core::parseDuration(QStringLiteral("-PT15M"));
    alarm.description = QStringLiteral("Starting soon");
    event.alarms.push_back(alarm);
    event.url = QStringLiteral("https://example.com/reviews/q1");
    event.geo = data::GeoPosition{48.2082, 16.3738};
    event.comment = QStringLiteral("Minutes follow; see wiki");
    event.contact = QStringLiteral("Finance office, ext. 12");
    event.relatedTo = QStringLiteral("budget-2024@example.com");
    event.color = QStringLiteral("#aa3300");
    event.created = *core::parseInstant(QStringLiteral("20231201T120000Z"));
    event.lastModified = *core::parseInstant(QStringLiteral("20240110T080000Z"));
    return event;
}
} // namespace

class BundleSerializerTest : public QObject
{
    Q_OBJECT

private slots:
    void writesEnvelope();
    void roundTripsRichEvent();
    void roundTripsAllDayEvent();
    void keepsNamedOrganizerWithAddress();
    void omitsAbsentFields();
    void deduplicatesAcrossCalendars();
    void foldsLongLines();
    void writesSingleCalendar();
};

void BundleSerializerTest::writesEnvelope()
{
    data::Calendar calendar;
    calendar.events.push_back(makeEvent(QStringLiteral("Sync"), "20240115T090000Z", "20240115T100000Z"));

    const QString text = serializeBundle({calendar}, false, fixedOptions());
    QVERIFY(text.startsWith(QStringLiteral("BEGIN:VCALENDAR\r\nVERSION:2.0\r\n")));
    QVERIFY(text.endsWith(QStringLiteral("END:VCALENDAR\r\n")));
    QVERIFY(text.contains(QStringLiteral("PRODID:-//Calmerge//Calmerge//EN\r\n")));
    QVERIFY(text.contains(QStringLiteral("X-WR-CALNAME:Shared\r\n")));
    QVERIFY(text.contains(QStringLiteral("DTSTAMP:20240201T083000Z\r\n")));
    QVERIFY(text.contains(QStringLiteral("SEQUENCE:0\r\n")));
    QVERIFY(text.contains(QStringLiteral("UID:") + calendar.events.front().uid));
    QCOMPARE(text.count(QStringLiteral("BEGIN:VEVENT")), 1);
    QVERIFY(!text.contains(QStringLiteral("\n\n")));
}

void BundleSerializerTest::roundTripsRichEvent()
{
    data::Calendar calendar;
    calendar.events.push_back(richEvent());

    const QString text = serializeBundle({calendar}, true, fixedOptions());
    const data::ImportResult result = data::IcsReader().read(text);
    QCOMPARE(result.skippedEvents, 0);
    QCOMPARE(result.skippedFields, 0);
    QCOMPARE(result.calendarName, QStringLiteral("Shared"));
    QCOMPARE(result.events.size(), std::size_t(1));
    QCOMPARE(result.events.front(), calendar.events.front());
}

void BundleSerializerTest::roundTripsAllDayEvent()
{
    data::Calendar calendar;
    auto event = makeEvent(QStringLiteral("Holiday"), "20240101", "20240102");
    data::Alarm alarm;
    alarm.action = QStringLiteral("AUDIO");
    alarm.absoluteTrigger = *core::parseInstant(QStringLiteral("20231231T180000Z"));
    alarm.repeat = 2;
    alarm.repeatInterval = core::parseDuration(QStringLiteral("PT10M"));
    event.alarms.push_back(alarm);
    calendar.events.push_back(event);

    const QString text = serializeBundle({calendar}, false, fixedOptions());
    QVERIFY(text.contains(QStringLiteral("DTSTART;VALUE=DATE:20240101\r\n")));
    QVERIFY(text.contains(QStringLiteral("DTEND;VALUE=DATE:20240102\r\n")));

    const data::ImportResult result = data::IcsReader().read(text);
    QCOMPARE(result.events.size(), std::size_t(1));
    QCOMPARE(result.events.front(), event);
}

void BundleSerializerTest::keepsNamedOrganizerWithAddress()
{
    const QString source = QStringLiteral("BEGIN:VCALENDAR\r\nVERSION:2.0\r\n"
                                          "BEGIN:VEVENT\r\nUID:a@example.com\r\nSUMMARY:Sync\r\n"
                                          "DTSTART:20240115T090000Z\r\nDTEND:20240115T100000Z\r\n"
                                          "ORGANIZER;CN=Bob:\r\nEND:VEVENT\r\n"
                                          "BEGIN:VEVENT\r\nUID:b@example.com\r\nSUMMARY:Review\r\n"
                                          "DTSTART:20240116T090000Z\r\nDTEND:20240116T100000Z\r\n"
                                          "ORGANIZER;CN=Ann:mailto:ann@example.com\r\nEND:VEVENT\r\n"
                                          "END:VCALENDAR\r\n");
    const data::ImportResult first = data::IcsReader().read(source);
    QCOMPARE(first.events.size(), std::size_t(2));
    QCOMPARE(first.skippedFields, 1);
    QVERIFY(!first.events.at(0).organizer.has_value());
    QVERIFY(first.events.at(1).organizer.has_value());

    data::Calendar calendar;
    calendar.events = first.events;
    const data::ImportResult second = data::IcsReader().read(serializeBundle({calendar}, false, fixedOptions()));
    QCOMPARE(second.skippedFields, 0);
    QCOMPARE(second.events, first.events);
}

void BundleSerializerTest::omitsAbsentFields()
{
    data::Calendar calendar;
    calendar.events.push_back(makeEvent(QStringLiteral("Bare"), "20240115T090000", "20240115T100000"));

    BundleOptions options = fixedOptions();
    options.name.clear();
    const QString text = serializeBundle({calendar}, false, options);
    const QStringList absent = {
        QStringLiteral("X-WR-CALNAME"), QStringLiteral("DESCRIPTION"), QStringLiteral("LOCATION"),
        QStringLiteral("STATUS"), QStringLiteral("CLASS"), QStringLiteral("TRANSP"),
        QStringLiteral("PRIORITY"), QStringLiteral("RRULE"), QStringLiteral("RDATE"),
        QStringLiteral("EXDATE"), QStringLiteral("RECURRENCE-ID"), QStringLiteral("ORGANIZER"),
        QStringLiteral("ATTENDEE"), QStringLiteral("CATEGORIES"), QStringLiteral("VALARM"),
        QStringLiteral("URL"), QStringLiteral("GEO"), QStringLiteral("COMMENT"),
        QStringLiteral("CONTACT"), QStringLiteral("RELATED-TO"), QStringLiteral("COLOR"),
        QStringLiteral("CREATED"), QStringLiteral("LAST-MODIFIED"),
    };
    for (const QString &name : absent) {
        QVERIFY2(!text.contains(name), qPrintable(name));
    }
    QVERIFY(text.contains(QStringLiteral("DTSTART:20240115T090000\r\n")));
}

void BundleSerializerTest::deduplicatesAcrossCalendars()
{
    data::Calendar first;
    first.events.push_back(makeEvent(QStringLiteral("Standup"), "20240115T090000Z", "20240115T091500Z"));
    data::Calendar second;
    second.events.push_back(makeEvent(QStringLiteral("STANDUP"), "20240115T090000Z", "20240115T091500Z"));
    second.events.push_back(makeEvent(QStringLiteral("Lunch"), "20240115T120000Z", "20240115T130000Z"));

    const QString deduplicated = serializeBundle({first, second}, true, fixedOptions());
    QCOMPARE(deduplicated.count(QStringLiteral("BEGIN:VEVENT")), 2);
    QVERIFY(deduplicated.contains(QStringLiteral("SUMMARY:Standup\r\n")));
    QVERIFY(!deduplicated.contains(QStringLiteral("SUMMARY:STANDUP")));

    const QString everything = serializeBundle({first, second}, false, fixedOptions());
    QCOMPARE(everything.count(QStringLiteral("BEGIN:VEVENT")), 3);
}

void BundleSerializerTest::foldsLongLines()
{
    data::Calendar calendar;
    auto event = makeEvent(QStringLiteral("Notes"), "20240115T090000Z", "20240115T100000Z");
    event.description = QString(300, QLatin1Char('x')) + QString::fromUtf8("\xc3\xbc");
    calendar.events.push_back(event);

    const QString text = serializeBundle({calendar}, false, fixedOptions());
    const QStringList lines = text.split(QStringLiteral("\r\n"));
    for (const QString &line : lines) {
        QVERIFY(line.toUtf8().size() <= 75);
    }

    const data::ImportResult result = data::IcsReader().read(text);
    QCOMPARE(result.events.size(), std::size_t(1));
    QCOMPARE(result.events.front().description, event.description);
}

void BundleSerializerTest::writesSingleCalendar()
{
    data::Calendar calendar;
    calendar.name = QStringLiteral("Personal");
    calendar.color = QStringLiteral("#00aa00");
    calendar.sourceUrl = QUrl(QStringLiteral("https://example.com/feeds/personal.ics"));
    const auto event = makeEvent(QStringLiteral("Gym"), "20240115T180000", "20240115T190000");
    calendar.events = {event, event};

    BundleOptions options;
    options.generatedAt = QDateTime(QDate(2024, 2, 1), QTime(8, 30, 0), Qt::UTC);
    const QString text = writeCalendar(calendar, options);
    QVERIFY(text.contains(QStringLiteral("X-WR-CALNAME:Personal\r\n")));
    QVERIFY(text.contains(QStringLiteral("COLOR:#00aa00\r\n")));
    QVERIFY(text.contains(QStringLiteral("SOURCE;VALUE=URI:https://example.com/feeds/personal.ics\r\n")));
    QCOMPARE(text.count(QStringLiteral("BEGIN:VEVENT")), 2);

    const data::ImportResult result = data::IcsReader().read(text);
    QCOMPARE(result.calendarColor, QStringLiteral("#00aa00"));
    QCOMPARE(result.calendarSource, calendar.sourceUrl);
    QCOMPARE(result.events.size(), std::size_t(2));
}

QTEST_GUILESS_MAIN(BundleSerializerTest)
#include "BundleSerializerTest.moc"
