#include "calmerge/service/CalendarService.hpp"

#include <QSet>

#include "calmerge/core/Logging.hpp"
#include "calmerge/data/CalendarRepository.hpp"
#include "calmerge/data/EventValidation.hpp"
#include "calmerge/engine/BundleSerializer.hpp"

namespace calmerge {
namespace service {

namespace {
core::PreconditionError rejected(const QString &message)
{
    qCWarning(lcCalmergeService) << message;
    return core::PreconditionError{message};
}

core::PreconditionError unknownCalendar(const QUuid &id)
{
    return rejected(QStringLiteral("calendar %1 not found").arg(id.toString()));
}

// An event is addressed by its UID plus RECURRENCE-ID, so overrides of a
// recurring event live next to the master.
int indexOfInstance(const std::vector<data::CalendarEvent> &events, const data::CalendarEvent &event)
{
    for (std::size_t i = 0; i < events.size(); ++i) {
        if (events[i].uid == event.uid && events[i].recurrenceId == event.recurrenceId) {
            return static_cast<int>(i);
        }
    }
    return -1;
}
} // namespace

CalendarService::CalendarService(data::CalendarRepository &repository, const core::EngineSettings &settings)
    : m_repository(repository)
    , m_settings(settings)
{
}

const core::EngineSettings &CalendarService::settings() const
{
    return m_settings;
}

void CalendarService::setSettings(const core::EngineSettings &settings)
{
    m_settings = settings;
}

Outcome<std::vector<data::Calendar>> CalendarService::resolveCalendars(const QList<QUuid> &calendarIds) const
{
    std::vector<data::Calendar> calendars;
    QSet<QUuid> seen;
    for (const auto &id : calendarIds) {
        if (seen.contains(id)) {
            return rejected(QStringLiteral("calendar %1 listed more than once").arg(id.toString()));
        }
        seen.insert(id);
        auto calendar = m_repository.findById(id);
        if (!calendar) {
            return unknownCalendar(id);
        }
        calendars.push_back(std::move(*calendar));
    }
    return calendars;
}

Outcome<engine::MergeResult> CalendarService::merge(const QList<QUuid> &calendarIds, const QString &name,
                                                    bool removeDuplicates)
{
    if (calendarIds.size() < 2) {
        return rejected(QStringLiteral("merging needs at least two calendars, got %1").arg(calendarIds.size()));
    }
    const QString trimmedName = name.trimmed();
    if (trimmedName.isEmpty()) {
        return rejected(QStringLiteral("merged calendar needs a name"));
    }
    auto sources = resolveCalendars(calendarIds);
    if (auto error = std::get_if<core::PreconditionError>(&sources)) {
        return *error;
    }

    engine::MergeResult result =
        engine::merge(std::get<std::vector<data::Calendar>>(sources), trimmedName, removeDuplicates);
    result.calendar = m_repository.addCalendar(result.calendar);
    qCInfo(lcCalmergeService) << "merged" << calendarIds.size() << "calendars into" << result.calendar.id;
    return result;
}

Outcome<engine::DuplicatePartition> CalendarService::previewDuplicates(const QUuid &calendarId) const
{
    const auto calendar = m_repository.findById(calendarId);
    if (!calendar) {
        return unknownCalendar(calendarId);
    }
    return engine::resolve(calendar->events, engine::DuplicatePolicy{false});
}

Outcome<CleanReport> CalendarService::cleanDuplicates(const QUuid &calendarId)
{
    auto calendar = m_repository.findById(calendarId);
    if (!calendar) {
        return unknownCalendar(calendarId);
    }
    auto partition = engine::resolve(calendar->events);

    CleanReport report;
    report.removedCount = static_cast<int>(partition.removed.size());
    report.remainingEvents = static_cast<int>(partition.kept.size());
    if (report.removedCount > 0) {
        calendar->events = std::move(partition.kept);
        if (!m_repository.updateCalendar(*calendar)) {
            return unknownCalendar(calendarId);
        }
        qCInfo(lcCalmergeService) << "removed" << report.removedCount << "duplicates from" << calendarId;
    }
    return report;
}

Outcome<std::vector<engine::EventConflict>> CalendarService::findConflicts(const QList<QUuid> &calendarIds) const
{
    if (calendarIds.isEmpty()) {
        return rejected(QStringLiteral("no calendars given for the conflict check"));
    }
    auto calendars = resolveCalendars(calendarIds);
    if (auto error = std::get_if<core::PreconditionError>(&calendars)) {
        return *error;
    }
    std::vector<data::CalendarEvent> events;
    for (const auto &calendar : std::get<std::vector<data::Calendar>>(calendars)) {
        events.insert(events.end(), calendar.events.begin(), calendar.events.end());
    }

    engine::ConflictOptions options;
    options.skipTransparent = m_settings.skipTransparentConflicts;
    options.skipCancelled = m_settings.skipCancelledConflicts;
    return engine::findConflicts(events, options);
}

Outcome<QString> CalendarService::createBundle(const QList<QUuid> &calendarIds, bool removeDuplicates,
                                               const QString &name) const
{
    if (calendarIds.isEmpty()) {
        return rejected(QStringLiteral("a bundle needs at least one calendar"));
    }
    if (calendarIds.size() > m_settings.maxCalendarsPerBundle) {
        return rejected(QStringLiteral("a bundle holds at most %1 calendars, got %2")
                            .arg(m_settings.maxCalendarsPerBundle)
                            .arg(calendarIds.size()));
    }
    auto calendars = resolveCalendars(calendarIds);
    if (auto error = std::get_if<core::PreconditionError>(&calendars)) {
        return *error;
    }

    engine::BundleOptions options;
    options.name = name.trimmed().isEmpty() ? m_settings.defaultBundleName : name.trimmed();
    if (!m_settings.productId.isEmpty()) {
        options.productId = m_settings.productId;
    }
    return engine::serializeBundle(std::get<std::vector<data::Calendar>>(calendars), removeDuplicates, options);
}

Outcome<ImportReport> CalendarService::importIcs(const QUuid &calendarId, const QString &text, bool skipExisting)
{
    if (!m_repository.findById(calendarId)) {
        return unknownCalendar(calendarId);
    }
    return importEvents(calendarId, data::IcsReader().read(text), skipExisting);
}

Outcome<ImportReport> CalendarService::importEvents(const QUuid &calendarId, const data::ImportResult &parsed,
                                                    bool skipExisting)
{
    auto calendar = m_repository.findById(calendarId);
    if (!calendar) {
        return unknownCalendar(calendarId);
    }

    ImportReport report;
    report.skippedEvents = parsed.skippedEvents;
    report.skippedFields = parsed.skippedFields;
    report.warnings = parsed.warnings;

    std::vector<data::CalendarEvent> accepted = parsed.events;
    if (skipExisting) {
        auto partition = engine::resolveAgainst(calendar->events, accepted);
        report.duplicateEvents = static_cast<int>(partition.removed.size());
        accepted = std::move(partition.kept);
    }

    std::vector<data::CalendarEvent> unique;
    for (auto &event : accepted) {
        if (indexOfInstance(calendar->events, event) >= 0 || indexOfInstance(unique, event) >= 0) {
            ++report.uidCollisions;
            report.warnings << QStringLiteral("Event \"%1\" reuses UID %2 and was skipped").arg(event.title, event.uid);
            continue;
        }
        unique.push_back(std::move(event));
    }
    accepted = std::move(unique);
    report.importedEvents = static_cast<int>(accepted.size());

    if (!accepted.empty()) {
        calendar->events.insert(calendar->events.end(), accepted.begin(), accepted.end());
        if (calendar->name.isEmpty()) {
            calendar->name = parsed.calendarName;
        }
        if (calendar->color.isEmpty()) {
            calendar->color = parsed.calendarColor;
        }
        if (calendar->sourceUrl.isEmpty()) {
            calendar->sourceUrl = parsed.calendarSource;
        }
        if (!m_repository.updateCalendar(*calendar)) {
            return unknownCalendar(calendarId);
        }
    }
    qCInfo(lcCalmergeService) << "imported" << report.importedEvents << "events into" << calendarId << "("
                              << report.duplicateEvents << "duplicates," << report.uidCollisions << "UID collisions,"
                              << report.skippedEvents << "skipped)";
    return report;
}

EventOutcome CalendarService::addEvent(const QUuid &calendarId, data::CalendarEvent event)
{
    auto calendar = m_repository.findById(calendarId);
    if (!calendar) {
        return unknownCalendar(calendarId);
    }
    if (event.uid.trimmed().isEmpty()) {
        event.uid = data::generateUid();
    } else if (indexOfInstance(calendar->events, event) >= 0) {
        return rejected(QStringLiteral("event %1 already exists").arg(event.uid));
    }
    auto errors = data::validateEvent(event);
    if (!errors.empty()) {
        qCWarning(lcCalmergeService) << "rejected new event" << event.uid << ":" << errors.front().message;
        return errors;
    }

    calendar->events.push_back(event);
    if (!m_repository.updateCalendar(*calendar)) {
        return unknownCalendar(calendarId);
    }
    return event;
}

EventOutcome CalendarService::updateEvent(const QUuid &calendarId, data::CalendarEvent event)
{
    auto calendar = m_repository.findById(calendarId);
    if (!calendar) {
        return unknownCalendar(calendarId);
    }
    const int index = indexOfInstance(calendar->events, event);
    if (event.uid.isEmpty() || index < 0) {
        return rejected(QStringLiteral("no event %1 in calendar %2").arg(event.uid, calendarId.toString()));
    }
    auto errors = data::validateEvent(event);
    if (!errors.empty()) {
        qCWarning(lcCalmergeService) << "rejected update of" << event.uid << ":" << errors.front().message;
        return errors;
    }

    auto &stored = calendar->events[static_cast<std::size_t>(index)];
    event.sequence = stored.sequence + 1;
    stored = event;
    if (!m_repository.updateCalendar(*calendar)) {
        return unknownCalendar(calendarId);
    }
    return event;
}

} // namespace service
} // namespace calmerge
