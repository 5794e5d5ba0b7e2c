#pragma once

#include <QList>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <variant>
#include <vector>

#include "calmerge/core/Errors.hpp"
#include "calmerge/core/Settings.hpp"
#include "calmerge/data/Calendar.hpp"
#include "calmerge/data/IcsReader.hpp"
#include "calmerge/engine/ConflictDetector.hpp"
#include "calmerge/engine/DuplicateResolver.hpp"
#include "calmerge/engine/MergeEngine.hpp"

namespace calmerge {
namespace data {
class CalendarRepository;
}

namespace service {

template <typename T>
using Outcome = std::variant<T, core::PreconditionError>;

struct CleanReport
{
    int removedCount = 0;
    int remainingEvents = 0;
};

struct ImportReport
{
    int importedEvents = 0;
    int skippedEvents = 0;
    int skippedFields = 0;
    int duplicateEvents = 0;
    // Events whose UID and RECURRENCE-ID are already taken in the calendar.
    int uidCollisions = 0;
    QStringList warnings;
};

using EventOutcome = std::variant<data::CalendarEvent, std::vector<core::ValidationError>, core::PreconditionError>;

class CalendarService
{
public:
    CalendarService(data::CalendarRepository &repository, const core::EngineSettings &settings);

    const core::EngineSettings &settings() const;
    void setSettings(const core::EngineSettings &settings);

    // Stores the merged calendar; needs at least two distinct, known ids.
    Outcome<engine::MergeResult> merge(const QList<QUuid> &calendarIds, const QString &name, bool removeDuplicates);

    Outcome<engine::DuplicatePartition> previewDuplicates(const QUuid &calendarId) const;
    Outcome<CleanReport> cleanDuplicates(const QUuid &calendarId);

    Outcome<std::vector<engine::EventConflict>> findConflicts(const QList<QUuid> &calendarIds) const;

    // An empty name falls back to the configured default bundle name.
    Outcome<QString> createBundle(const QList<QUuid> &calendarIds, bool removeDuplicates,
                                  const QString &name = QString()) const;

    Outcome<ImportReport> importIcs(const QUuid &calendarId, const QString &text, bool skipExisting);
    Outcome<ImportReport> importEvents(const QUuid &calendarId, const data::ImportResult &parsed, bool skipExisting);

    EventOutcome addEvent(const QUuid &calendarId, data::CalendarEvent event);
    // Replaces the event with the same UID and RECURRENCE-ID and bumps its
    // SEQUENCE. A merged calendar may repeat a UID; the first match is replaced.
    EventOutcome updateEvent(const QUuid &calendarId, data::CalendarEvent event);

private:
    Outcome<std::vector<data::Calendar>> resolveCalendars(const QList<QUuid> &calendarIds) const;

    data::CalendarRepository &m_repository;
    core::EngineSettings m_settings;
};

} // namespace service
} // namespace calmerge
