#include "calmerge/engine/MergeEngine.hpp"

#include "calmerge/core/Logging.hpp"
#include "calmerge/engine/DuplicateResolver.hpp"

#include <QUuid>

namespace calmerge {
namespace engine {

MergeResult merge(const std::vector<data::Calendar> &calendars, const QString &newName, bool removeDuplicates)
{
    std::size_t total = 0;
    for (const auto &calendar : calendars) {
        total += calendar.events.size();
    }
    std::vector<data::CalendarEvent> combined;
    combined.reserve(total);
    for (const auto &calendar : calendars) {
        combined.insert(combined.end(), calendar.events.begin(), calendar.events.end());
    }

    DuplicatePartition partition = resolve(combined, DuplicatePolicy{removeDuplicates});

    MergeResult result;
    result.calendar.id = QUuid::createUuid();
    result.calendar.name = newName;
    if (removeDuplicates) {
        result.removedDuplicates = static_cast<int>(partition.removed.size());
        result.calendar.events = std::move(partition.kept);
    } else {
        result.calendar.events = std::move(combined);
    }
    result.mergedEvents = static_cast<int>(result.calendar.events.size());

    qCInfo(lcCalmergeEngine) << "merged" << calendars.size() << "calendars into" << newName << ':'
                             << result.mergedEvents << "events," << result.removedDuplicates << "duplicates removed";
    return result;
}

} // namespace engine
} // namespace calmerge
