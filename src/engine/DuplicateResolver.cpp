#include "calmerge/engine/DuplicateResolver.hpp"

#include "calmerge/core/Logging.hpp"
#include "calmerge/engine/EventFingerprint.hpp"

#include <QSet>

namespace calmerge {
namespace engine {

namespace {
DuplicatePartition partition(QSet<EventFingerprint> &seen, const std::vector<data::CalendarEvent> &events)
{
    DuplicatePartition result;
    result.kept.reserve(events.size());
    for (const auto &event : events) {
        const EventFingerprint key = fingerprint(event);
        if (seen.contains(key)) {
            result.removed.push_back(event);
            continue;
        }
        seen.insert(key);
        result.kept.push_back(event);
    }
    return result;
}
} // namespace

DuplicatePartition resolve(const std::vector<data::CalendarEvent> &events, const DuplicatePolicy &policy)
{
    QSet<EventFingerprint> seen;
    seen.reserve(static_cast<int>(events.size()));
    DuplicatePartition result = partition(seen, events);
    qCDebug(lcCalmergeEngine) << "resolved" << events.size() << "events:" << result.kept.size() << "unique,"
                              << result.removed.size() << "duplicates"
                              << (policy.removeDuplicates ? "(removing)" : "(preview)");
    return result;
}

DuplicatePartition resolveAgainst(const std::vector<data::CalendarEvent> &existing,
                                  const std::vector<data::CalendarEvent> &incoming)
{
    QSet<EventFingerprint> seen;
    seen.reserve(static_cast<int>(existing.size() + incoming.size()));
    for (const auto &event : existing) {
        seen.insert(fingerprint(event));
    }
    return partition(seen, incoming);
}

} // namespace engine
} // namespace calmerge
