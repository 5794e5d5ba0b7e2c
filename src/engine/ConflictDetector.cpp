#include "calmerge/engine/ConflictDetector.hpp"

#include "calmerge/core/Logging.hpp"

#include <algorithm>
#include <map>

namespace calmerge {
namespace engine {

namespace {
constexpr qint64 SecondsPerDay = 24 * 60 * 60;

Timeline timelineOf(core::InstantKind kind)
{
    switch (kind) {
    case core::InstantKind::Utc:
        return Timeline::Utc;
    case core::InstantKind::DateOnly:
        return Timeline::AllDay;
    case core::InstantKind::Floating:
    default:
        return Timeline::Floating;
    }
}

bool isIgnored(const data::CalendarEvent &event, const ConflictOptions &options)
{
    if (options.skipTransparent && event.transparency == data::Transparency::Transparent) {
        return true;
    }
    if (options.skipCancelled && event.status == data::EventStatus::Cancelled) {
        return true;
    }
    return false;
}

bool spansOverlap(const EventSpan &lhs, const EventSpan &rhs)
{
    return spansComparable(lhs, rhs) && lhs.begin < rhs.end && rhs.begin < lhs.end;
}
} // namespace

EventSpan spanOf(const data::CalendarEvent &event)
{
    EventSpan span;
    span.timeline = timelineOf(event.start.kind());
    if (span.timeline == Timeline::AllDay) {
        span.timeline = timelineOf(event.end.kind());
    }
    span.begin = event.start.secondsSinceEpoch();
    span.end = event.end.secondsSinceEpoch();
    if (event.isAllDay() && event.end.kind() == core::InstantKind::DateOnly && span.end <= span.begin) {
        span.end = span.begin + SecondsPerDay;
    }
    return span;
}

bool spansComparable(const EventSpan &lhs, const EventSpan &rhs)
{
    return lhs.timeline == rhs.timeline || lhs.timeline == Timeline::AllDay || rhs.timeline == Timeline::AllDay;
}

bool eventsOverlap(const data::CalendarEvent &lhs, const data::CalendarEvent &rhs)
{
    return spansOverlap(spanOf(lhs), spanOf(rhs));
}

std::vector<EventConflict> findConflicts(const std::vector<data::CalendarEvent> &events, const ConflictOptions &options)
{
    std::vector<EventSpan> spans;
    spans.reserve(events.size());
    std::vector<std::size_t> order;
    order.reserve(events.size());
    for (std::size_t i = 0; i < events.size(); ++i) {
        spans.push_back(spanOf(events[i]));
        if (!isIgnored(events[i], options)) {
            order.push_back(i);
        }
    }
    std::stable_sort(order.begin(), order.end(), [&spans](std::size_t lhs, std::size_t rhs) {
        return spans[lhs].begin < spans[rhs].begin;
    });

    std::vector<EventConflict> conflicts;
    // Open intervals keyed by end; values are positions in `order`.
    std::multimap<qint64, std::size_t> active;
    std::vector<std::size_t> candidates;
    for (std::size_t position = 0; position < order.size(); ++position) {
        const std::size_t index = order[position];
        const EventSpan &span = spans[index];

        while (!active.empty() && active.begin()->first <= span.begin) {
            active.erase(active.begin());
        }

        candidates.clear();
        for (const auto &entry : active) {
            candidates.push_back(entry.second);
        }
        std::sort(candidates.begin(), candidates.end());
        for (const std::size_t candidate : candidates) {
            const std::size_t other = order[candidate];
            if (spansOverlap(spans[other], span)) {
                conflicts.push_back(EventConflict{other, index, events[other], events[index]});
            }
        }

        active.emplace(span.end, position);
    }

    qCDebug(lcCalmergeEngine) << "found" << conflicts.size() << "conflicts among" << order.size() << "events";
    return conflicts;
}

} // namespace engine
} // namespace calmerge
