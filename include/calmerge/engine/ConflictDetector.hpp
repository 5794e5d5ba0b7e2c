#pragma once

#include <QtGlobal>
#include <cstddef>
#include <vector>

#include "calmerge/data/Event.hpp"

namespace calmerge {
namespace engine {

enum class Timeline
{
    Utc,
    Floating,
    AllDay, // both ends DateOnly; comparable with either of the others
};

// Half-open interval [begin, end) in seconds on the event's timeline.
struct EventSpan
{
    Timeline timeline = Timeline::Floating;
    qint64 begin = 0;
    qint64 end = 0;
};

// All-day events cover [midnight, next midnight) or up to a later DTEND.
EventSpan spanOf(const data::CalendarEvent &event);

bool spansComparable(const EventSpan &lhs, const EventSpan &rhs);

// Strict overlap: events that only touch at a boundary do not conflict.
bool eventsOverlap(const data::CalendarEvent &lhs, const data::CalendarEvent &rhs);

struct ConflictOptions
{
    bool skipTransparent = false;
    bool skipCancelled = false;
};

struct EventConflict
{
    // Positions in the input; first starts no later than second.
    std::size_t firstIndex = 0;
    std::size_t secondIndex = 0;
    data::CalendarEvent first;
    data::CalendarEvent second;
};

std::vector<EventConflict> findConflicts(const std::vector<data::CalendarEvent> &events,
                                         const ConflictOptions &options = ConflictOptions());

} // namespace engine
} // namespace calmerge
