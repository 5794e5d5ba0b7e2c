#pragma once

#include <vector>

#include "calmerge/data/Event.hpp"

namespace calmerge {
namespace engine {

struct DuplicatePolicy
{
    bool removeDuplicates = true;
};

struct DuplicatePartition
{
    std::vector<data::CalendarEvent> kept;
    std::vector<data::CalendarEvent> removed;
};

// First occurrence wins. Both lists keep input order.
DuplicatePartition resolve(const std::vector<data::CalendarEvent> &events,
                           const DuplicatePolicy &policy = DuplicatePolicy());

DuplicatePartition resolveAgainst(const std::vector<data::CalendarEvent> &existing,
                                  const std::vector<data::CalendarEvent> &incoming);

} // namespace engine
} // namespace calmerge
