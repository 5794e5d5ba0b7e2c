#pragma once

#include <QString>
#include <vector>

#include "calmerge/data/Calendar.hpp"

namespace calmerge {
namespace engine {

struct MergeResult
{
    data::Calendar calendar;
    int mergedEvents = 0;
    int removedDuplicates = 0;
};

MergeResult merge(const std::vector<data::Calendar> &calendars, const QString &newName, bool removeDuplicates);

} // namespace engine
} // namespace calmerge
