#pragma once

#include <QtGlobal>

namespace calmerge {
namespace core {

enum class DurationUnit
{
    Seconds,
    Minutes,
    Hours,
    Days,
};

qint64 secondsPerUnit(DurationUnit unit);

// Single-unit magnitude. The unit is kept so "PT60M" formats back as "PT60M";
// equality compares the normalized value and sign only.
struct Duration
{
    qint64 value = 0;
    DurationUnit unit = DurationUnit::Minutes;
    bool negative = false;

    qint64 toSeconds() const;

    bool operator==(const Duration &other) const { return toSeconds() == other.toSeconds(); }
    bool operator!=(const Duration &other) const { return !(*this == other); }
};

} // namespace core
} // namespace calmerge
