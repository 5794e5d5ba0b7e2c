#include "calmerge/core/Duration.hpp"

namespace calmerge {
namespace core {

qint64 secondsPerUnit(DurationUnit unit)
{
    switch (unit) {
    case DurationUnit::Days:
        return 24 * 60 * 60;
    case DurationUnit::Hours:
        return 60 * 60;
    case DurationUnit::Seconds:
        return 1;
    case DurationUnit::Minutes:
    default:
        return 60;
    }
}

qint64 Duration::toSeconds() const
{
    const qint64 seconds = value * secondsPerUnit(unit);
    return negative ? -seconds : seconds;
}

} // namespace core
} // namespace calmerge
