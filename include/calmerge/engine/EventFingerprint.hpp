#pragma once

#include <QHash>
#include <QString>

#include "calmerge/core/Instant.hpp"
#include "calmerge/data/Event.hpp"

namespace calmerge {
namespace engine {

struct EventFingerprint
{
    QString title;
    core::Instant start;
    core::Instant end;

    bool operator==(const EventFingerprint &other) const
    {
        return title == other.title && start == other.start && end == other.end;
    }
    bool operator!=(const EventFingerprint &other) const { return !(*this == other); }
};

EventFingerprint fingerprint(const data::CalendarEvent &event);

inline uint qHash(const EventFingerprint &key, uint seed = 0) noexcept
{
    uint hash = ::qHash(key.title, seed);
    hash ^= core::qHash(key.start, seed) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
    hash ^= core::qHash(key.end, seed) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
    return hash;
}

} // namespace engine
} // namespace calmerge
