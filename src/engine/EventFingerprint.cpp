#include "calmerge/engine/EventFingerprint.hpp"

namespace calmerge {
namespace engine {

EventFingerprint fingerprint(const data::CalendarEvent &event)
{
    return EventFingerprint{event.title.trimmed().toLower(), event.start, event.end};
}

} // namespace engine
} // namespace calmerge
