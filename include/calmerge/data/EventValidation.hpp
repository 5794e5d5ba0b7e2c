#pragma once

#include <vector>

#include "calmerge/core/Errors.hpp"
#include "calmerge/data/Event.hpp"

namespace calmerge {
namespace data {

namespace FieldLimits {
constexpr int Title = 255;
constexpr int Location = 500;
constexpr int Description = 10000;
constexpr int RecurrenceRule = 500;
constexpr int Uid = 255;
} // namespace FieldLimits

bool isValidUrl(const QString &url);
// "#RGB", "#RRGGBB" or a CSS color name.
bool isValidColor(const QString &color);

std::vector<core::ValidationError> validateEvent(const CalendarEvent &event);

inline bool isValidEvent(const CalendarEvent &event)
{
    return validateEvent(event).empty();
}

} // namespace data
} // namespace calmerge
