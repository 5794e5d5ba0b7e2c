#pragma once

#include <QString>

namespace calmerge {
namespace core {

// Malformed date, date-time or duration text. Scoped to one field; the
// caller skips the field or the event and keeps going.
struct ParseError
{
    QString field;
    QString text;
    QString reason;

    QString toString() const;
};

// An event that cannot be accepted as it stands (empty title, end before
// start, ...). Rejects that event only.
struct ValidationError
{
    QString field;
    QString message;
};

// Caller-level misuse, detected before any work is done.
struct PreconditionError
{
    QString message;
};

} // namespace core
} // namespace calmerge
