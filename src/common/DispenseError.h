#ifndef DISPENSEERROR_H
#define DISPENSEERROR_H

#include <QString>

class DispenseError
{
public:
    enum class Kind {
        None,
        Connection,     // serial link absent or closed
        Transport,      // command acknowledged with failure
        Timeout,        // bounded wait exceeded
        Hardware,       // device reported an error state
        Configuration,  // calibration, plate or protocol data unusable
        Cancelled       // operator interrupt
    };

    DispenseError() = default;
    DispenseError(Kind kind, const QString &message)
        : kind(kind), message(message) {}

    bool isError() const { return kind != Kind::None; }

    // "context: message", keeps the kind
    DispenseError prefixed(const QString &context) const;

    QString toString() const;
    static QString kindName(Kind kind);

    Kind kind = Kind::None;
    QString message;
};

// Stores the error (if requested) and returns false so callers can write
// `return failWith(err, ...);`
inline bool failWith(DispenseError *err, DispenseError::Kind kind, const QString &message)
{
    if (err) *err = DispenseError(kind, message);
    return false;
}

inline bool failWith(DispenseError *err, const DispenseError &error)
{
    if (err) *err = error;
    return false;
}

#endif // DISPENSEERROR_H
