#include "DispenseError.h"

DispenseError DispenseError::prefixed(const QString &context) const
{
    if (context.isEmpty()) return *this;
    return DispenseError(kind, QString("%1: %2").arg(context, message));
}

QString DispenseError::toString() const
{
    if (!isError()) return QString();
    return QString("%1: %2").arg(kindName(kind), message);
}

QString DispenseError::kindName(Kind kind)
{
    switch (kind) {
    case Kind::None:          return "OK";
    case Kind::Connection:    return "ConnectionError";
    case Kind::Transport:     return "TransportError";
    case Kind::Timeout:       return "TimeoutError";
    case Kind::Hardware:      return "HardwareError";
    case Kind::Configuration: return "ConfigurationError";
    case Kind::Cancelled:     return "Cancelled";
    }
    return "UnknownError";
}
