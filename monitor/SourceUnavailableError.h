#ifndef SOURCEUNAVAILABLEERROR_H
#define SOURCEUNAVAILABLEERROR_H

#include <QString>
#include <stdexcept>

// Thrown by a snapshot source when the platform cannot be enumerated right now.
class SourceUnavailableError : public std::runtime_error
{
public:
    explicit SourceUnavailableError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }
};

#endif // SOURCEUNAVAILABLEERROR_H
